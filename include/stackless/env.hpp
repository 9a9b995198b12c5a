#pragma once

/**
 * @file env.hpp
 * @brief Source environment: global, module and function declarations
 *
 * The environment is the boundary to the front end. It is built once, before
 * any analysis runs, and is read-only afterwards. A FunctionEnv is the static
 * half of a function target: it is shared by every snapshot of its function
 * and owned by the GlobalEnv, which must outlive all snapshots and views.
 */

#include "stackless/common.hpp"
#include "stackless/spec.hpp"
#include "stackless/symbol.hpp"
#include "stackless/type.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stackless {

class GlobalEnv;
class ModuleEnv;

/// Boolean pragmas keyed by name.
using PragmaMap = std::map<std::string, bool, std::less<>>;

struct TypeParameter
{
    Symbol name;
};

struct LocalDecl
{
    Symbol name;
    Type type;
};

/**
 * @brief Declaration of a function as produced by the front end.
 */
struct FunctionDecl
{
    Symbol name;
    Loc loc;
    bool is_native = false;
    bool is_public = false;
    std::vector<TypeParameter> type_params;
    std::vector<LocalDecl> params;
    /// Declared locals, parameters excluded.
    std::vector<LocalDecl> locals;
    std::vector<Type> return_types;
    std::vector<QualifiedId<StructId>> acquires;
    Spec spec;
    PragmaMap pragmas;
};

/**
 * @brief Read-only view of a declared function.
 */
class FunctionEnv
{
public:
    FunctionEnv(const ModuleEnv& module_env, FunId id, FunctionDecl decl);

    FunctionEnv(const FunctionEnv&) = delete;
    FunctionEnv& operator=(const FunctionEnv&) = delete;

    [[nodiscard]] const ModuleEnv& module_env() const noexcept { return m_module_env; }
    [[nodiscard]] FunId id() const noexcept { return m_id; }
    [[nodiscard]] QualifiedId<FunId> qualified_id() const noexcept;
    [[nodiscard]] Symbol name() const noexcept { return m_decl.name; }
    [[nodiscard]] const Loc& loc() const noexcept { return m_decl.loc; }

    [[nodiscard]] bool is_native() const noexcept { return m_decl.is_native; }
    [[nodiscard]] bool is_public() const noexcept { return m_decl.is_public; }
    /// True if any parameter is a mutable reference.
    [[nodiscard]] bool is_mutating() const noexcept;

    [[nodiscard]] const std::vector<TypeParameter>& type_parameters() const noexcept
    {
        return m_decl.type_params;
    }

    [[nodiscard]] std::size_t parameter_count() const noexcept { return m_decl.params.size(); }

    /// Number of declared locals, parameters included.
    [[nodiscard]] std::size_t local_count() const noexcept
    {
        return m_decl.params.size() + m_decl.locals.size();
    }

    /**
     * Name of the local at `idx`. Declared locals use their source name;
     * anything beyond gets the generated name `$t<idx>`.
     */
    [[nodiscard]] std::string local_name(TempIndex idx) const;

    /// Types of all declared locals in slot order, parameters first.
    [[nodiscard]] std::vector<Type> declared_local_types() const;

    [[nodiscard]] const std::vector<Type>& return_types() const noexcept
    {
        return m_decl.return_types;
    }

    [[nodiscard]] const std::vector<QualifiedId<StructId>>& acquires() const noexcept
    {
        return m_decl.acquires;
    }

    [[nodiscard]] const Spec& spec() const noexcept { return m_decl.spec; }

    /// Pragma declared on the function itself.
    [[nodiscard]] std::optional<bool> pragma(std::string_view name) const;

    /**
     * Value of a boolean pragma: the function's own pragma, then the module's,
     * then `default_fn()`.
     */
    template <std::invocable F>
    [[nodiscard]] bool is_pragma_true(std::string_view name, F&& default_fn) const
    {
        if (auto value = resolve_pragma(name)) {
            return *value;
        }
        return std::invoke(std::forward<F>(default_fn));
    }

private:
    [[nodiscard]] std::optional<bool> resolve_pragma(std::string_view name) const;

    const ModuleEnv& m_module_env;
    FunId m_id;
    FunctionDecl m_decl;
};

/**
 * @brief A module: named container of structs and functions.
 */
class ModuleEnv
{
public:
    ModuleEnv(const GlobalEnv& env, ModuleId id, Symbol name, PragmaMap pragmas);

    ModuleEnv(const ModuleEnv&) = delete;
    ModuleEnv& operator=(const ModuleEnv&) = delete;

    [[nodiscard]] const GlobalEnv& env() const noexcept { return m_env; }
    [[nodiscard]] ModuleId id() const noexcept { return m_id; }
    [[nodiscard]] Symbol name() const noexcept { return m_name; }
    [[nodiscard]] const SymbolPool& symbol_pool() const noexcept;

    [[nodiscard]] StructId add_struct(Symbol name);
    [[nodiscard]] std::optional<StructId> find_struct(Symbol name) const;
    [[nodiscard]] std::optional<Symbol> struct_name(StructId id) const;

    /**
     * Adds a function declaration.
     *
     * Local names must be unique within the function and must not take the
     * `$t<digits>` form reserved for generated temporaries; a violation yields
     * `LocalNameCollision`.
     */
    [[nodiscard]] Result<FunId> add_function(FunctionDecl decl);

    [[nodiscard]] std::size_t function_count() const noexcept { return m_functions.size(); }
    [[nodiscard]] const FunctionEnv* function_env(FunId id) const;
    [[nodiscard]] const FunctionEnv* find_function(std::string_view name) const;

    [[nodiscard]] std::optional<bool> pragma(std::string_view name) const;

private:
    const GlobalEnv& m_env;
    ModuleId m_id;
    Symbol m_name;
    PragmaMap m_pragmas;
    std::vector<Symbol> m_structs;
    std::vector<std::unique_ptr<FunctionEnv>> m_functions;
};

/**
 * @brief Root of the environment: owns the symbol pool and all modules.
 */
class GlobalEnv
{
public:
    GlobalEnv() = default;

    GlobalEnv(const GlobalEnv&) = delete;
    GlobalEnv& operator=(const GlobalEnv&) = delete;

    [[nodiscard]] SymbolPool& symbol_pool() noexcept { return m_symbol_pool; }
    [[nodiscard]] const SymbolPool& symbol_pool() const noexcept { return m_symbol_pool; }

    ModuleEnv& add_module(Symbol name, PragmaMap pragmas = {});

    [[nodiscard]] std::size_t module_count() const noexcept { return m_modules.size(); }
    [[nodiscard]] const ModuleEnv* module_env(ModuleId id) const;
    [[nodiscard]] ModuleEnv* module_env(ModuleId id);
    [[nodiscard]] const ModuleEnv* find_module(std::string_view name) const;

    [[nodiscard]] const FunctionEnv* function_env(QualifiedId<FunId> id) const;

    /// Functions of all modules, in module then declaration order.
    [[nodiscard]] std::vector<const FunctionEnv*> functions() const;

    /// `M::S`; unknown ids print as `?<index>`.
    [[nodiscard]] std::string struct_display_name(QualifiedId<StructId> id) const;

private:
    SymbolPool m_symbol_pool;
    std::vector<std::unique_ptr<ModuleEnv>> m_modules;
};

}  // namespace stackless
