#pragma once

/**
 * @file function_target.hpp
 * @brief Function target: a FunctionEnv bound to one analysis snapshot
 *
 * A FunctionTarget is the query surface used by analysis passes and by the
 * debug renderer. It pairs the static declaration of a function with one
 * snapshot of its rewritable data. A target is created for a single pass or
 * rendering and then dropped; it cannot be rebound to another snapshot.
 */

#include "stackless/annotations.hpp"
#include "stackless/bytecode.hpp"
#include "stackless/common.hpp"
#include "stackless/env.hpp"
#include "stackless/function_target_data.hpp"
#include "stackless/spec.hpp"
#include "stackless/type.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stackless {

class FunctionTarget;

/**
 * Formatter for one kind of annotation. Called with the target and a code
 * offset; returns the text to show above the instruction at that offset, or
 * std::nullopt if the annotation has nothing for it. Errors are propagated by
 * the renderer.
 */
using AnnotationFormatter =
    std::function<Result<std::optional<std::string>>(const FunctionTarget&, CodeOffset)>;

class FunctionTarget
{
public:
    /// `data` must be a non-null snapshot of `func_env`; use `bind` to have that checked.
    FunctionTarget(const FunctionEnv& func_env, std::shared_ptr<const FunctionTargetData> data);

    [[nodiscard]] static Result<FunctionTarget>
    bind(const FunctionEnv& func_env, std::shared_ptr<const FunctionTargetData> data);

    FunctionTarget(const FunctionTarget&) = delete;
    FunctionTarget& operator=(const FunctionTarget&) = delete;
    FunctionTarget(FunctionTarget&&) = default;
    FunctionTarget& operator=(FunctionTarget&&) = delete;

    [[nodiscard]] const FunctionEnv& func_env() const noexcept { return m_func_env; }
    [[nodiscard]] const FunctionTargetData& data() const noexcept { return *m_data; }
    [[nodiscard]] const std::shared_ptr<const FunctionTargetData>& data_ptr() const noexcept
    {
        return m_data;
    }

    // Identity -------------------------------------------------------------

    [[nodiscard]] Symbol name() const noexcept { return m_func_env.name(); }
    [[nodiscard]] FunId id() const noexcept { return m_func_env.id(); }
    [[nodiscard]] const ModuleEnv& module_env() const noexcept { return m_func_env.module_env(); }
    [[nodiscard]] const GlobalEnv& global_env() const noexcept;
    [[nodiscard]] const SymbolPool& symbol_pool() const noexcept;
    [[nodiscard]] const Loc& loc() const noexcept { return m_func_env.loc(); }

    /// Location of the instruction tagged `attr`; the function's location if unmapped.
    [[nodiscard]] const Loc& bytecode_loc(AttrId attr) const;

    // Classification -------------------------------------------------------

    [[nodiscard]] bool is_native() const noexcept { return m_func_env.is_native(); }
    [[nodiscard]] bool is_public() const noexcept { return m_func_env.is_public(); }
    [[nodiscard]] bool is_mutating() const noexcept { return m_func_env.is_mutating(); }

    // Shape ----------------------------------------------------------------

    [[nodiscard]] const std::vector<TypeParameter>& type_parameters() const noexcept
    {
        return m_func_env.type_parameters();
    }
    [[nodiscard]] std::size_t parameter_count() const noexcept
    {
        return m_func_env.parameter_count();
    }
    /// Number of locals, including parameters and temps added by passes.
    [[nodiscard]] std::size_t local_count() const noexcept { return m_data->local_types().size(); }
    /// Number of locals declared in the source, excluding temps added by passes.
    [[nodiscard]] std::size_t user_local_count() const noexcept
    {
        return m_func_env.local_count();
    }

    [[nodiscard]] Result<std::reference_wrapper<const Type>> local_type(TempIndex idx) const;
    [[nodiscard]] Result<std::string> local_name(TempIndex idx) const;
    [[nodiscard]] std::optional<TempIndex> local_index(std::string_view name) const;
    [[nodiscard]] std::optional<TempIndex> local_index(Symbol name) const;

    // Returns --------------------------------------------------------------

    [[nodiscard]] Result<std::reference_wrapper<const Type>> return_type(std::size_t idx) const;
    [[nodiscard]] const std::vector<Type>& return_types() const noexcept
    {
        return m_data->return_types();
    }
    [[nodiscard]] std::size_t return_count() const noexcept { return m_data->return_types().size(); }

    // Specification --------------------------------------------------------

    [[nodiscard]] const Spec& spec() const noexcept { return m_func_env.spec(); }

    /**
     * Conditions of spec block `id`. Source-anchored blocks are looked up
     * first, generated ones second; an id found in neither map is a broken
     * pass and yields `BlockNotFound`.
     */
    [[nodiscard]] Result<std::reference_wrapper<const SpecBlock>> spec_at(SpecBlockId id) const;

    // Configuration --------------------------------------------------------

    template <std::invocable F>
    [[nodiscard]] bool is_pragma_true(std::string_view name, F&& default_fn) const
    {
        return m_func_env.is_pragma_true(name, std::forward<F>(default_fn));
    }

    // Payload --------------------------------------------------------------

    [[nodiscard]] const std::vector<Bytecode>& bytecode() const noexcept { return m_data->code(); }
    [[nodiscard]] const Annotations& annotations() const noexcept
    {
        return m_data->annotations();
    }
    [[nodiscard]] const std::vector<QualifiedId<StructId>>&
    acquires_global_resources() const noexcept
    {
        return m_data->acquires_global_resources();
    }

    /// Return slot through which `&mut` parameter `param_idx` is handed back.
    [[nodiscard]] std::optional<std::size_t> return_index(TempIndex param_idx) const;

    /**
     * True if a call to this function ends the lifetime of borrows passed to
     * it: the function is public and returns no reference through which a
     * borrow could escape.
     */
    [[nodiscard]] bool call_ends_lifetime() const;

    /// Context for displaying types of this function with named type parameters.
    [[nodiscard]] TypeDisplayContext type_display_context() const noexcept;

    // Formatting -----------------------------------------------------------

    /**
     * Registers a formatter. Every pass introducing an annotation kind should
     * register one so its results show up in debug output. Registration order
     * is output order.
     */
    void register_annotation_formatter(AnnotationFormatter formatter);

    [[nodiscard]] std::span<const AnnotationFormatter> annotation_formatters() const noexcept
    {
        return m_annotation_formatters;
    }

private:
    const FunctionEnv& m_func_env;
    std::shared_ptr<const FunctionTargetData> m_data;
    std::map<std::string, TempIndex, std::less<>> m_name_to_index;
    std::vector<Symbol> m_type_param_names;
    std::vector<AnnotationFormatter> m_annotation_formatters;
};

}  // namespace stackless
