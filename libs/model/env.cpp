/**
 * @file env.cpp
 * @brief Source environment construction and queries
 */

#include "stackless/env.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <ranges>
#include <set>

namespace stackless {

namespace {

constexpr std::string_view kGeneratedLocalPrefix = "$t";

[[nodiscard]] bool is_generated_local_name(std::string_view name)
{
    if (!name.starts_with(kGeneratedLocalPrefix) || name.size() == kGeneratedLocalPrefix.size()) {
        return false;
    }
    return std::ranges::all_of(name.substr(kGeneratedLocalPrefix.size()),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
}

[[nodiscard]] VoidResult check_local_names(const FunctionDecl& decl,
                                           const SymbolPool& pool,
                                           std::string_view module_name)
{
    std::set<Symbol> seen;
    auto check = [&](const LocalDecl& local) -> VoidResult {
        const std::string_view text = pool.string(local.name);
        if (!seen.insert(local.name).second) {
            return std::unexpected(Error::make(
                "LocalNameCollision",
                std::format("Local `{}` declared twice in {}::{}",
                            text,
                            module_name,
                            pool.string(decl.name))));
        }
        if (is_generated_local_name(text)) {
            return std::unexpected(Error::make(
                "LocalNameCollision",
                std::format("Local `{}` in {}::{} uses the name space of generated temporaries",
                            text,
                            module_name,
                            pool.string(decl.name))));
        }
        return {};
    };
    for (const auto& param : decl.params) {
        if (auto result = check(param); !result) {
            return result;
        }
    }
    for (const auto& local : decl.locals) {
        if (auto result = check(local); !result) {
            return result;
        }
    }
    return {};
}

}  // namespace

// ============================================================================
// FunctionEnv
// ============================================================================

FunctionEnv::FunctionEnv(const ModuleEnv& module_env, FunId id, FunctionDecl decl)
    : m_module_env(module_env)
    , m_id(id)
    , m_decl(std::move(decl))
{}

QualifiedId<FunId> FunctionEnv::qualified_id() const noexcept
{
    return QualifiedId<FunId>{.module_id = m_module_env.id(), .id = m_id};
}

bool FunctionEnv::is_mutating() const noexcept
{
    return std::ranges::any_of(m_decl.params,
                               [](const LocalDecl& param) { return param.type.is_mutable_reference(); });
}

std::string FunctionEnv::local_name(TempIndex idx) const
{
    const auto& pool = m_module_env.symbol_pool();
    if (idx < m_decl.params.size()) {
        return std::string(pool.string(m_decl.params[idx].name));
    }
    if (idx < local_count()) {
        return std::string(pool.string(m_decl.locals[idx - m_decl.params.size()].name));
    }
    return std::format("{}{}", kGeneratedLocalPrefix, idx);
}

std::vector<Type> FunctionEnv::declared_local_types() const
{
    std::vector<Type> types;
    types.reserve(local_count());
    for (const auto& param : m_decl.params) {
        types.push_back(param.type);
    }
    for (const auto& local : m_decl.locals) {
        types.push_back(local.type);
    }
    return types;
}

std::optional<bool> FunctionEnv::pragma(std::string_view name) const
{
    if (auto it = m_decl.pragmas.find(name); it != m_decl.pragmas.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FunctionEnv::resolve_pragma(std::string_view name) const
{
    if (auto value = pragma(name)) {
        return value;
    }
    return m_module_env.pragma(name);
}

// ============================================================================
// ModuleEnv
// ============================================================================

ModuleEnv::ModuleEnv(const GlobalEnv& env, ModuleId id, Symbol name, PragmaMap pragmas)
    : m_env(env)
    , m_id(id)
    , m_name(name)
    , m_pragmas(std::move(pragmas))
{}

const SymbolPool& ModuleEnv::symbol_pool() const noexcept
{
    return m_env.symbol_pool();
}

StructId ModuleEnv::add_struct(Symbol name)
{
    if (auto existing = find_struct(name)) {
        return *existing;
    }
    m_structs.push_back(name);
    return StructId{m_structs.size() - 1};
}

std::optional<StructId> ModuleEnv::find_struct(Symbol name) const
{
    auto it = std::ranges::find(m_structs, name);
    if (it == m_structs.end()) {
        return std::nullopt;
    }
    return StructId{static_cast<std::size_t>(std::distance(m_structs.begin(), it))};
}

std::optional<Symbol> ModuleEnv::struct_name(StructId id) const
{
    if (id.value >= m_structs.size()) {
        return std::nullopt;
    }
    return m_structs[id.value];
}

Result<FunId> ModuleEnv::add_function(FunctionDecl decl)
{
    if (auto result = check_local_names(decl, symbol_pool(), symbol_pool().string(m_name));
        !result) {
        return std::unexpected(result.error());
    }
    const FunId id{m_functions.size()};
    m_functions.push_back(std::make_unique<FunctionEnv>(*this, id, std::move(decl)));
    return id;
}

const FunctionEnv* ModuleEnv::function_env(FunId id) const
{
    if (id.value >= m_functions.size()) {
        return nullptr;
    }
    return m_functions[id.value].get();
}

const FunctionEnv* ModuleEnv::find_function(std::string_view name) const
{
    auto it = std::ranges::find_if(m_functions, [&](const auto& fun) {
        return symbol_pool().string(fun->name()) == name;
    });
    return it == m_functions.end() ? nullptr : it->get();
}

std::optional<bool> ModuleEnv::pragma(std::string_view name) const
{
    if (auto it = m_pragmas.find(name); it != m_pragmas.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// GlobalEnv
// ============================================================================

ModuleEnv& GlobalEnv::add_module(Symbol name, PragmaMap pragmas)
{
    const ModuleId id{m_modules.size()};
    m_modules.push_back(std::make_unique<ModuleEnv>(*this, id, name, std::move(pragmas)));
    return *m_modules.back();
}

const ModuleEnv* GlobalEnv::module_env(ModuleId id) const
{
    if (id.value >= m_modules.size()) {
        return nullptr;
    }
    return m_modules[id.value].get();
}

ModuleEnv* GlobalEnv::module_env(ModuleId id)
{
    if (id.value >= m_modules.size()) {
        return nullptr;
    }
    return m_modules[id.value].get();
}

const ModuleEnv* GlobalEnv::find_module(std::string_view name) const
{
    auto it = std::ranges::find_if(m_modules, [&](const auto& mod) {
        return m_symbol_pool.string(mod->name()) == name;
    });
    return it == m_modules.end() ? nullptr : it->get();
}

const FunctionEnv* GlobalEnv::function_env(QualifiedId<FunId> id) const
{
    const auto* mod = module_env(id.module_id);
    return mod == nullptr ? nullptr : mod->function_env(id.id);
}

std::vector<const FunctionEnv*> GlobalEnv::functions() const
{
    std::vector<const FunctionEnv*> result;
    for (const auto& mod : m_modules) {
        for (std::size_t i = 0; i < mod->function_count(); ++i) {
            result.push_back(mod->function_env(FunId{i}));
        }
    }
    return result;
}

std::string GlobalEnv::struct_display_name(QualifiedId<StructId> id) const
{
    const auto* mod = module_env(id.module_id);
    if (mod == nullptr) {
        return std::format("?{}::?{}", id.module_id.value, id.id.value);
    }
    const auto name = mod->struct_name(id.id);
    if (!name) {
        return std::format("{}::?{}", m_symbol_pool.string(mod->name()), id.id.value);
    }
    return std::format("{}::{}",
                       m_symbol_pool.string(mod->name()),
                       m_symbol_pool.string(*name));
}

}  // namespace stackless
