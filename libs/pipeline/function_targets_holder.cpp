/**
 * @file function_targets_holder.cpp
 * @brief Snapshot lineage and pass execution
 */

#include "stackless/function_targets_holder.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace stackless {

namespace {

[[nodiscard]] std::string describe(const FunctionEnv& func_env)
{
    const auto& pool = func_env.module_env().symbol_pool();
    return std::format("{}::{}",
                       pool.string(func_env.module_env().name()),
                       pool.string(func_env.name()));
}

[[nodiscard]] std::unexpected<Error> lineage_violation(std::string_view pass,
                                                       const FunctionEnv& func_env,
                                                       std::string_view what)
{
    return std::unexpected(Error::make(
        "LineageViolation",
        std::format("Pass '{}' on {}: {}", pass, describe(func_env), what)));
}

/// Checks that `next` is a legal successor of `prev`.
[[nodiscard]] VoidResult check_successor(std::string_view pass,
                                         const FunctionEnv& func_env,
                                         const FunctionTargetData& prev,
                                         const FunctionTargetData& next)
{
    if (next.function_id() != prev.function_id()) {
        return lineage_violation(pass, func_env, "snapshot belongs to another function");
    }
    if (next.generation() <= prev.generation()) {
        return lineage_violation(pass, func_env, "snapshot is not derived from the latest one");
    }
    if (next.parameter_count() != prev.parameter_count()) {
        return lineage_violation(pass, func_env, "parameter count changed");
    }
    if (next.local_types().size() < prev.local_types().size()
        || !std::ranges::equal(prev.local_types(),
                               next.local_types() | std::views::take(prev.local_types().size())))
    {
        return lineage_violation(pass, func_env, "existing locals were removed or retyped");
    }
    for (const auto& [param, ret] : prev.ref_param_map()) {
        auto it = next.ref_param_map().find(param);
        if (it == next.ref_param_map().end() || it->second != ret) {
            return lineage_violation(
                pass, func_env, std::format("ref-param entry for local {} was dropped or remapped", param));
        }
    }
    if (next.given_spec_blocks() != prev.given_spec_blocks()) {
        return lineage_violation(pass, func_env, "given spec blocks changed");
    }
    for (const auto& [id, block] : prev.generated_spec_blocks()) {
        auto it = next.generated_spec_blocks().find(id);
        if (it == next.generated_spec_blocks().end() || it->second != block) {
            return lineage_violation(
                pass, func_env, std::format("generated spec block {} was dropped or changed", id.value));
        }
    }
    return {};
}

}  // namespace

VoidResult FunctionTargetsHolder::add_target(const FunctionEnv& func_env,
                                             std::vector<Bytecode> code,
                                             std::map<AttrId, Loc> locations,
                                             std::map<SpecBlockId, CodeOffset> given_spec_blocks)
{
    const auto fun = func_env.qualified_id();
    if (m_entries.contains(fun)) {
        return std::unexpected(Error::make(
            "DuplicateTarget", std::format("Function {} already has a target", describe(func_env))));
    }
    auto initial = FunctionTargetData::create(
        func_env, std::move(code), std::move(locations), std::move(given_spec_blocks));
    if (!initial) {
        return std::unexpected(initial.error());
    }
    Entry entry{.func_env = &func_env, .lineage = {std::move(*initial)}};
    m_entries.emplace(fun, std::move(entry));
    return {};
}

bool FunctionTargetsHolder::contains(QualifiedId<FunId> fun) const
{
    return m_entries.contains(fun);
}

bool FunctionTargetsHolder::remove(QualifiedId<FunId> fun)
{
    return m_entries.erase(fun) > 0;
}

std::vector<QualifiedId<FunId>> FunctionTargetsHolder::functions() const
{
    std::vector<QualifiedId<FunId>> ids;
    ids.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) {
        ids.push_back(id);
    }
    return ids;
}

Result<const FunctionTargetsHolder::Entry*> FunctionTargetsHolder::find(QualifiedId<FunId> fun) const
{
    auto it = m_entries.find(fun);
    if (it == m_entries.end()) {
        return std::unexpected(Error::make(
            "TargetNotFound",
            std::format("No target for function {}.{}", fun.module_id.value, fun.id.value)));
    }
    return &it->second;
}

Result<std::shared_ptr<const FunctionTargetData>>
FunctionTargetsHolder::data(QualifiedId<FunId> fun) const
{
    auto entry = find(fun);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return (*entry)->lineage.back();
}

Result<std::span<const std::shared_ptr<const FunctionTargetData>>>
FunctionTargetsHolder::history(QualifiedId<FunId> fun) const
{
    auto entry = find(fun);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return std::span<const std::shared_ptr<const FunctionTargetData>>{(*entry)->lineage};
}

Result<FunctionTarget> FunctionTargetsHolder::target(QualifiedId<FunId> fun) const
{
    auto entry = find(fun);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return FunctionTarget::bind(*(*entry)->func_env, (*entry)->lineage.back());
}

VoidResult FunctionTargetsHolder::rewrite(QualifiedId<FunId> fun, FunctionTargetProcessor& processor)
{
    auto it = m_entries.find(fun);
    if (it == m_entries.end()) {
        return std::unexpected(Error::make(
            "TargetNotFound",
            std::format("No target for function {}.{}", fun.module_id.value, fun.id.value)));
    }
    Entry& entry = it->second;
    const auto& prev = entry.lineage.back();

    FunctionTarget view(*entry.func_env, prev);
    auto next = processor.process(view);
    if (!next) {
        return std::unexpected(next.error());
    }
    if (!*next) {
        return lineage_violation(processor.name(), *entry.func_env, "pass returned no snapshot");
    }
    if (auto checked = check_successor(processor.name(), *entry.func_env, *prev, **next);
        !checked)
    {
        return checked;
    }
    entry.lineage.push_back(std::move(*next));
    return {};
}

VoidResult run_pipeline(FunctionTargetsHolder& holder,
                        QualifiedId<FunId> fun,
                        std::span<FunctionTargetProcessor* const> processors)
{
    for (auto* processor : processors) {
        if (auto result = holder.rewrite(fun, *processor); !result) {
            return result;
        }
    }
    return {};
}

Result<FunctionTarget> target_with_formatters(const FunctionTargetsHolder& holder,
                                              QualifiedId<FunId> fun,
                                              std::span<FunctionTargetProcessor* const> processors)
{
    auto target = holder.target(fun);
    if (!target) {
        return std::unexpected(target.error());
    }
    for (const auto* processor : processors) {
        processor->register_formatters(*target);
    }
    return target;
}

}  // namespace stackless
