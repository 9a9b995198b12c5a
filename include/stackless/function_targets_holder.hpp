#pragma once

/**
 * @file function_targets_holder.hpp
 * @brief Snapshot lineage per function and the pass interface
 *
 * The holder owns the chain of snapshots of every function it knows about.
 * A pass never mutates a snapshot: it reads the latest one through a
 * FunctionTarget and returns a successor, which the holder checks against its
 * predecessor before appending it. Older snapshots stay alive for diagnostics
 * and for targets still bound to them.
 */

#include "stackless/bytecode.hpp"
#include "stackless/common.hpp"
#include "stackless/env.hpp"
#include "stackless/function_target.hpp"
#include "stackless/function_target_data.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace stackless {

/**
 * @brief A transformation or analysis pass over a single function.
 */
class FunctionTargetProcessor
{
public:
    virtual ~FunctionTargetProcessor() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * Derives the next snapshot from the one bound to `target`, normally via
     * `target.data().rewrite()`.
     */
    [[nodiscard]] virtual Result<std::shared_ptr<const FunctionTargetData>>
    process(const FunctionTarget& target) = 0;

    /// Registers formatters for the annotation kinds this pass produces.
    virtual void register_formatters(FunctionTarget& /*target*/) const {}
};

class FunctionTargetsHolder
{
public:
    FunctionTargetsHolder() = default;

    FunctionTargetsHolder(const FunctionTargetsHolder&) = delete;
    FunctionTargetsHolder& operator=(const FunctionTargetsHolder&) = delete;

    /**
     * Creates and stores the initial snapshot of `func_env`.
     * Fails with `DuplicateTarget` if the function already has a lineage.
     */
    [[nodiscard]] VoidResult add_target(const FunctionEnv& func_env,
                                        std::vector<Bytecode> code,
                                        std::map<AttrId, Loc> locations = {},
                                        std::map<SpecBlockId, CodeOffset> given_spec_blocks = {});

    [[nodiscard]] bool contains(QualifiedId<FunId> fun) const;

    /// Drops the whole lineage of `fun`. Returns false if it had none.
    bool remove(QualifiedId<FunId> fun);

    /// Functions with a lineage, in id order.
    [[nodiscard]] std::vector<QualifiedId<FunId>> functions() const;

    /// Latest snapshot of `fun`; `TargetNotFound` if it has none.
    [[nodiscard]] Result<std::shared_ptr<const FunctionTargetData>>
    data(QualifiedId<FunId> fun) const;

    /// All snapshots of `fun`, oldest first.
    [[nodiscard]] Result<std::span<const std::shared_ptr<const FunctionTargetData>>>
    history(QualifiedId<FunId> fun) const;

    /// A fresh view of the latest snapshot of `fun`, with no formatters.
    [[nodiscard]] Result<FunctionTarget> target(QualifiedId<FunId> fun) const;

    /**
     * Runs `processor` on the latest snapshot of `fun` and appends the result.
     *
     * The successor must belong to the same function and must not shrink the
     * locals, drop or remap a ref-param entry, change the given spec blocks or
     * drop a generated one; otherwise `LineageViolation` is returned and the
     * lineage is left unchanged.
     */
    [[nodiscard]] VoidResult rewrite(QualifiedId<FunId> fun, FunctionTargetProcessor& processor);

private:
    struct Entry
    {
        const FunctionEnv* func_env = nullptr;
        std::vector<std::shared_ptr<const FunctionTargetData>> lineage;
    };

    [[nodiscard]] Result<const Entry*> find(QualifiedId<FunId> fun) const;

    std::map<QualifiedId<FunId>, Entry> m_entries;
};

/**
 * Applies `processors` to `fun` in order, stopping at the first failure.
 * Ordering across functions is left to the caller.
 */
[[nodiscard]] VoidResult run_pipeline(FunctionTargetsHolder& holder,
                                      QualifiedId<FunId> fun,
                                      std::span<FunctionTargetProcessor* const> processors);

/**
 * Binds the latest snapshot of `fun` and registers the formatters of every
 * processor, in pipeline order.
 */
[[nodiscard]] Result<FunctionTarget>
target_with_formatters(const FunctionTargetsHolder& holder,
                       QualifiedId<FunId> fun,
                       std::span<FunctionTargetProcessor* const> processors);

}  // namespace stackless
