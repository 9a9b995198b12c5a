#pragma once

/**
 * @file function_target_data.hpp
 * @brief Analysis snapshot: the rewritable part of a function target
 *
 * A snapshot is published once as `std::shared_ptr<const FunctionTargetData>`
 * and never changes afterwards. Passes derive the next snapshot through a
 * Builder, which starts from a copy of its base and only offers the
 * transformations a pass is allowed to make:
 *
 * - locals may be appended, never removed or renumbered;
 * - code and the location map may be replaced;
 * - the ref-param map may gain entries, never lose or change them;
 * - annotations are written into a fresh, empty store;
 * - generated spec blocks may be added; given spec blocks are fixed at the
 *   initial snapshot.
 */

#include "stackless/annotations.hpp"
#include "stackless/bytecode.hpp"
#include "stackless/common.hpp"
#include "stackless/spec.hpp"
#include "stackless/type.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace stackless {

class FunctionEnv;

class FunctionTargetData : public std::enable_shared_from_this<FunctionTargetData>
{
public:
    class Builder;

    /**
     * Builds the initial snapshot of a function from its source declaration.
     *
     * Local and return types and the acquired resources come from `env`.
     * Every entry of `given_spec_blocks` must point at an `on_impl` block of
     * the function's spec, otherwise `BlockNotFound` is returned.
     */
    [[nodiscard]] static Result<std::shared_ptr<const FunctionTargetData>>
    create(const FunctionEnv& env,
           std::vector<Bytecode> code,
           std::map<AttrId, Loc> locations = {},
           std::map<SpecBlockId, CodeOffset> given_spec_blocks = {});

    /**
     * Starts the derivation of the next snapshot from this one.
     * The builder shares ownership of this snapshot for as long as it lives.
     */
    [[nodiscard]] Builder rewrite() const;

    [[nodiscard]] QualifiedId<FunId> function_id() const noexcept { return m_function_id; }
    /// 0 for the initial snapshot, +1 per rewrite.
    [[nodiscard]] std::size_t generation() const noexcept { return m_generation; }
    [[nodiscard]] std::size_t parameter_count() const noexcept { return m_parameter_count; }

    [[nodiscard]] const std::vector<Bytecode>& code() const noexcept { return m_code; }
    [[nodiscard]] const std::vector<Type>& local_types() const noexcept { return m_local_types; }
    [[nodiscard]] const std::vector<Type>& return_types() const noexcept { return m_return_types; }
    [[nodiscard]] const std::map<TempIndex, std::size_t>& ref_param_map() const noexcept
    {
        return m_ref_param_map;
    }
    [[nodiscard]] const std::vector<QualifiedId<StructId>>&
    acquires_global_resources() const noexcept
    {
        return m_acquires_global_resources;
    }
    [[nodiscard]] const std::map<AttrId, Loc>& locations() const noexcept { return m_locations; }
    [[nodiscard]] const Annotations& annotations() const noexcept { return m_annotations; }

    /// Source spec block ids mapped to their offset in the original code.
    [[nodiscard]] const std::map<SpecBlockId, CodeOffset>& given_spec_blocks() const noexcept
    {
        return m_given_spec_blocks;
    }

    /// Spec blocks synthesized by transformations.
    [[nodiscard]] const std::map<SpecBlockId, SpecBlock>& generated_spec_blocks() const noexcept
    {
        return m_generated_spec_blocks;
    }

private:
    FunctionTargetData() = default;

    QualifiedId<FunId> m_function_id{};
    std::size_t m_generation = 0;
    std::size_t m_parameter_count = 0;
    std::vector<Bytecode> m_code;
    std::vector<Type> m_local_types;
    std::vector<Type> m_return_types;
    std::map<TempIndex, std::size_t> m_ref_param_map;
    std::vector<QualifiedId<StructId>> m_acquires_global_resources;
    std::map<AttrId, Loc> m_locations;
    Annotations m_annotations;
    std::map<SpecBlockId, CodeOffset> m_given_spec_blocks;
    std::map<SpecBlockId, SpecBlock> m_generated_spec_blocks;
};

/**
 * @brief Copy-with builder producing the successor of a snapshot.
 */
class FunctionTargetData::Builder
{
public:
    explicit Builder(std::shared_ptr<const FunctionTargetData> base);

    [[nodiscard]] const FunctionTargetData& base() const noexcept { return *m_base; }

    // Locals ---------------------------------------------------------------

    /// Appends a local slot and returns its index.
    TempIndex add_local(Type type);
    [[nodiscard]] std::size_t local_count() const noexcept { return m_data.m_local_types.size(); }

    // Code -----------------------------------------------------------------

    void set_code(std::vector<Bytecode> code);
    [[nodiscard]] const std::vector<Bytecode>& code() const noexcept { return m_data.m_code; }
    void set_locations(std::map<AttrId, Loc> locations);
    void set_location(AttrId attr, Loc loc);

    // Ref-param map --------------------------------------------------------

    /**
     * Records that `&mut` parameter `param` is handed back as return `ret`.
     *
     * Fails with `InvalidRefParam` if `param` is not a `&mut` parameter or
     * `ret` is not a return slot, and with `RefParamConflict` if `param` is
     * already mapped to a different return. Re-adding an identical entry is
     * accepted.
     */
    [[nodiscard]] VoidResult add_ref_param(TempIndex param, std::size_t ret);

    // Annotations ----------------------------------------------------------

    /// Store of the snapshot under construction; starts empty.
    [[nodiscard]] Annotations& annotations() noexcept { return m_data.m_annotations; }

    /**
     * Copies the base snapshot's payload of `kind` forward.
     * @return false if the base has no payload of that kind
     */
    bool carry_annotation(AnalysisKind kind);

    // Spec blocks ----------------------------------------------------------

    /// Adds a synthesized block under a fresh id, unused in both maps.
    SpecBlockId add_generated_spec_block(SpecBlock block);

    /**
     * Adds a synthesized block under a caller chosen id.
     *
     * Fails with `GivenSpecBlockMutation` if `id` belongs to a source block and
     * with `SpecBlockConflict` if `id` is already generated.
     */
    [[nodiscard]] VoidResult set_generated_spec_block(SpecBlockId id, SpecBlock block);

    /// Publishes the new snapshot. The builder is consumed.
    [[nodiscard]] std::shared_ptr<const FunctionTargetData> finish() &&;

private:
    std::shared_ptr<const FunctionTargetData> m_base;
    FunctionTargetData m_data;
};

}  // namespace stackless
