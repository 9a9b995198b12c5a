/**
 * @file function_target_data.cpp
 * @brief Snapshot construction and the copy-with builder
 */

#include "stackless/function_target_data.hpp"

#include "stackless/env.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace stackless {

Result<std::shared_ptr<const FunctionTargetData>>
FunctionTargetData::create(const FunctionEnv& env,
                           std::vector<Bytecode> code,
                           std::map<AttrId, Loc> locations,
                           std::map<SpecBlockId, CodeOffset> given_spec_blocks)
{
    const auto& on_impl = env.spec().on_impl;
    for (const auto& [id, offset] : given_spec_blocks) {
        if (!on_impl.contains(offset)) {
            return std::unexpected(Error::make(
                "BlockNotFound",
                std::format("Spec block {} refers to code offset {} which carries no spec in {}",
                            id.value,
                            offset,
                            env.module_env().symbol_pool().string(env.name()))));
        }
    }

    FunctionTargetData data;
    data.m_function_id = env.qualified_id();
    data.m_parameter_count = env.parameter_count();
    data.m_code = std::move(code);
    data.m_local_types = env.declared_local_types();
    data.m_return_types = env.return_types();
    data.m_acquires_global_resources = env.acquires();
    data.m_locations = std::move(locations);
    data.m_given_spec_blocks = std::move(given_spec_blocks);
    return std::make_shared<const FunctionTargetData>(std::move(data));
}

FunctionTargetData::Builder FunctionTargetData::rewrite() const
{
    return Builder{shared_from_this()};
}

// ============================================================================
// Builder
// ============================================================================

FunctionTargetData::Builder::Builder(std::shared_ptr<const FunctionTargetData> base)
    : m_base(std::move(base))
    , m_data(*m_base)
{
    m_data.m_generation = m_base->m_generation + 1;
    m_data.m_annotations = Annotations{};
}

TempIndex FunctionTargetData::Builder::add_local(Type type)
{
    m_data.m_local_types.push_back(std::move(type));
    return m_data.m_local_types.size() - 1;
}

void FunctionTargetData::Builder::set_code(std::vector<Bytecode> code)
{
    m_data.m_code = std::move(code);
}

void FunctionTargetData::Builder::set_locations(std::map<AttrId, Loc> locations)
{
    m_data.m_locations = std::move(locations);
}

void FunctionTargetData::Builder::set_location(AttrId attr, Loc loc)
{
    m_data.m_locations.insert_or_assign(attr, std::move(loc));
}

VoidResult FunctionTargetData::Builder::add_ref_param(TempIndex param, std::size_t ret)
{
    if (param >= m_data.m_parameter_count ||
        !m_data.m_local_types[param].is_mutable_reference()) {
        return std::unexpected(Error::make(
            "InvalidRefParam",
            std::format("Local {} is not a mutable reference parameter", param)));
    }
    if (ret >= m_data.m_return_types.size()) {
        return std::unexpected(Error::make(
            "InvalidRefParam",
            std::format("Return index {} out of range (return count {})",
                        ret,
                        m_data.m_return_types.size())));
    }
    auto [it, inserted] = m_data.m_ref_param_map.emplace(param, ret);
    if (!inserted && it->second != ret) {
        return std::unexpected(Error::make(
            "RefParamConflict",
            std::format("Parameter {} already returned as {}, cannot remap to {}",
                        param,
                        it->second,
                        ret)));
    }
    return {};
}

bool FunctionTargetData::Builder::carry_annotation(AnalysisKind kind)
{
    return m_data.m_annotations.copy_from(m_base->m_annotations, kind);
}

SpecBlockId FunctionTargetData::Builder::add_generated_spec_block(SpecBlock block)
{
    std::size_t next = 0;
    if (!m_data.m_given_spec_blocks.empty()) {
        next = std::max(next, m_data.m_given_spec_blocks.rbegin()->first.value + 1);
    }
    if (!m_data.m_generated_spec_blocks.empty()) {
        next = std::max(next, m_data.m_generated_spec_blocks.rbegin()->first.value + 1);
    }
    const SpecBlockId id{next};
    m_data.m_generated_spec_blocks.emplace(id, std::move(block));
    return id;
}

VoidResult FunctionTargetData::Builder::set_generated_spec_block(SpecBlockId id, SpecBlock block)
{
    if (m_data.m_given_spec_blocks.contains(id)) {
        return std::unexpected(Error::make(
            "GivenSpecBlockMutation",
            std::format("Spec block {} is anchored in the source and cannot be replaced",
                        id.value)));
    }
    if (!m_data.m_generated_spec_blocks.emplace(id, std::move(block)).second) {
        return std::unexpected(Error::make(
            "SpecBlockConflict",
            std::format("Spec block {} has already been generated", id.value)));
    }
    return {};
}

std::shared_ptr<const FunctionTargetData> FunctionTargetData::Builder::finish() &&
{
    return std::make_shared<const FunctionTargetData>(std::move(m_data));
}

}  // namespace stackless
