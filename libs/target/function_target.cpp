/**
 * @file function_target.cpp
 * @brief Function target queries
 */

#include "stackless/function_target.hpp"

#include <algorithm>
#include <format>

namespace stackless {

FunctionTarget::FunctionTarget(const FunctionEnv& func_env,
                               std::shared_ptr<const FunctionTargetData> data)
    : m_func_env(func_env)
    , m_data(std::move(data))
{
    for (TempIndex idx = 0; idx < local_count(); ++idx) {
        // First declaration wins if two slots ever share a name.
        m_name_to_index.emplace(m_func_env.local_name(idx), idx);
    }
    m_type_param_names.reserve(type_parameters().size());
    for (const auto& param : type_parameters()) {
        m_type_param_names.push_back(param.name);
    }
}

Result<FunctionTarget> FunctionTarget::bind(const FunctionEnv& func_env,
                                            std::shared_ptr<const FunctionTargetData> data)
{
    if (!data) {
        return std::unexpected(Error::make("InvalidSnapshot", "Cannot bind a null snapshot"));
    }
    if (data->function_id() != func_env.qualified_id()) {
        return std::unexpected(Error::make(
            "InvalidSnapshot",
            std::format("Snapshot of function {}.{} cannot be bound to {}",
                        data->function_id().module_id.value,
                        data->function_id().id.value,
                        func_env.module_env().symbol_pool().string(func_env.name()))));
    }
    return Result<FunctionTarget>{std::in_place, func_env, std::move(data)};
}

const GlobalEnv& FunctionTarget::global_env() const noexcept
{
    return module_env().env();
}

const SymbolPool& FunctionTarget::symbol_pool() const noexcept
{
    return module_env().symbol_pool();
}

const Loc& FunctionTarget::bytecode_loc(AttrId attr) const
{
    const auto& locations = m_data->locations();
    if (auto it = locations.find(attr); it != locations.end()) {
        return it->second;
    }
    return loc();
}

Result<std::reference_wrapper<const Type>> FunctionTarget::local_type(TempIndex idx) const
{
    if (idx >= local_count()) {
        return std::unexpected(Error::make(
            "IndexOutOfRange",
            std::format("Local index {} out of range (local count {})", idx, local_count())));
    }
    return std::cref(m_data->local_types()[idx]);
}

Result<std::string> FunctionTarget::local_name(TempIndex idx) const
{
    if (idx >= local_count()) {
        return std::unexpected(Error::make(
            "IndexOutOfRange",
            std::format("Local index {} out of range (local count {})", idx, local_count())));
    }
    return m_func_env.local_name(idx);
}

std::optional<TempIndex> FunctionTarget::local_index(std::string_view name) const
{
    if (auto it = m_name_to_index.find(name); it != m_name_to_index.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<TempIndex> FunctionTarget::local_index(Symbol name) const
{
    return local_index(symbol_pool().string(name));
}

Result<std::reference_wrapper<const Type>> FunctionTarget::return_type(std::size_t idx) const
{
    if (idx >= return_count()) {
        return std::unexpected(Error::make(
            "IndexOutOfRange",
            std::format("Return index {} out of range (return count {})", idx, return_count())));
    }
    return std::cref(m_data->return_types()[idx]);
}

Result<std::reference_wrapper<const SpecBlock>> FunctionTarget::spec_at(SpecBlockId id) const
{
    const auto& given = m_data->given_spec_blocks();
    if (auto it = given.find(id); it != given.end()) {
        const auto& on_impl = spec().on_impl;
        if (auto block = on_impl.find(it->second); block != on_impl.end()) {
            return std::cref(block->second);
        }
        return std::unexpected(Error::make(
            "BlockNotFound",
            std::format("Given spec block {} points at offset {} without a spec",
                        id.value,
                        it->second)));
    }
    const auto& generated = m_data->generated_spec_blocks();
    if (auto it = generated.find(id); it != generated.end()) {
        return std::cref(it->second);
    }
    return std::unexpected(
        Error::make("BlockNotFound", std::format("Spec block {} is not defined", id.value)));
}

std::optional<std::size_t> FunctionTarget::return_index(TempIndex param_idx) const
{
    const auto& map = m_data->ref_param_map();
    if (auto it = map.find(param_idx); it != map.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool FunctionTarget::call_ends_lifetime() const
{
    return is_public() &&
           std::ranges::none_of(return_types(), [](const Type& ty) { return ty.is_reference(); });
}

TypeDisplayContext FunctionTarget::type_display_context() const noexcept
{
    return TypeDisplayContext{.env = &global_env(), .type_param_names = &m_type_param_names};
}

void FunctionTarget::register_annotation_formatter(AnnotationFormatter formatter)
{
    m_annotation_formatters.push_back(std::move(formatter));
}

}  // namespace stackless
