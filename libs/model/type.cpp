/**
 * @file type.cpp
 * @brief Type construction and display
 */

#include "stackless/type.hpp"

#include "stackless/env.hpp"

#include <format>
#include <ranges>

namespace stackless {

namespace {

void append_list(std::string& out, const std::vector<Type>& types, const TypeDisplayContext& ctx)
{
    for (auto [i, type] : std::views::enumerate(types)) {
        if (i > 0) {
            out += ", ";
        }
        out += display_type(type, ctx);
    }
}

}  // namespace

Type Type::primitive(PrimitiveType prim)
{
    Type type;
    type.m_kind = Kind::kPrimitive;
    type.m_prim = prim;
    return type;
}

Type Type::vector(Type element)
{
    Type type;
    type.m_kind = Kind::kVector;
    type.m_args.push_back(std::move(element));
    return type;
}

Type Type::structure(QualifiedId<StructId> id, std::vector<Type> args)
{
    Type type;
    type.m_kind = Kind::kStruct;
    type.m_struct = id;
    type.m_args = std::move(args);
    return type;
}

Type Type::reference(bool is_mut, Type target)
{
    Type type;
    type.m_kind = Kind::kReference;
    type.m_mut = is_mut;
    type.m_args.push_back(std::move(target));
    return type;
}

Type Type::type_parameter(std::uint16_t index)
{
    Type type;
    type.m_kind = Kind::kTypeParameter;
    type.m_param = index;
    return type;
}

Type Type::tuple(std::vector<Type> members)
{
    Type type;
    type.m_kind = Kind::kTuple;
    type.m_args = std::move(members);
    return type;
}

const Type& Type::skip_reference() const noexcept
{
    return is_reference() ? m_args.front() : *this;
}

std::string_view primitive_name(PrimitiveType prim) noexcept
{
    switch (prim) {
        case PrimitiveType::kBool:
            return "bool";
        case PrimitiveType::kU8:
            return "u8";
        case PrimitiveType::kU64:
            return "u64";
        case PrimitiveType::kU128:
            return "u128";
        case PrimitiveType::kAddress:
            return "address";
        case PrimitiveType::kSigner:
            return "signer";
        case PrimitiveType::kNum:
            return "num";
        case PrimitiveType::kRange:
            return "range";
    }
    return "?";
}

std::string display_type(const Type& type, const TypeDisplayContext& ctx)
{
    switch (type.kind()) {
        case Type::Kind::kPrimitive:
            return std::string(primitive_name(type.primitive_type()));
        case Type::Kind::kVector:
            return std::format("vector<{}>", display_type(type.args().front(), ctx));
        case Type::Kind::kReference:
            return std::format("{}{}",
                               type.is_mutable_reference() ? "&mut " : "&",
                               display_type(type.args().front(), ctx));
        case Type::Kind::kTypeParameter: {
            const auto idx = type.type_parameter_index();
            if (ctx.env != nullptr && ctx.type_param_names != nullptr &&
                idx < ctx.type_param_names->size()) {
                return std::string(ctx.env->symbol_pool().string((*ctx.type_param_names)[idx]));
            }
            return std::format("#{}", idx);
        }
        case Type::Kind::kStruct: {
            std::string out = ctx.env != nullptr
                                  ? ctx.env->struct_display_name(type.struct_id())
                                  : std::format("s{}.{}",
                                                type.struct_id().module_id.value,
                                                type.struct_id().id.value);
            if (!type.args().empty()) {
                out += '<';
                append_list(out, type.args(), ctx);
                out += '>';
            }
            return out;
        }
        case Type::Kind::kTuple: {
            std::string out = "(";
            append_list(out, type.args(), ctx);
            out += ')';
            return out;
        }
    }
    return "?";
}

}  // namespace stackless
