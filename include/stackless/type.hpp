#pragma once

/**
 * @file type.hpp
 * @brief Types of locals and return values, and their display
 */

#include "stackless/common.hpp"
#include "stackless/symbol.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stackless {

class GlobalEnv;

enum class PrimitiveType : std::uint8_t {
    kBool,
    kU8,
    kU64,
    kU128,
    kAddress,
    kSigner,
    kNum,
    kRange,
};

/**
 * @brief A (possibly generic) value type.
 *
 * Types are plain values. Compound types keep their components in `args`:
 * the element of a vector, the target of a reference, the instantiation of a
 * struct, or the members of a tuple.
 */
class Type
{
public:
    enum class Kind : std::uint8_t {
        kPrimitive,
        kVector,
        kStruct,
        kReference,
        kTypeParameter,
        kTuple,
    };

    Type() = default;

    [[nodiscard]] static Type primitive(PrimitiveType prim);
    [[nodiscard]] static Type vector(Type element);
    [[nodiscard]] static Type structure(QualifiedId<StructId> id, std::vector<Type> args = {});
    [[nodiscard]] static Type reference(bool is_mut, Type target);
    [[nodiscard]] static Type type_parameter(std::uint16_t index);
    [[nodiscard]] static Type tuple(std::vector<Type> members);

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }
    [[nodiscard]] PrimitiveType primitive_type() const noexcept { return m_prim; }
    [[nodiscard]] const QualifiedId<StructId>& struct_id() const noexcept { return m_struct; }
    [[nodiscard]] std::uint16_t type_parameter_index() const noexcept { return m_param; }
    [[nodiscard]] const std::vector<Type>& args() const noexcept { return m_args; }

    [[nodiscard]] bool is_reference() const noexcept { return m_kind == Kind::kReference; }
    [[nodiscard]] bool is_mutable_reference() const noexcept { return is_reference() && m_mut; }
    [[nodiscard]] bool is_immutable_reference() const noexcept { return is_reference() && !m_mut; }

    /// Target of a reference type; the type itself otherwise.
    [[nodiscard]] const Type& skip_reference() const noexcept;

    friend bool operator==(const Type&, const Type&) = default;

private:
    Kind m_kind = Kind::kTuple;
    PrimitiveType m_prim = PrimitiveType::kBool;
    bool m_mut = false;
    std::uint16_t m_param = 0;
    QualifiedId<StructId> m_struct{};
    std::vector<Type> m_args;
};

/**
 * @brief Context for type display.
 *
 * With an environment, struct types are printed module qualified; without one
 * they print as their raw ids. Type parameters print by name when names are
 * supplied and as `#<index>` otherwise.
 */
struct TypeDisplayContext
{
    const GlobalEnv* env = nullptr;
    const std::vector<Symbol>* type_param_names = nullptr;
};

[[nodiscard]] std::string display_type(const Type& type, const TypeDisplayContext& ctx);

[[nodiscard]] std::string_view primitive_name(PrimitiveType prim) noexcept;

}  // namespace stackless
