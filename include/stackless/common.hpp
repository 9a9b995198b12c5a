#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error values, result types, index newtypes
 */

#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace stackless {

/**
 * @brief Error information for Result types
 *
 * Errors returned from this library signal contract violations (a bug in a
 * pass or driver) or malformed input handed to the fixture loader. Absence of
 * a computed fact is never an error.
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

// ============================================================================
// Bytecode index types
// ============================================================================

/// Position of an instruction within the current code of a snapshot.
using CodeOffset = std::uint16_t;

/// Index of a local slot (parameters first, then declared locals, then temps).
using TempIndex = std::size_t;

/**
 * @brief Stable per-instruction tag, independent of the instruction position.
 */
struct AttrId
{
    std::size_t value = 0;

    friend auto operator<=>(const AttrId&, const AttrId&) = default;
};

/**
 * @brief Identifier of a specification block embedded in the code.
 */
struct SpecBlockId
{
    std::size_t value = 0;

    friend auto operator<=>(const SpecBlockId&, const SpecBlockId&) = default;
};

/// Branch target label.
struct Label
{
    std::size_t value = 0;

    friend auto operator<=>(const Label&, const Label&) = default;
};

// ============================================================================
// Source locations
// ============================================================================

/**
 * @brief Source location of a declaration or an instruction.
 */
struct Loc
{
    std::string file;
    int line = 0;
    int col = 0;

    friend bool operator==(const Loc&, const Loc&) = default;
};

// ============================================================================
// Environment ids
// ============================================================================

/// Index of a module within its global environment.
struct ModuleId
{
    std::size_t value = 0;

    friend auto operator<=>(const ModuleId&, const ModuleId&) = default;
};

/// Index of a function within its module.
struct FunId
{
    std::size_t value = 0;

    friend auto operator<=>(const FunId&, const FunId&) = default;
};

/// Index of a struct within its module.
struct StructId
{
    std::size_t value = 0;

    friend auto operator<=>(const StructId&, const StructId&) = default;
};

/**
 * @brief Id of a module member, qualified with the owning module.
 */
template <typename Id>
struct QualifiedId
{
    ModuleId module_id;
    Id id;

    friend auto operator<=>(const QualifiedId&, const QualifiedId&) = default;
};

}  // namespace stackless
