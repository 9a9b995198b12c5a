#pragma once

/**
 * @file spec.hpp
 * @brief Specification conditions attached to functions and code positions
 *
 * Conditions are opaque to this library: the expression is carried as
 * already pretty-printed text.
 */

#include "stackless/common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stackless {

enum class ConditionKind : std::uint8_t {
    kRequires,
    kEnsures,
    kAbortsIf,
    kModifies,
    kAssert,
    kAssume,
    kInvariant,
};

struct Condition
{
    ConditionKind kind = ConditionKind::kAssert;
    Loc loc;
    std::string expression;

    friend bool operator==(const Condition&, const Condition&) = default;
};

/**
 * @brief Conditions of one specification block.
 *
 * A block is either attached to an original code position of the function
 * (source anchored) or synthesized by a transformation.
 */
struct SpecBlock
{
    std::vector<Condition> conditions;

    friend bool operator==(const SpecBlock&, const SpecBlock&) = default;
};

/**
 * @brief Full source-level specification of a function.
 */
struct Spec
{
    std::vector<Condition> conditions;
    /// Blocks attached to positions in the original bytecode.
    std::map<CodeOffset, SpecBlock> on_impl;

    friend bool operator==(const Spec&, const Spec&) = default;
};

[[nodiscard]] std::string_view condition_kind_name(ConditionKind kind) noexcept;

/// `requires x > 0`
[[nodiscard]] std::string display_condition(const Condition& condition);

}  // namespace stackless
