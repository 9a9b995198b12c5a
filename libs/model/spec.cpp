/**
 * @file spec.cpp
 * @brief Specification condition display
 */

#include "stackless/spec.hpp"

#include <format>

namespace stackless {

std::string_view condition_kind_name(ConditionKind kind) noexcept
{
    switch (kind) {
        case ConditionKind::kRequires:
            return "requires";
        case ConditionKind::kEnsures:
            return "ensures";
        case ConditionKind::kAbortsIf:
            return "aborts_if";
        case ConditionKind::kModifies:
            return "modifies";
        case ConditionKind::kAssert:
            return "assert";
        case ConditionKind::kAssume:
            return "assume";
        case ConditionKind::kInvariant:
            return "invariant";
    }
    return "unknown";
}

std::string display_condition(const Condition& condition)
{
    return std::format("{} {}", condition_kind_name(condition.kind), condition.expression);
}

}  // namespace stackless
