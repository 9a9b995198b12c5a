#pragma once

/**
 * @file annotation_formatters.hpp
 * @brief Debug formatters for the annotation kinds of the pipeline
 *
 * Each formatter picks its own payload from the target's annotation store and
 * returns the text for one code offset, or std::nullopt if the analysis has
 * not run or has nothing to say about that offset.
 */

#include "stackless/common.hpp"

#include <optional>
#include <string>

namespace stackless {

class FunctionTarget;

[[nodiscard]] Result<std::optional<std::string>>
format_livevar_annotation(const FunctionTarget& target, CodeOffset offset);

[[nodiscard]] Result<std::optional<std::string>>
format_borrow_annotation(const FunctionTarget& target, CodeOffset offset);

[[nodiscard]] Result<std::optional<std::string>>
format_writeback_annotation(const FunctionTarget& target, CodeOffset offset);

[[nodiscard]] Result<std::optional<std::string>>
format_packref_annotation(const FunctionTarget& target, CodeOffset offset);

[[nodiscard]] Result<std::optional<std::string>>
format_lifetime_annotation(const FunctionTarget& target, CodeOffset offset);

[[nodiscard]] Result<std::optional<std::string>>
format_reaching_def_annotation(const FunctionTarget& target, CodeOffset offset);

/**
 * Registers the formatters used by test fixtures, in fixed order: live vars,
 * borrows, write-back, packref, lifetime, reaching definitions.
 */
void register_annotation_formatters_for_test(FunctionTarget& target);

}  // namespace stackless
