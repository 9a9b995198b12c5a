#pragma once

/**
 * @file render.hpp
 * @brief Deterministic debug rendering of function targets
 *
 * Layout:
 *
 *     pub fun M::f<T>(x: &mut T, y: u64): (u64, bool) {
 *         var $t2: u64
 *         // <formatter output, one line per formatter>
 *         <instruction>
 *     }
 *
 * The output depends only on the snapshot and the registered formatters, so
 * rendering the same target twice yields identical text.
 */

#include "stackless/common.hpp"

#include <string>

namespace stackless {

class FunctionTarget;

/// Signature line of the target, without the opening brace.
[[nodiscard]] Result<std::string> render_signature(const FunctionTarget& target);

/**
 * Renders header, temp declarations and annotated code of `target`.
 * Formatter and instruction display errors are returned unchanged.
 */
[[nodiscard]] Result<std::string> render_function_target(const FunctionTarget& target);

}  // namespace stackless
