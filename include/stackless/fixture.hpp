#pragma once

/**
 * @file fixture.hpp
 * @brief JSON fixtures: environment and snapshot loading, snapshot export
 *
 * A fixture describes modules with their structs and functions. Each function
 * carries its declaration (parameters, locals, returns, spec, pragmas) and,
 * optionally, its code. Functions with code get a target in the holder.
 *
 * Besides the source-level data a function may list state normally produced
 * by earlier passes: `temps`, `ref_params`, `generated_spec_blocks` and
 * `annotations`. If any of them is present, the initial snapshot is followed
 * by one derived snapshot carrying that state.
 *
 * Temps are referred to by index or by name (`x`, `$t3`). Types are either a
 * primitive name (`"u64"`) or an object: `{"vector": T}`, `{"ref": T}`,
 * `{"mut_ref": T}`, `{"param": i}`, `{"struct": "M::S", "args": [...]}`,
 * `{"tuple": [...]}`.
 */

#include "stackless/common.hpp"

#include <filesystem>
#include <memory>

#include <nlohmann/json.hpp>

namespace stackless {

class FunctionTarget;
class FunctionTargetsHolder;
class GlobalEnv;

/// Reads and parses a fixture file; `IOError` or `ParseError` on failure.
[[nodiscard]] Result<nlohmann::json> read_fixture_file(const std::filesystem::path& path);

/**
 * Builds the environment described by `fixture`.
 * Malformed or inconsistent input yields `InvalidFixture`.
 */
[[nodiscard]] Result<std::unique_ptr<GlobalEnv>> load_environment(const nlohmann::json& fixture);

/**
 * Adds a target for every function of `fixture` that has code.
 * `env` must have been built from the same fixture.
 */
[[nodiscard]] VoidResult load_targets(const nlohmann::json& fixture,
                                      const GlobalEnv& env,
                                      FunctionTargetsHolder& holder);

/// Deterministic dump of the snapshot bound to `target`.
[[nodiscard]] Result<nlohmann::json> to_json(const FunctionTarget& target);

}  // namespace stackless
