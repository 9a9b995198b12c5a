#pragma once

/**
 * @file version.hpp
 * @brief stackless version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace stackless {

/// stackless version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Version of the JSON snapshot dump layout
constexpr const char* kDumpFormatVersion = "dump.v1";

/// Version of the JSON fixture format accepted by the loader
constexpr const char* kFixtureSchemaVersion = "fixture.v1";

}  // namespace stackless
