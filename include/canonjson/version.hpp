#pragma once

/**
 * @file version.hpp
 * @brief canonjson version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace canonjson {

/// canonjson version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Canonical form produced by this build (embedded in --version output)
constexpr const char* kCanonicalFormVersion = "jcs-ascii.v1";

}  // namespace canonjson
