#pragma once

/**
 * @file semver.hpp
 * @brief Semantic Versioning 2.0.0 support for file version policies
 *
 * Payload files deployed with the if_newer_version policy carry a SemVer
 * version. The destination is replaced only when the source is strictly newer.
 *
 * @example
 * ```cpp
 * auto cmp = hatch::compare_versions("1.2.3", "1.2.3");
 * if (cmp && *cmp <= 0) {
 *     // not newer: keep the destination
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace hatch {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Parse a SemVer 2.0.0 version string
 * @param str Version string (e.g., "1.2.3", "1.0.0-alpha+build"); surrounding
 *            whitespace and a leading 'v' are accepted
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/**
 * @brief Compare two version strings
 * @return -1, 0 or 1 when both parse; nullopt if either does not
 */
std::optional<int> compare_versions(const std::string& a, const std::string& b);

} // namespace hatch
