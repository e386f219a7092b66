#pragma once

/**
 * @file semver.hpp
 * @brief Minimum-version handling for dependency specifiers
 *
 * Recipes pin dependencies with an optional minimum version that is
 * forwarded to the index installer as `name>=X`. pkgstage never solves
 * version ranges; it only needs to validate a minimum, pick the stricter
 * of two minimums when merging duplicate declarations, and check that a
 * locally built artifact meets a declared minimum.
 *
 * Python distributions routinely use two-component versions ("0.47").
 * These are padded to three components for comparison only; the original
 * text is what reaches the installer.
 *
 * @example
 * ```cpp
 * #include <pkgstage/semver.hpp>
 *
 * auto v = pkgstage::parse_version("0.47");   // 0.47.0
 * bool ok = pkgstage::satisfies_min(*v, "0.40");
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace pkgstage {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Parse a version string, padding "X" and "X.Y" to "X.Y.Z"
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/// True if the string is usable as a minimum version
bool is_valid_min_version(const std::string& str);

/**
 * @brief Pick the stricter of two minimum versions
 *
 * An empty string means "unconstrained" and loses to any version.
 * If either side does not parse, the left-hand side is returned.
 */
std::string stricter_min_version(const std::string& a, const std::string& b);

/// Check a version against a minimum; an empty minimum is always satisfied
bool satisfies_min(const Version& version, const std::string& min_version);

} // namespace pkgstage
