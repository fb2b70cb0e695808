#pragma once

/**
 * @file canonical_json.hpp
 * @brief Byte-stable JSON for finding ids and report digests
 *
 * Two analyses of the same input must serialize to the same bytes, so the
 * canonical form sorts object keys at every depth, drops all whitespace and
 * refuses floating point values. Scores, costs and locations are integers.
 */

#include "stylint/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace stylint::canonical {

/// Canonical bytes of `j`, or an error naming the first float found.
[[nodiscard]] stylint::Result<std::string> canonicalize(const nlohmann::json& j);

/// "sha256:<hex>" of canonicalize(j).
[[nodiscard]] stylint::Result<std::string> hash_canonical(const nlohmann::json& j);

[[nodiscard]] stylint::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace stylint::canonical
