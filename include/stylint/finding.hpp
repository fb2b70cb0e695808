#pragma once

/**
 * @file finding.hpp
 * @brief Findings, severities and categories
 */

#include "stylint/common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace stylint {

/// Ascending rank; Critical compares greatest.
enum class Severity {
    kInfo,
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

enum class Category {
    kSecurity,
    kPerformance,
    kQuality,
};

struct Finding
{
    Category category = Category::kSecurity;
    std::string rule_id;
    Severity severity = Severity::kInfo;
    SourceLocation location;
    std::string function;  ///< Empty for contract-level findings
    std::string description;
    std::string remediation;
    std::optional<std::int64_t> impact;  ///< Gas units, when quantifiable
    bool partial = false;
    std::string stable_id;
    std::vector<std::string> related;
};

[[nodiscard]] std::string_view to_string(Severity severity);
[[nodiscard]] std::string_view to_string(Category category);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);
[[nodiscard]] std::optional<Category> parse_category(std::string_view text);

/// One level down, never below Info.
[[nodiscard]] constexpr Severity demote(Severity severity) noexcept
{
    return severity == Severity::kInfo ? Severity::kInfo
                                       : static_cast<Severity>(static_cast<int>(severity) - 1);
}

/// "sha256:" digest of the canonical {rule_id, function, location} triple.
[[nodiscard]] Result<std::string> compute_stable_id(const Finding& finding);

void to_json(nlohmann::json& j, const Finding& finding);

}  // namespace stylint
