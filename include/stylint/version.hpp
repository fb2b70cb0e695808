#pragma once

/**
 * @file version.hpp
 * @brief stylint version information
 *
 * Every report embeds these so that results produced by different rule or
 * cost-model revisions are never compared blindly.
 */

#include <string>

namespace stylint {

/// stylint version string
constexpr const char* kVersion = "0.1.0";

/// Tool name embedded in reports
constexpr const char* kToolName = "stylint";

/// Report document schema
constexpr const char* kReportSchemaVersion = "report.v1";

/// Configuration document schema
constexpr const char* kConfigSchemaVersion = "config.v1";

/// Rule catalog and cost table revisions
constexpr const char* kRulesetVersion = "rules.v1";
constexpr const char* kCostModelVersion = "cost.v1";

struct VersionInfo
{
    std::string tool;
    std::string ruleset;
    std::string cost_model;
};

[[nodiscard]] inline VersionInfo default_version_info()
{
    return VersionInfo{.tool = kVersion, .ruleset = kRulesetVersion, .cost_model = kCostModelVersion};
}

}  // namespace stylint
