#pragma once

/**
 * @file report.hpp
 * @brief Report aggregation and serialization
 */

#include "stylint/common.hpp"
#include "stylint/cost_table.hpp"
#include "stylint/finding.hpp"
#include "stylint/model.hpp"
#include "stylint/scoring.hpp"
#include "stylint/version.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stylint::report {

struct SeverityCounts
{
    int critical = 0;
    int high = 0;
    int medium = 0;
    int low = 0;
    int info = 0;
};

struct Report
{
    std::string schema_version = kReportSchemaVersion;
    VersionInfo versions = default_version_info();
    std::string contract;
    ir::Dialect dialect = ir::Dialect::kStylusRust;
    std::string file;
    std::string input_digest;
    Severity severity_floor = Severity::kInfo;
    std::vector<Finding> findings;
    std::vector<ir::Diagnostic> diagnostics;
    costs::ContractCostEstimate costs;
    scoring::QualitySummary quality;
    scoring::Scores scores;
    scoring::Risk risk = scoring::Risk::kMinimal;
    SeverityCounts counts;
    bool partial = false;
};

struct AggregateInput
{
    const ir::ContractModel& model;
    std::vector<std::vector<Finding>> findings;  ///< Classified, one list per detector
    std::vector<ir::Diagnostic> diagnostics;     ///< Analysis diagnostics (timeouts, failures)
    costs::ContractCostEstimate costs;
    Severity severity_floor = Severity::kInfo;
    int complexity_threshold = 10;
    /// Categories with at least one completed detector; the others score 0.
    std::vector<Category> evaluated{Category::kSecurity, Category::kPerformance, Category::kQuality};
};

/// Severity descending, then location, rule id and function ascending.
[[nodiscard]] bool report_order(const Finding& lhs, const Finding& rhs);

/// Drop exact duplicates (same rule id and location), keeping the first.
[[nodiscard]] std::vector<Finding> deduplicate(std::vector<Finding> findings);

/// Fill `related` with the other rule ids reported for the same function.
void correlate(std::vector<Finding>& findings);

/**
 * Merge detector outputs into the final report.
 *
 * Scores and risk are computed before the severity floor is applied. A model
 * without functions reports no findings. Security and performance score 0
 * unless listed in `evaluated`; quality is measured on the model itself.
 * @return ModelUnusable when the model recovered no function and carries parse diagnostics
 */
[[nodiscard]] Result<Report> aggregate(AggregateInput input);

[[nodiscard]] nlohmann::json to_json(const Report& report);

/// Canonical byte string of the report (sorted keys, no whitespace).
[[nodiscard]] Result<std::string> canonical_report(const Report& report);

/// "sha256:" digest of canonical_report.
[[nodiscard]] Result<std::string> report_digest(const Report& report);

}  // namespace stylint::report
