#pragma once

/**
 * @file analyzer.hpp
 * @brief Analysis pipeline: config, cost estimation, detector fan-out, report
 */

#include "stylint/common.hpp"
#include "stylint/detector.hpp"
#include "stylint/finding.hpp"
#include "stylint/frontend.hpp"
#include "stylint/model.hpp"
#include "stylint/report.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace stylint::analyzer {

struct AnalysisConfig
{
    std::vector<Category> enabled_categories{Category::kSecurity, Category::kPerformance, Category::kQuality};
    std::int64_t gas_cost_threshold = 100000;
    Severity severity_floor = Severity::kInfo;
    std::optional<std::chrono::milliseconds> timeout;           ///< Whole contract
    std::optional<std::chrono::milliseconds> detector_timeout;  ///< Each detector
    int complexity_threshold = 10;
    std::int64_t loop_iteration_estimate = 10;
    std::int64_t unestimated_operation_cost = 1000;
    std::optional<std::int64_t> carbon_micrograms_per_unit;
    std::vector<std::string> trusted_targets;
    detectors::DetectorSet detectors;  ///< Empty: default_detectors()
    bool parallel = true;
    int jobs = 0;            ///< Worker threads when parallel; 0 picks the hardware concurrency
    std::string schema_dir;  ///< When set, reports are validated before being returned
    bool trace = false;      ///< Progress lines on stderr
};

/// ConfigurationError for negative thresholds or timeouts, no category, zero estimates.
[[nodiscard]] VoidResult validate_config(const AnalysisConfig& config);

/**
 * Load a config document.
 *
 * Validated against config.v1.schema.json when `schema_dir` is non-empty.
 * Unknown category or severity names and mistyped fields are ConfigurationError.
 */
[[nodiscard]] Result<AnalysisConfig> config_from_json(const nlohmann::json& document, std::string_view schema_dir = "");

/// One contract of a batch.
struct ContractInput
{
    std::string source;
    ir::Dialect dialect = ir::Dialect::kAuto;
    frontend::BuildOptions options;
};

class Analyzer
{
public:
    explicit Analyzer(AnalysisConfig config);

    [[nodiscard]] const AnalysisConfig& config() const { return m_config; }

    /// Analyze a built model.
    [[nodiscard]] Result<report::Report> analyze(const ir::ContractModel& model) const;

    /// Build then analyze one input.
    [[nodiscard]] Result<report::Report> analyze(const ContractInput& input) const;

    /// One result per input, in input order. Each input runs its full pipeline.
    [[nodiscard]] std::vector<Result<report::Report>> analyze_batch(const std::vector<ContractInput>& inputs) const;

private:
    AnalysisConfig m_config;
};

[[nodiscard]] Result<report::Report> analyze(const ir::ContractModel& model, const AnalysisConfig& config);

}  // namespace stylint::analyzer
