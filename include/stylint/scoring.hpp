#pragma once

/**
 * @file scoring.hpp
 * @brief Severity classification, category scores and overall risk
 *
 * Everything here is a pure function of the model and the findings: no
 * clock, no randomness, integers only.
 */

#include "stylint/common.hpp"
#include "stylint/finding.hpp"
#include "stylint/model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace stylint::scoring {

enum class Risk {
    kMinimal,
    kLow,
    kModerate,
    kHigh,
    kCritical,
};

struct FunctionQuality
{
    std::string function;
    int score = 0;  ///< 0..100
    bool documented = false;
    int complexity = 1;
    int fallible = 0;  ///< External calls and arithmetic that can wrap
    int handled = 0;   ///< Checked calls and checked arithmetic
};

struct QualitySummary
{
    std::vector<FunctionQuality> functions;
    int score = 0;
    int documentation_coverage = 0;  ///< Percent of entry points documented
};

struct Scores
{
    int security = 0;
    int performance = 0;
    int quality = 0;
};

struct ScoreSummary
{
    Scores scores;
    Risk risk = Risk::kMinimal;
    QualitySummary quality;
};

[[nodiscard]] std::string_view to_string(Risk risk);
[[nodiscard]] std::optional<Risk> parse_risk(std::string_view text);

/**
 * Assign category and severity from the rule catalog, demote partial matches
 * one level and compute stable ids.
 * @return InvalidFinding for an empty or unknown rule id
 */
[[nodiscard]] Result<std::vector<Finding>> classify(std::vector<Finding> raw);

[[nodiscard]] int penalty(Severity severity);

/// 100 minus the penalties of the category's findings, clamped at 0.
[[nodiscard]] int category_score(const std::vector<Finding>& findings, Category category);

[[nodiscard]] FunctionQuality score_function(const ir::Function& function, ir::Dialect dialect, int complexity_threshold);

[[nodiscard]] QualitySummary score_quality(const ir::ContractModel& model, int complexity_threshold);

/// Worst severity, escalated once when Medium-or-worse findings are dense.
[[nodiscard]] Risk overall_risk(const std::vector<Finding>& findings, std::size_t function_count);

/// Scores for classified findings; a model without functions scores 0 with minimal risk.
[[nodiscard]] ScoreSummary
score(const ir::ContractModel& model, const std::vector<Finding>& classified, int complexity_threshold);

void to_json(nlohmann::json& j, const FunctionQuality& quality);
void to_json(nlohmann::json& j, const QualitySummary& summary);
void to_json(nlohmann::json& j, const Scores& scores);

}  // namespace stylint::scoring
