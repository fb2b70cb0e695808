/**
 * @file scoring.cpp
 * @brief Severity classification, category scores and overall risk
 */

#include "stylint/scoring.hpp"

#include "stylint/rules.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>
#include <variant>

namespace stylint::scoring {

namespace {

constexpr int kMaxScore = 100;
constexpr int kDocumentationPoints = 40;
constexpr int kComplexityPoints = 30;
constexpr int kHandlingPoints = 30;

constexpr std::array<std::pair<Risk, std::string_view>, 5> kRiskNames = {
    {
     {Risk::kMinimal, "minimal"},
     {Risk::kLow, "low"},
     {Risk::kModerate, "moderate"},
     {Risk::kHigh, "high"},
     {Risk::kCritical, "critical"},
     }
};

[[nodiscard]] Risk risk_of(Severity severity)
{
    switch (severity) {
        case Severity::kCritical:
            return Risk::kCritical;
        case Severity::kHigh:
            return Risk::kHigh;
        case Severity::kMedium:
            return Risk::kModerate;
        case Severity::kLow:
            return Risk::kLow;
        case Severity::kInfo:
            break;
    }
    return Risk::kMinimal;
}

/// Weight of a finding in the density check; below Medium counts nothing.
[[nodiscard]] int density_weight(Severity severity)
{
    switch (severity) {
        case Severity::kCritical:
            return 3;
        case Severity::kHigh:
            return 2;
        case Severity::kMedium:
            return 1;
        case Severity::kLow:
        case Severity::kInfo:
            break;
    }
    return 0;
}

[[nodiscard]] bool has_doc(std::string_view doc)
{
    return std::ranges::any_of(doc, [](char c) { return std::isspace(static_cast<unsigned char>(c)) == 0; });
}

[[nodiscard]] Error invalid_finding(std::string message, const Finding& finding)
{
    return Error::at(std::string(error_code::kInvalidFinding), std::move(message), finding.location);
}

}  // namespace

std::string_view to_string(Risk risk)
{
    return kRiskNames.at(static_cast<std::size_t>(std::to_underlying(risk))).second;
}

std::optional<Risk> parse_risk(std::string_view text)
{
    for (const auto& [risk, name] : kRiskNames) {
        if (name == text) {
            return risk;
        }
    }
    return std::nullopt;
}

Result<std::vector<Finding>> classify(std::vector<Finding> raw)
{
    for (auto& finding : raw) {
        if (finding.rule_id.empty()) {
            return std::unexpected(invalid_finding("finding without rule id", finding));
        }
        const auto* rule = rules::find_rule(finding.rule_id);
        if (rule == nullptr) {
            return std::unexpected(invalid_finding(std::format("unknown rule id '{}'", finding.rule_id), finding));
        }
        finding.category = rule->category;
        finding.severity = finding.partial ? demote(rule->severity) : rule->severity;
        if (finding.remediation.empty()) {
            finding.remediation = std::string(rule->remediation);
        }
        auto stable_id = compute_stable_id(finding);
        if (!stable_id) {
            return std::unexpected(stable_id.error());
        }
        finding.stable_id = std::move(*stable_id);
    }
    return raw;
}

int penalty(Severity severity)
{
    switch (severity) {
        case Severity::kCritical:
            return 40;
        case Severity::kHigh:
            return 20;
        case Severity::kMedium:
            return 10;
        case Severity::kLow:
            return 4;
        case Severity::kInfo:
            return 1;
    }
    return 0;
}

int category_score(const std::vector<Finding>& findings, Category category)
{
    int total = 0;
    for (const auto& finding : findings) {
        if (finding.category == category) {
            total += penalty(finding.severity);
        }
    }
    return std::max(kMaxScore - total, 0);
}

FunctionQuality score_function(const ir::Function& function, ir::Dialect dialect, int complexity_threshold)
{
    FunctionQuality quality{.function = function.name,
                            .score = 0,
                            .documented = has_doc(function.doc),
                            .complexity = 1,
                            .fallible = 0,
                            .handled = 0};
    for (const auto& op : function.operations) {
        if (std::holds_alternative<ir::Branch>(op.kind) || std::holds_alternative<ir::Loop>(op.kind)) {
            ++quality.complexity;
        } else if (const auto* call = std::get_if<ir::ExternalCall>(&op.kind)) {
            ++quality.fallible;
            if (call->result_checked) {
                ++quality.handled;
            }
        } else if (const auto* arithmetic = std::get_if<ir::Arithmetic>(&op.kind)) {
            // Division and remainder cannot wrap.
            if (arithmetic->op != ir::ArithmeticOp::kDiv && arithmetic->op != ir::ArithmeticOp::kMod) {
                ++quality.fallible;
                if (arithmetic->checked) {
                    ++quality.handled;
                }
            }
        }
    }

    // Bytecode has no doc comments to earn or lose points with.
    const bool doc_exempt = !function.is_entry_point() || dialect == ir::Dialect::kWasm;
    int score = (doc_exempt || quality.documented) ? kDocumentationPoints : 0;
    const int threshold = std::max(complexity_threshold, 1);
    score += quality.complexity <= threshold ? kComplexityPoints : kComplexityPoints * threshold / quality.complexity;
    score += quality.fallible == 0 ? kHandlingPoints : kHandlingPoints * quality.handled / quality.fallible;
    quality.score = std::clamp(score, 0, kMaxScore);
    return quality;
}

QualitySummary score_quality(const ir::ContractModel& model, int complexity_threshold)
{
    QualitySummary summary;
    if (model.functions.empty()) {
        return summary;
    }
    int total = 0;
    int entry_points = 0;
    int documented = 0;
    for (const auto& function : model.functions) {
        auto quality = score_function(function, model.dialect, complexity_threshold);
        total += quality.score;
        if (function.is_entry_point()) {
            ++entry_points;
            if (quality.documented) {
                ++documented;
            }
        }
        summary.functions.push_back(std::move(quality));
    }
    summary.score = total / static_cast<int>(model.functions.size());
    summary.documentation_coverage = entry_points == 0 ? kMaxScore : documented * kMaxScore / entry_points;
    return summary;
}

Risk overall_risk(const std::vector<Finding>& findings, std::size_t function_count)
{
    if (findings.empty() || function_count == 0) {
        return Risk::kMinimal;
    }
    Severity worst = Severity::kInfo;
    std::size_t weighted = 0;
    for (const auto& finding : findings) {
        worst = std::max(worst, finding.severity);
        weighted += static_cast<std::size_t>(density_weight(finding.severity));
    }
    Risk risk = risk_of(worst);
    if (weighted >= 2 * function_count && risk != Risk::kCritical) {
        risk = static_cast<Risk>(std::to_underlying(risk) + 1);
    }
    return risk;
}

ScoreSummary score(const ir::ContractModel& model, const std::vector<Finding>& classified, int complexity_threshold)
{
    ScoreSummary summary;
    if (model.functions.empty()) {
        return summary;
    }
    summary.scores = Scores{.security = category_score(classified, Category::kSecurity),
                            .performance = category_score(classified, Category::kPerformance),
                            .quality = 0};
    summary.quality = score_quality(model, complexity_threshold);
    summary.scores.quality = summary.quality.score;
    summary.risk = overall_risk(classified, model.functions.size());
    return summary;
}

void to_json(nlohmann::json& j, const FunctionQuality& quality)
{
    j = nlohmann::json{
        {  "function",   quality.function},
        {     "score",      quality.score},
        {"documented", quality.documented},
        {"complexity", quality.complexity},
        {  "fallible",   quality.fallible},
        {   "handled",    quality.handled},
    };
}

void to_json(nlohmann::json& j, const QualitySummary& summary)
{
    j = nlohmann::json{
        {                 "score",                  summary.score},
        {"documentation_coverage", summary.documentation_coverage},
        {             "functions",              summary.functions},
    };
}

void to_json(nlohmann::json& j, const Scores& scores)
{
    j = nlohmann::json{
        {   "security",    scores.security},
        {"performance", scores.performance},
        {    "quality",     scores.quality},
    };
}

}  // namespace stylint::scoring
