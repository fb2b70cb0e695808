/**
 * @file aggregate.cpp
 * @brief Report aggregation: merge, dedup, correlate, sort, floor
 */

#include "stylint/report.hpp"

#include "stylint/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <ranges>
#include <set>
#include <tuple>
#include <utility>

namespace stylint::report {

namespace {

void count(SeverityCounts& counts, Severity severity)
{
    switch (severity) {
        case Severity::kCritical:
            ++counts.critical;
            break;
        case Severity::kHigh:
            ++counts.high;
            break;
        case Severity::kMedium:
            ++counts.medium;
            break;
        case Severity::kLow:
            ++counts.low;
            break;
        case Severity::kInfo:
            ++counts.info;
            break;
    }
}

[[nodiscard]] nlohmann::json counts_json(const SeverityCounts& counts)
{
    return nlohmann::json{
        {"critical", counts.critical},
        {    "high",     counts.high},
        {  "medium",   counts.medium},
        {     "low",      counts.low},
        {    "info",     counts.info},
    };
}

}  // namespace

bool report_order(const Finding& lhs, const Finding& rhs)
{
    if (lhs.severity != rhs.severity) {
        return lhs.severity > rhs.severity;
    }
    return std::tie(lhs.location, lhs.rule_id, lhs.function) < std::tie(rhs.location, rhs.rule_id, rhs.function);
}

std::vector<Finding> deduplicate(std::vector<Finding> findings)
{
    std::set<std::pair<std::string, SourceLocation>> seen;
    std::vector<Finding> unique;
    unique.reserve(findings.size());
    for (auto& finding : findings) {
        if (seen.emplace(finding.rule_id, finding.location).second) {
            unique.push_back(std::move(finding));
        }
    }
    return unique;
}

void correlate(std::vector<Finding>& findings)
{
    std::map<std::string, std::set<std::string>> rules_by_function;
    for (const auto& finding : findings) {
        if (!finding.function.empty()) {
            rules_by_function[finding.function].insert(finding.rule_id);
        }
    }
    for (auto& finding : findings) {
        finding.related.clear();
        if (finding.function.empty()) {
            continue;
        }
        for (const auto& rule : rules_by_function[finding.function]) {
            if (rule != finding.rule_id) {
                finding.related.push_back(rule);
            }
        }
    }
}

Result<Report> aggregate(AggregateInput input)
{
    const ir::ContractModel& model = input.model;
    if (model.functions.empty() && !model.diagnostics.empty()) {
        return std::unexpected(Error::make(
            std::string(error_code::kModelUnusable),
            std::format("contract '{}' has no recoverable function ({} parse diagnostic(s))",
                        model.name,
                        model.diagnostics.size())));
    }

    std::vector<Finding> merged;
    // Without functions there is no behaviour to report on.
    if (!model.functions.empty()) {
        for (auto& findings : input.findings) {
            std::ranges::move(findings, std::back_inserter(merged));
        }
    }
    // Sort first so that the kept duplicate does not depend on detector order.
    std::ranges::stable_sort(merged, report_order);
    merged = deduplicate(std::move(merged));
    correlate(merged);

    const auto summary = scoring::score(model, merged, input.complexity_threshold);

    Report report;
    report.contract = model.name;
    report.dialect = model.dialect;
    report.file = model.file;
    report.input_digest = model.input_digest;
    report.severity_floor = input.severity_floor;
    report.costs = std::move(input.costs);
    report.quality = summary.quality;
    report.scores = summary.scores;
    const auto evaluated = [&input](Category category) {
        return std::ranges::find(input.evaluated, category) != input.evaluated.end();
    };
    if (!evaluated(Category::kSecurity)) {
        report.scores.security = 0;
    }
    if (!evaluated(Category::kPerformance)) {
        report.scores.performance = 0;
    }
    report.risk = summary.risk;

    auto kept = merged | std::views::filter([floor = input.severity_floor](const Finding& finding) {
                    return finding.severity >= floor;
                });
    for (const auto& finding : kept) {
        count(report.counts, finding.severity);
        report.findings.push_back(finding);
    }

    report.diagnostics = model.diagnostics;
    std::ranges::move(input.diagnostics, std::back_inserter(report.diagnostics));
    report.partial = !report.diagnostics.empty();
    return report;
}

nlohmann::json to_json(const Report& report)
{
    nlohmann::json findings = nlohmann::json::array();
    for (const auto& finding : report.findings) {
        findings.push_back(finding);
    }
    nlohmann::json diagnostics = nlohmann::json::array();
    for (const auto& diagnostic : report.diagnostics) {
        diagnostics.push_back(diagnostic);
    }
    const nlohmann::json tool = {
        {      "name",                  kToolName},
        {   "version",       report.versions.tool},
        {   "ruleset",    report.versions.ruleset},
        {"cost_model", report.versions.cost_model},
    };
    const nlohmann::json contract = {
        {        "name",                  report.contract},
        {     "dialect", ir::to_string(report.dialect)},
        {        "file",                      report.file},
        {"input_digest",              report.input_digest},
    };
    return nlohmann::json{
        {"schema_version",                 report.schema_version},
        {          "tool",                                   tool},
        {      "contract",                               contract},
        {"severity_floor",      to_string(report.severity_floor)},
        {      "findings",                    std::move(findings)},
        {   "diagnostics",                 std::move(diagnostics)},
        {          "cost",                           report.costs},
        {       "quality",                         report.quality},
        {        "scores",                          report.scores},
        {          "risk",       scoring::to_string(report.risk)},
        {        "counts",             counts_json(report.counts)},
        {       "partial",                         report.partial},
    };
}

Result<std::string> canonical_report(const Report& report)
{
    return canonical::canonicalize(to_json(report));
}

Result<std::string> report_digest(const Report& report)
{
    return canonical::hash_canonical(to_json(report));
}

}  // namespace stylint::report
