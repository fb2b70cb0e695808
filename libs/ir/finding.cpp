/**
 * @file finding.cpp
 * @brief Finding naming, parsing and serialization
 */

#include "stylint/finding.hpp"

#include "stylint/canonical_json.hpp"
#include "stylint/model.hpp"

#include <array>
#include <utility>

namespace stylint {

namespace {

constexpr std::array<std::pair<Severity, std::string_view>, 5> kSeverityNames = {
    {
     {Severity::kInfo, "info"},
     {Severity::kLow, "low"},
     {Severity::kMedium, "medium"},
     {Severity::kHigh, "high"},
     {Severity::kCritical, "critical"},
     }
};

constexpr std::array<std::pair<Category, std::string_view>, 3> kCategoryNames = {
    {
     {Category::kSecurity, "security"},
     {Category::kPerformance, "performance"},
     {Category::kQuality, "quality"},
     }
};

}  // namespace

std::string_view to_string(Severity severity)
{
    return kSeverityNames.at(static_cast<std::size_t>(std::to_underlying(severity))).second;
}

std::string_view to_string(Category category)
{
    return kCategoryNames.at(static_cast<std::size_t>(std::to_underlying(category))).second;
}

std::optional<Severity> parse_severity(std::string_view text)
{
    for (const auto& [severity, name] : kSeverityNames) {
        if (name == text) {
            return severity;
        }
    }
    return std::nullopt;
}

std::optional<Category> parse_category(std::string_view text)
{
    for (const auto& [category, name] : kCategoryNames) {
        if (name == text) {
            return category;
        }
    }
    return std::nullopt;
}

Result<std::string> compute_stable_id(const Finding& finding)
{
    nlohmann::json identity = {
        { "rule_id",  finding.rule_id},
        {"function", finding.function},
        {     "loc", finding.location}
    };
    return canonical::hash_canonical(identity);
}

void to_json(nlohmann::json& j, const Finding& finding)
{
    j = nlohmann::json{
        {   "category", to_string(finding.category)},
        {    "rule_id",              finding.rule_id},
        {   "severity", to_string(finding.severity)},
        {        "loc",             finding.location},
        {   "function",             finding.function},
        {"description",          finding.description},
        {"remediation",          finding.remediation},
        {    "partial",              finding.partial},
        {  "stable_id",            finding.stable_id},
        {    "related",              finding.related}
    };
    if (finding.impact) {
        j["impact"] = *finding.impact;
    }
}

}  // namespace stylint
