/**
 * @file config.cpp
 * @brief AnalysisConfig validation and JSON loading
 */

#include "stylint/analyzer.hpp"

#include "stylint/schema_validate.hpp"
#include "stylint/version.hpp"

#include <algorithm>
#include <format>
#include <limits>

namespace stylint::analyzer {

namespace {

[[nodiscard]] Error config_error(std::string message)
{
    return Error::make(std::string(error_code::kConfigurationError), std::move(message));
}

struct JsonField
{
    const nlohmann::json* obj = nullptr;
    std::string_view key;
};

[[nodiscard]] Result<std::optional<std::int64_t>> optional_integer(const JsonField& field)
{
    if (!field.obj->contains(field.key)) {
        return std::optional<std::int64_t>{};
    }
    const auto& value = field.obj->at(field.key);
    if (!value.is_number_integer()) {
        return std::unexpected(config_error(std::format("expected integer field '{}'", field.key)));
    }
    return std::optional<std::int64_t>{value.get<std::int64_t>()};
}

[[nodiscard]] Result<std::optional<bool>> optional_bool(const JsonField& field)
{
    if (!field.obj->contains(field.key)) {
        return std::optional<bool>{};
    }
    const auto& value = field.obj->at(field.key);
    if (!value.is_boolean()) {
        return std::unexpected(config_error(std::format("expected boolean field '{}'", field.key)));
    }
    return std::optional<bool>{value.get<bool>()};
}

[[nodiscard]] Result<std::optional<std::vector<std::string>>> optional_strings(const JsonField& field)
{
    if (!field.obj->contains(field.key)) {
        return std::optional<std::vector<std::string>>{};
    }
    const auto& value = field.obj->at(field.key);
    if (!value.is_array()) {
        return std::unexpected(config_error(std::format("expected array field '{}'", field.key)));
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return std::unexpected(config_error(std::format("expected strings in '{}'", field.key)));
        }
        items.push_back(item.get<std::string>());
    }
    return std::optional<std::vector<std::string>>{std::move(items)};
}

/// Integer fields that must fit in an int.
[[nodiscard]] Result<int> narrow(std::int64_t value, std::string_view key)
{
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return std::unexpected(config_error(std::format("'{}' is out of range: {}", key, value)));
    }
    return static_cast<int>(value);
}

}  // namespace

VoidResult validate_config(const AnalysisConfig& config)
{
    if (config.enabled_categories.empty()) {
        return std::unexpected(config_error("enabled_categories must not be empty"));
    }
    if (config.gas_cost_threshold < 0) {
        return std::unexpected(
            config_error(std::format("gas_cost_threshold must not be negative, got {}", config.gas_cost_threshold)));
    }
    if (config.timeout && config.timeout->count() < 0) {
        return std::unexpected(config_error(std::format("timeout must not be negative, got {}ms", config.timeout->count())));
    }
    if (config.detector_timeout && config.detector_timeout->count() < 0) {
        return std::unexpected(config_error(
            std::format("detector_timeout must not be negative, got {}ms", config.detector_timeout->count())));
    }
    if (config.complexity_threshold < 1) {
        return std::unexpected(
            config_error(std::format("complexity_threshold must be positive, got {}", config.complexity_threshold)));
    }
    if (config.loop_iteration_estimate < 1) {
        return std::unexpected(config_error(
            std::format("loop_iteration_estimate must be positive, got {}", config.loop_iteration_estimate)));
    }
    if (config.unestimated_operation_cost < 0) {
        return std::unexpected(config_error("unestimated_operation_cost must not be negative"));
    }
    if (config.carbon_micrograms_per_unit && *config.carbon_micrograms_per_unit < 0) {
        return std::unexpected(config_error("carbon_micrograms_per_unit must not be negative"));
    }
    if (config.jobs < 0) {
        return std::unexpected(config_error(std::format("jobs must not be negative, got {}", config.jobs)));
    }
    if (std::ranges::any_of(config.detectors, [](const detectors::DetectorPtr& d) { return d == nullptr; })) {
        return std::unexpected(config_error("detector set contains a null detector"));
    }
    return {};
}

Result<AnalysisConfig> config_from_json(const nlohmann::json& document, std::string_view schema_dir)
{
    if (!document.is_object()) {
        return std::unexpected(config_error("config document must be a JSON object"));
    }
    if (!schema_dir.empty()) {
        if (auto valid = common::validate_json_in(document, schema_dir, kConfigSchemaVersion); !valid) {
            return std::unexpected(config_error(std::format("config schema: {}", valid.error().message)));
        }
    }
    if (document.contains("schema_version")) {
        const auto& version = document.at("schema_version");
        if (!version.is_string() || version.get<std::string>() != kConfigSchemaVersion) {
            return std::unexpected(
                config_error(std::format("unsupported config schema_version, expected {}", kConfigSchemaVersion)));
        }
    }

    AnalysisConfig config;

    auto categories = optional_strings({.obj = &document, .key = "enabled_categories"});
    if (!categories) {
        return std::unexpected(categories.error());
    }
    if (*categories) {
        config.enabled_categories.clear();
        for (const auto& name : **categories) {
            auto category = parse_category(name);
            if (!category) {
                return std::unexpected(config_error(std::format("unknown category '{}'", name)));
            }
            if (std::ranges::find(config.enabled_categories, *category) == config.enabled_categories.end()) {
                config.enabled_categories.push_back(*category);
            }
        }
    }

    if (document.contains("severity_floor")) {
        const auto& floor = document.at("severity_floor");
        auto severity = floor.is_string() ? parse_severity(floor.get<std::string>()) : std::nullopt;
        if (!severity) {
            return std::unexpected(config_error(std::format("unknown severity '{}'", floor.dump())));
        }
        config.severity_floor = *severity;
    }

    auto gas = optional_integer({.obj = &document, .key = "gas_cost_threshold"});
    auto timeout = optional_integer({.obj = &document, .key = "timeout_ms"});
    auto detector_timeout = optional_integer({.obj = &document, .key = "detector_timeout_ms"});
    auto complexity = optional_integer({.obj = &document, .key = "complexity_threshold"});
    auto loop_estimate = optional_integer({.obj = &document, .key = "loop_iteration_estimate"});
    auto unestimated = optional_integer({.obj = &document, .key = "unestimated_operation_cost"});
    auto carbon = optional_integer({.obj = &document, .key = "carbon_micrograms_per_unit"});
    for (const auto* field : {&gas, &timeout, &detector_timeout, &complexity, &loop_estimate, &unestimated, &carbon}) {
        if (!*field) {
            return std::unexpected(field->error());
        }
    }
    config.gas_cost_threshold = gas->value_or(config.gas_cost_threshold);
    if (*timeout) {
        config.timeout = std::chrono::milliseconds(**timeout);
    }
    if (*detector_timeout) {
        config.detector_timeout = std::chrono::milliseconds(**detector_timeout);
    }
    if (*complexity) {
        auto value = narrow(**complexity, "complexity_threshold");
        if (!value) {
            return std::unexpected(value.error());
        }
        config.complexity_threshold = *value;
    }
    config.loop_iteration_estimate = loop_estimate->value_or(config.loop_iteration_estimate);
    config.unestimated_operation_cost = unestimated->value_or(config.unestimated_operation_cost);
    config.carbon_micrograms_per_unit = *carbon;

    auto trusted = optional_strings({.obj = &document, .key = "trusted_targets"});
    if (!trusted) {
        return std::unexpected(trusted.error());
    }
    config.trusted_targets = trusted->value_or(std::vector<std::string>{});

    auto parallel = optional_bool({.obj = &document, .key = "parallel"});
    auto trace = optional_bool({.obj = &document, .key = "trace"});
    if (!parallel) {
        return std::unexpected(parallel.error());
    }
    if (!trace) {
        return std::unexpected(trace.error());
    }
    config.parallel = parallel->value_or(config.parallel);

    auto jobs = optional_integer({.obj = &document, .key = "jobs"});
    if (!jobs) {
        return std::unexpected(jobs.error());
    }
    if (*jobs) {
        auto value = narrow(**jobs, "jobs");
        if (!value) {
            return std::unexpected(value.error());
        }
        config.jobs = *value;
    }
    config.trace = trace->value_or(config.trace);
    config.schema_dir = std::string(schema_dir);

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

}  // namespace stylint::analyzer
