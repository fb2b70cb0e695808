/**
 * @file analyzer.cpp
 * @brief Analysis pipeline: cost estimation, detector fan-out, classification, aggregation
 */

#include "stylint/analyzer.hpp"

#include "stylint/cost_table.hpp"
#include "stylint/require_cpp23.hpp"
#include "stylint/schema_validate.hpp"
#include "stylint/scoring.hpp"
#include "stylint/version.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <format>
#include <future>
#include <memory>
#include <print>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace stylint::analyzer {

static_assert(compat::verify_cpp23_features());

namespace {

/// Outcome of one detector run.
struct DetectorRun
{
    std::string_view id;
    Category category = Category::kSecurity;
    Result<std::vector<Finding>> findings;
};

[[nodiscard]] DetectorRun run_detector(const detectors::Detector& detector,
                                       const ir::ContractModel& model,
                                       const detectors::DetectorContext& context)
{
    const auto& descriptor = detector.descriptor();
    DetectorRun run{.id = descriptor.id, .category = descriptor.category, .findings = std::vector<Finding>{}};
    if (auto budget = context.budget.check(descriptor.id); !budget) {
        run.findings = std::unexpected(budget.error());
        return run;
    }
    try {
        run.findings = detector.inspect(model, context);
    } catch (const std::exception& e) {
        run.findings = std::unexpected(Error::make(std::string(error_code::kDetectorFailed),
                                                   std::format("{}: {}", descriptor.id, e.what())));
    }
    return run;
}

[[nodiscard]] ir::Diagnostic detector_diagnostic(std::string_view id, const Error& error)
{
    if (error.code == error_code::kDetectorTimeout) {
        return ir::Diagnostic{.code = error.code,
                              .message = std::format("detector '{}' timed out; its findings are omitted", id),
                              .location = error.location};
    }
    return ir::Diagnostic{.code = std::string(error_code::kDetectorFailed),
                          .message = std::format("detector '{}' failed: {}", id, error.message),
                          .location = error.location};
}

/// Worker threads for `tasks` units of work: `jobs`, or the hardware concurrency when 0.
[[nodiscard]] std::size_t worker_count(int jobs, std::size_t tasks)
{
    std::size_t workers = jobs > 0 ? static_cast<std::size_t>(jobs) : std::thread::hardware_concurrency();
    return std::clamp<std::size_t>(workers, 1, std::max<std::size_t>(tasks, 1));
}

/**
 * @brief Everything one detector fan-out touches.
 *
 * Owned through a shared_ptr by the caller and by every worker, so a detector
 * that ignores its budget can keep running after analyze() has returned
 * without reading freed memory.
 */
struct DetectorRound
{
    DetectorRound(const ir::ContractModel& source_model,
                  costs::ContractCostEstimate estimate,
                  detectors::DetectorSet detector_set)
        : model(source_model)
        , costs(std::move(estimate))
        , selected(std::move(detector_set))
        , results(selected.size())
    {}

    ir::ContractModel model;
    costs::ContractCostEstimate costs;
    detectors::DetectorSet selected;
    std::vector<detectors::DetectorContext> contexts;
    std::vector<std::promise<DetectorRun>> results;
    std::atomic<std::size_t> next{0};

    /// Run detectors until none is left to claim.
    void work()
    {
        for (auto i = next.fetch_add(1); i < selected.size(); i = next.fetch_add(1)) {
            results[i].set_value(run_detector(*selected[i], model, contexts[i]));
        }
    }
};

/// Start up to `workers` threads on `round`; 0 when the system refuses all of them.
std::size_t start_workers(const std::shared_ptr<DetectorRound>& round, std::size_t workers, bool trace)
{
    std::size_t started = 0;
    for (; started < workers; ++started) {
        try {
            std::thread([round] { round->work(); }).detach();
        } catch (const std::system_error& e) {
            if (trace) {
                std::println(stderr, "[stylint] cannot start detector thread: {}", e.what());
            }
            break;
        }
    }
    return started;
}

}  // namespace

Analyzer::Analyzer(AnalysisConfig config)
    : m_config(std::move(config))
{}

Result<report::Report> Analyzer::analyze(const ir::ContractModel& model) const
{
    if (auto valid = validate_config(m_config); !valid) {
        return std::unexpected(valid.error());
    }
    const auto& config = m_config;
    const detectors::Budget contract_budget =
        config.timeout ? detectors::Budget::for_duration(*config.timeout) : detectors::Budget::unlimited();

    if (config.trace) {
        std::println(stderr,
                     "[stylint] {}: {} function(s), {} slot(s), dialect {}",
                     model.name,
                     model.functions.size(),
                     model.slots.size(),
                     ir::to_string(model.dialect));
    }

    const costs::CostOptions cost_options{.loop_iteration_estimate = config.loop_iteration_estimate,
                                          .max_loop_depth = 3,
                                          .unestimated_operation_cost = config.unestimated_operation_cost,
                                          .carbon_per_unit = config.carbon_micrograms_per_unit};
    const auto& table = costs::default_cost_table();
    auto estimate = costs::estimate(model, table, cost_options);
    if (!estimate) {
        return std::unexpected(estimate.error());
    }

    const auto& all = config.detectors.empty() ? detectors::default_detectors() : config.detectors;
    auto selected = detectors::filter_by_category(all, config.enabled_categories);
    const detectors::DetectorOptions detector_options{.gas_cost_threshold = config.gas_cost_threshold,
                                                      .complexity_threshold = config.complexity_threshold,
                                                      .trusted_targets = config.trusted_targets};

    auto round = std::make_shared<DetectorRound>(model, std::move(*estimate), std::move(selected));
    round->contexts.reserve(round->selected.size());
    for (std::size_t i = 0; i < round->selected.size(); ++i) {
        // A private stop flag per detector: cancelling one overrun leaves the others running.
        const auto deadline = contract_budget.narrowed(config.detector_timeout).deadline();
        round->contexts.push_back(detectors::DetectorContext{.table = table,
                                                             .costs = round->costs,
                                                             .options = detector_options,
                                                             .budget = detectors::Budget{deadline, nullptr}});
    }
    std::vector<std::future<DetectorRun>> pending;
    pending.reserve(round->results.size());
    for (auto& promise : round->results) {
        pending.push_back(promise.get_future());
    }

    if (!config.parallel || start_workers(round, worker_count(config.jobs, round->selected.size()), config.trace) == 0) {
        round->work();
    }

    std::vector<DetectorRun> runs;
    runs.reserve(pending.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        const auto& budget = round->contexts[i].budget;
        const bool bounded = budget.deadline() && *budget.deadline() != detectors::Budget::Clock::time_point::max();
        if (bounded && pending[i].wait_until(*budget.deadline()) == std::future_status::timeout) {
            budget.cancel();
            const auto& descriptor = round->selected[i]->descriptor();
            runs.push_back(DetectorRun{
                .id = descriptor.id,
                .category = descriptor.category,
                .findings = std::unexpected(Error::make(std::string(error_code::kDetectorTimeout),
                                                        std::format("{}: did not finish before its deadline", descriptor.id)))});
            continue;
        }
        runs.push_back(pending[i].get());
    }

    report::AggregateInput input{.model = model,
                                 .findings = {},
                                 .diagnostics = {},
                                 .costs = round->costs,
                                 .severity_floor = config.severity_floor,
                                 .complexity_threshold = config.complexity_threshold,
                                 .evaluated = {}};
    for (auto& run : runs) {
        if (!run.findings) {
            if (config.trace) {
                std::println(stderr, "[stylint] {}: {} ({})", run.id, run.findings.error().code, run.findings.error().message);
            }
            input.diagnostics.push_back(detector_diagnostic(run.id, run.findings.error()));
            continue;
        }
        if (config.trace) {
            std::println(stderr, "[stylint] {}: {} finding(s)", run.id, run.findings->size());
        }
        auto classified = scoring::classify(std::move(*run.findings));
        if (!classified) {
            return std::unexpected(classified.error());
        }
        input.findings.push_back(std::move(*classified));
        if (std::ranges::find(input.evaluated, run.category) == input.evaluated.end()) {
            input.evaluated.push_back(run.category);
        }
    }

    auto result = report::aggregate(std::move(input));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!config.schema_dir.empty()) {
        if (auto valid = common::validate_json_in(report::to_json(*result), config.schema_dir, kReportSchemaVersion);
            !valid) {
            return std::unexpected(Error::make(std::string(error_code::kSchemaValidationFailed), valid.error().message));
        }
    }
    if (config.trace) {
        std::println(stderr,
                     "[stylint] {}: {} finding(s) reported, risk {}",
                     model.name,
                     result->findings.size(),
                     scoring::to_string(result->risk));
    }
    return result;
}

Result<report::Report> Analyzer::analyze(const ContractInput& input) const
{
    auto model = frontend::build_model(input.source, input.dialect, input.options);
    if (!model) {
        if (m_config.trace) {
            std::println(stderr, "[stylint] {}: {} ({})", input.options.file_path, model.error().code, model.error().message);
        }
        return std::unexpected(model.error());
    }
    return analyze(*model);
}

std::vector<Result<report::Report>> Analyzer::analyze_batch(const std::vector<ContractInput>& inputs) const
{
    std::vector<Result<report::Report>> results(inputs.size());
    std::atomic<std::size_t> next{0};
    const auto work = [this, &inputs, &results, &next] {
        for (auto i = next.fetch_add(1); i < inputs.size(); i = next.fetch_add(1)) {
            results[i] = analyze(inputs[i]);
        }
    };
    if (!m_config.parallel) {
        work();
        return results;
    }

    // The calling thread is one of the workers.
    std::vector<std::future<void>> workers;
    const auto extra = worker_count(m_config.jobs, inputs.size()) - 1;
    workers.reserve(extra);
    for (std::size_t i = 0; i < extra; ++i) {
        try {
            workers.push_back(std::async(std::launch::async, work));
        } catch (const std::system_error& e) {
            if (m_config.trace) {
                std::println(stderr, "[stylint] cannot start batch worker: {}", e.what());
            }
            break;
        }
    }
    work();
    for (auto& worker : workers) {
        worker.get();
    }
    return results;
}

Result<report::Report> analyze(const ir::ContractModel& model, const AnalysisConfig& config)
{
    return Analyzer(config).analyze(model);
}

}  // namespace stylint::analyzer
