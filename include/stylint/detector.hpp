#pragma once

/**
 * @file detector.hpp
 * @brief Detector interface, time budget and the default detector set
 *
 * Detectors are stateless rule evaluators over an immutable ContractModel.
 * Each one may run on its own thread; everything they share is read-only.
 */

#include "stylint/common.hpp"
#include "stylint/cost_table.hpp"
#include "stylint/finding.hpp"
#include "stylint/model.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylint::detectors {

/**
 * @brief Steady-clock deadline plus a cooperative stop flag.
 *
 * Copies share the stop flag, so cancelling one stops every detector that
 * polls a copy.
 */
class Budget
{
public:
    using Clock = std::chrono::steady_clock;

    /// No deadline, never stopped.
    Budget();
    Budget(std::optional<Clock::time_point> deadline, std::shared_ptr<std::atomic<bool>> stop);

    [[nodiscard]] static Budget unlimited();
    [[nodiscard]] static Budget for_duration(std::chrono::milliseconds duration);

    /// Same stop flag, deadline is the earlier of the two.
    [[nodiscard]] Budget narrowed(std::optional<std::chrono::milliseconds> duration) const;

    void cancel() const;
    [[nodiscard]] bool expired() const;

    /// DetectorTimeout error naming `who` once the budget is spent.
    [[nodiscard]] VoidResult check(std::string_view who) const;

    [[nodiscard]] const std::optional<Clock::time_point>& deadline() const { return m_deadline; }

private:
    std::optional<Clock::time_point> m_deadline;
    std::shared_ptr<std::atomic<bool>> m_stop;
};

struct DetectorOptions
{
    std::int64_t gas_cost_threshold = 100000;
    int complexity_threshold = 10;
    std::vector<std::string> trusted_targets;
};

struct DetectorContext
{
    const costs::CostTable& table;
    const costs::ContractCostEstimate& costs;
    DetectorOptions options;
    Budget budget;
};

struct DetectorDescriptor
{
    std::string_view id;
    Category category = Category::kSecurity;
    std::vector<std::string_view> rules;  ///< Rule ids this detector can emit
};

class Detector
{
public:
    Detector() = default;
    virtual ~Detector() = default;
    Detector(const Detector&) = delete;
    Detector& operator=(const Detector&) = delete;
    Detector(Detector&&) = delete;
    Detector& operator=(Detector&&) = delete;

    [[nodiscard]] virtual const DetectorDescriptor& descriptor() const = 0;

    /**
     * Inspect a model.
     * @return Raw findings (severity from the catalog, partial flag set), or
     *         DetectorTimeout when the budget expired, or DetectorFailed
     */
    [[nodiscard]] virtual Result<std::vector<Finding>> inspect(const ir::ContractModel& model,
                                                               const DetectorContext& context) const = 0;
};

using DetectorPtr = std::shared_ptr<const Detector>;
using DetectorSet = std::vector<DetectorPtr>;

/// Built once; safe to share across threads.
[[nodiscard]] const DetectorSet& default_detectors();

/// Detectors of `set` whose category is in `categories`, order kept.
[[nodiscard]] DetectorSet filter_by_category(const DetectorSet& set, const std::vector<Category>& categories);

}  // namespace stylint::detectors
