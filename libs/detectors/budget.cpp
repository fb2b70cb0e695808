/**
 * @file budget.cpp
 * @brief Detector time budget
 */

#include "stylint/detector.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace stylint::detectors {

namespace {

/// now + duration, saturated at the clock's maximum for very long timeouts.
Budget::Clock::time_point deadline_after(std::chrono::milliseconds duration)
{
    const auto now = Budget::Clock::now();
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Budget::Clock::time_point::max() - now);
    if (duration >= headroom) {
        return Budget::Clock::time_point::max();
    }
    return now + duration;
}

}  // namespace

Budget::Budget()
    : m_deadline()
    , m_stop(std::make_shared<std::atomic<bool>>(false))
{}

Budget::Budget(std::optional<Clock::time_point> deadline, std::shared_ptr<std::atomic<bool>> stop)
    : m_deadline(deadline)
    , m_stop(stop ? std::move(stop) : std::make_shared<std::atomic<bool>>(false))
{}

Budget Budget::unlimited()
{
    return Budget{};
}

Budget Budget::for_duration(std::chrono::milliseconds duration)
{
    return Budget{deadline_after(duration), nullptr};
}

Budget Budget::narrowed(std::optional<std::chrono::milliseconds> duration) const
{
    if (!duration) {
        return *this;
    }
    Clock::time_point deadline = deadline_after(*duration);
    if (m_deadline) {
        deadline = std::min(deadline, *m_deadline);
    }
    return Budget{deadline, m_stop};
}

void Budget::cancel() const
{
    m_stop->store(true, std::memory_order_relaxed);
}

bool Budget::expired() const
{
    if (m_stop->load(std::memory_order_relaxed)) {
        return true;
    }
    return m_deadline.has_value() && Clock::now() >= *m_deadline;
}

VoidResult Budget::check(std::string_view who) const
{
    if (!expired()) {
        return {};
    }
    return std::unexpected(
        Error::make(std::string(error_code::kDetectorTimeout), std::format("{}: time budget exhausted", who)));
}

}  // namespace stylint::detectors
