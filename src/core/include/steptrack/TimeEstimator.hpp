#pragma once
#include "steptrack/Process.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

/**
 * @file TimeEstimator.hpp
 * @brief Wall-clock statistics of a tracked process (average step time, projected finish).
 *
 * @details
 * The estimator attaches itself to a :cpp:class:`steptrack::Process` as an observer at
 * construction. On every nonzero update it recomputes, from a single `now()` sample:
 *
 * - ``average_time_per_step = (now - runtime_begin) / current_step``
 * - ``estimated_remaining   = (total_steps - current_step) * average_time_per_step``
 * - ``estimated_finish      = now + estimated_remaining``
 *
 * Until the first nonzero update the derived values are empty (`std::nullopt`). The remaining
 * time is not clamped, so an overshooting process reports zero or negative values.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   steptrack::Process p(100);
 *   steptrack::TimeEstimator est(&p);  // must happen before the first update
 *   p.update(10);
 *   std::string s = est.summary();     // "[14:02|14:05|00:00:02]"
 * @endrst
 */

namespace steptrack
{

class TimeEstimator
{
  public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    /// Throws std::invalid_argument on a null process or clock, std::runtime_error if the
    /// process has already advanced.
    explicit TimeEstimator(Process* process, NowFn now = &Clock::now);

    // The registered observer captures `this`.
    TimeEstimator(const TimeEstimator&) = delete;
    TimeEstimator& operator=(const TimeEstimator&) = delete;

    Clock::time_point runtime_begin() const noexcept { return runtime_begin_; }
    std::optional<Clock::duration> average_time_per_step() const noexcept { return avg_per_step_; }
    std::optional<Clock::duration> estimated_remaining() const noexcept { return remaining_; }
    std::optional<Clock::time_point> estimated_finish() const noexcept { return finish_; }

    /// "[<begin>|<estimated finish>|<average per step>]"
    std::string summary() const;

  private:
    void on_update();

    Process* process_;
    NowFn now_;
    Clock::time_point runtime_begin_;
    std::optional<Clock::duration> avg_per_step_;
    std::optional<Clock::duration> remaining_;
    std::optional<Clock::time_point> finish_;
};

// Local wall-clock time as "HH:mm"; "--:--" when empty.
std::string format_clock(std::optional<TimeEstimator::Clock::time_point> t);

// "HH:mm:ss" with HH = total hours (unbounded); "--:--:--" when empty.
std::string format_duration(std::optional<TimeEstimator::Clock::duration> d);

} // namespace steptrack
