#pragma once
#include "steptrack/Formatter.hpp"
#include "steptrack/Process.hpp"
#include "steptrack/TimeEstimator.hpp"
#include "steptrack/io/ILineSink.hpp"
#include <memory>
#include <string>
#include <utility>

/**
 * @file ProgressBar.hpp
 * @brief Façade that wires a process, its estimator, a formatter and a line sink.
 *
 * @details
 * Construction creates the :cpp:class:`steptrack::Process`, attaches a
 * :cpp:class:`steptrack::TimeEstimator` and then registers the redraw observer, so every
 * nonzero `update()` recomputes the time statistics **before** the line is formatted.
 * Lines identical to the last one sent are not re-sent to the sink.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   using namespace steptrack;
 *   auto cfg = FormatConfig::preset(Preset::Advanced);
 *   cfg.label = "Copying";
 *   ProgressBar bar(files.size(), cfg, std::make_unique<io::TerminalSink>());
 *   for (auto& f : files) { copy(f); bar.update(1); }
 *   bar.finish();
 * @endrst
 */

namespace steptrack
{

class ProgressBar
{
  public:
    /// Throws std::invalid_argument on a null sink, total_steps <= 0 or a bad bar width.
    ProgressBar(int total_steps, FormatConfig cfg, std::unique_ptr<io::ILineSink> sink,
                TimeEstimator::NowFn now = &TimeEstimator::Clock::now);

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    /// Extra observer, invoked after the redraw; only allowed before the first update.
    void add_observer(Process::Observer cb) { process_.register_observer(std::move(cb)); }

    void update(int steps) { process_.update(steps); }

    /// Redraws and terminates the output line. Idempotent.
    void finish();

    std::string line() const { return formatter_.format(process_, &estimator_); }

    const Process& process() const noexcept { return process_; }
    const TimeEstimator& estimator() const noexcept { return estimator_; }
    const FormatConfig& config() const noexcept { return formatter_.config(); }

  private:
    void redraw();

    Process process_;
    TimeEstimator estimator_;
    Formatter formatter_;
    std::unique_ptr<io::ILineSink> sink_;
    std::string last_drawn_;
    bool finished_{false};
};

} // namespace steptrack
