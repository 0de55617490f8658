#include "steptrack/ProgressBar.hpp"
#include "steptrack/Log.hpp"
#include <stdexcept>
#include <utility>

namespace steptrack
{

ProgressBar::ProgressBar(int total_steps, FormatConfig cfg, std::unique_ptr<io::ILineSink> sink,
                         TimeEstimator::NowFn now)
    : process_(total_steps), estimator_(&process_, std::move(now)), formatter_(std::move(cfg)),
      sink_(std::move(sink))
{
    if (!sink_)
        throw std::invalid_argument("ProgressBar: sink is null");

    // Registered after the estimator so statistics are fresh when the line is built.
    process_.register_observer([this] { redraw(); });

    LOGD("[bar] total=%d width=%d ratio=%d time=%d\n", total_steps, formatter_.config().bar_width,
         formatter_.config().show_ratio ? 1 : 0, formatter_.config().show_time_stats ? 1 : 0);
    redraw();
}

void ProgressBar::redraw()
{
    if (finished_)
        return;
    std::string l = line();
    if (l == last_drawn_)
        return; // avoid overhead
    last_drawn_ = std::move(l);
    sink_->draw(last_drawn_);
}

void ProgressBar::finish()
{
    if (finished_)
        return;
    redraw();
    finished_ = true;
    sink_->finish();
}

} // namespace steptrack
