#include "steptrack/TimeEstimator.hpp"
#include "steptrack/Log.hpp"
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace steptrack
{

TimeEstimator::TimeEstimator(Process* process, NowFn now) : process_(process), now_(std::move(now))
{
    if (!process_)
        throw std::invalid_argument("TimeEstimator: process to track is null");
    if (!now_)
        throw std::invalid_argument("TimeEstimator: clock is empty");
    if (process_->current_step() != 0)
        throw std::runtime_error("TimeEstimator: process is not in its initial state");

    runtime_begin_ = now_();
    // Last: nothing above mutates the process.
    process_->register_observer([this] { on_update(); });
}

void TimeEstimator::on_update()
{
    const int current = process_->current_step();
    if (current == 0)
        return;

    const auto t = now_();
    const auto elapsed = t - runtime_begin_;
    const auto avg = elapsed / current;
    const auto remaining = (process_->total_steps() - current) * avg;

    avg_per_step_ = avg;
    remaining_ = remaining;
    finish_ = t + remaining;
}

std::string TimeEstimator::summary() const
{
    std::string s;
    s += '[';
    s += format_clock(runtime_begin_);
    s += '|';
    s += format_clock(finish_);
    s += '|';
    s += format_duration(avg_per_step_);
    s += ']';
    return s;
}

std::string format_clock(std::optional<TimeEstimator::Clock::time_point> t)
{
    if (!t)
        return "--:--";
    const std::time_t tt = TimeEstimator::Clock::to_time_t(*t);
    std::tm tm{};
    if (!::localtime_r(&tt, &tm))
    {
        LOGD("[time] localtime_r failed for %lld\n", static_cast<long long>(tt));
        return "--:--";
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", tm.tm_hour, tm.tm_min);
    return buf;
}

std::string format_duration(std::optional<TimeEstimator::Clock::duration> d)
{
    if (!d)
        return "--:--:--";
    using namespace std::chrono;
    auto v = *d;
    const bool negative = v < TimeEstimator::Clock::duration::zero();
    if (negative)
        v = -v;
    const long long total_s = duration_cast<seconds>(v).count();
    const long long h = total_s / 3600;
    const int m = static_cast<int>((total_s % 3600) / 60);
    const int s = static_cast<int>(total_s % 60);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%02lld:%02d:%02d", negative ? "-" : "", h, m, s);
    return buf;
}

} // namespace steptrack
