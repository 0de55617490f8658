#include "steptrack/Formatter.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace steptrack
{

FormatConfig FormatConfig::preset(Preset p)
{
    FormatConfig cfg;
    switch (p)
    {
    case Preset::Advanced:
        cfg.show_time_stats = true;
        [[fallthrough]];
    case Preset::Regular:
        cfg.show_ratio = true;
        [[fallthrough]];
    case Preset::Simple:
        break;
    }
    return cfg;
}

Formatter::Formatter(FormatConfig cfg) : cfg_(std::move(cfg))
{
    if (cfg_.bar_width <= 0)
        throw std::invalid_argument("Formatter: bar width must be positive, got " +
                                    std::to_string(cfg_.bar_width));
}

int percent(int current, int total)
{
    return static_cast<int>(std::llround(100.0 * current / total));
}

std::string Formatter::format(const Process& process, const TimeEstimator* estimator) const
{
    if (cfg_.show_time_stats && !estimator)
        throw std::invalid_argument("Formatter: time stats enabled without an estimator");

    const int current = process.current_step();
    const int total = process.total_steps();

    std::string line;
    if (!cfg_.label.empty())
    {
        line += cfg_.label;
        line += "  ";
    }

    char pct[16];
    std::snprintf(pct, sizeof(pct), "%3d%%", percent(current, total));
    line += pct;

    line += cfg_.open;
    line += render_bar(current, total, cfg_.bar_width, cfg_.glyphs);
    line += cfg_.close;

    if (cfg_.show_ratio)
        line += "[" + std::to_string(current) + "/" + std::to_string(total) + "]";

    if (cfg_.show_time_stats)
    {
        line += ' ';
        line += estimator->summary();
    }
    return line;
}

} // namespace steptrack
