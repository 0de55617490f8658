#pragma once
#include "steptrack/BarRenderer.hpp"
#include "steptrack/Process.hpp"
#include "steptrack/TimeEstimator.hpp"
#include <string>

/**
 * @file Formatter.hpp
 * @brief Composition of percentage, bar, step ratio and time summary into one line.
 *
 * @details
 * Field order is fixed; `FormatConfig` only selects which fields appear:
 *
 * @rst
 * .. code-block:: text
 *
 *   Simple:    " 31%|█████████▋                     |"
 *   Regular:   "Copying   31%|...|[47/150]"
 *   Advanced:  "Copying   31%|...|[47/150] [14:02|14:07|00:00:02]"
 * @endrst
 *
 * The label and its two-space separator are emitted only when the label is non-empty.
 */

namespace steptrack
{

enum class Preset
{
    Simple,
    Regular,
    Advanced
};

struct FormatConfig
{
    int bar_width = 40;
    char open = '|';
    char close = '|';
    bool show_ratio = false;
    bool show_time_stats = false;
    std::string label{};
    Glyphs glyphs = Glyphs::Unicode;

    static FormatConfig preset(Preset p);
};

class Formatter
{
  public:
    /// Throws std::invalid_argument if cfg.bar_width <= 0.
    explicit Formatter(FormatConfig cfg);

    const FormatConfig& config() const noexcept { return cfg_; }

    /// Throws std::invalid_argument if time stats are enabled and estimator is null.
    std::string format(const Process& process, const TimeEstimator* estimator = nullptr) const;

  private:
    FormatConfig cfg_;
};

/// round(current * 100 / total), not clamped.
int percent(int current, int total);

} // namespace steptrack
