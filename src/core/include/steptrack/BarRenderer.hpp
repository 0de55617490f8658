#pragma once
#include <string>

/**
 * @file BarRenderer.hpp
 * @brief Fixed-width bar with sub-character resolution.
 *
 * @details
 * `render_bar` maps ``current / total`` onto ``width`` cells. In Unicode mode each cell is split
 * into 8 eighths, and the last filled cell may be one of the partial block glyphs
 * (U+258F ... U+2589), so the bar grows smoothly between whole-cell increments. Ascii mode uses
 * one subdivision (``#`` cells only).
 *
 * Filled cells are clamped to 100%: an overshooting process yields a completely full bar, never
 * a wider one. The returned string always spans exactly ``width`` display cells (its byte length
 * differs in Unicode mode, since block glyphs are 3-byte UTF-8 sequences).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   render_bar(47, 150, 31);  // "█████████▋" + 21 spaces
 * @endrst
 */

namespace steptrack
{

enum class Glyphs
{
    Unicode,
    Ascii
};

/// Throws std::invalid_argument if total <= 0, current < 0 or width < 0.
std::string render_bar(int current, int total, int width, Glyphs glyphs = Glyphs::Unicode);

/// Unicode when the active locale (LC_ALL, LC_CTYPE, LANG) is UTF-8, Ascii otherwise.
Glyphs detect_glyphs();

} // namespace steptrack
