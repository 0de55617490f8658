#include "steptrack/BarRenderer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace steptrack
{

namespace
{
// Index k holds the glyph for k/8 of a cell; [0] is the empty cell.
constexpr const char* kEighths[9] = {
    " ",
    "\xE2\x96\x8F", // U+258F
    "\xE2\x96\x8E", // U+258E
    "\xE2\x96\x8D", // U+258D
    "\xE2\x96\x8C", // U+258C
    "\xE2\x96\x8B", // U+258B
    "\xE2\x96\x8A", // U+258A
    "\xE2\x96\x89", // U+2589
    "\xE2\x96\x88", // U+2588 full block
};

bool mentions_utf8(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}
} // namespace

std::string render_bar(int current, int total, int width, Glyphs glyphs)
{
    if (total <= 0)
        throw std::invalid_argument("render_bar: total must be positive");
    if (current < 0)
        throw std::invalid_argument("render_bar: current must be non-negative");
    if (width < 0)
        throw std::invalid_argument("render_bar: width must be non-negative");

    const long long subdiv = (glyphs == Glyphs::Unicode) ? 8 : 1;
    const long long capacity = static_cast<long long>(width) * subdiv;
    const long long clamped = std::min(current, total);
    const long long units = std::min(capacity, clamped * capacity / total);

    const int full = static_cast<int>(units / subdiv);
    const int rem = static_cast<int>(units % subdiv);

    std::string out;
    out.reserve(static_cast<std::size_t>(width) * 3);
    for (int i = 0; i < full; ++i)
        out += (glyphs == Glyphs::Unicode) ? kEighths[8] : "#";
    int used = full;
    if (rem > 0)
    {
        out += kEighths[rem];
        ++used;
    }
    out.append(static_cast<std::size_t>(width - used), ' ');
    return out;
}

Glyphs detect_glyphs()
{
    // POSIX precedence: the first non-empty of LC_ALL, LC_CTYPE, LANG wins.
    for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"})
    {
        const char* v = std::getenv(var);
        if (v && *v)
            return mentions_utf8(v) ? Glyphs::Unicode : Glyphs::Ascii;
    }
    return Glyphs::Ascii;
}

} // namespace steptrack
