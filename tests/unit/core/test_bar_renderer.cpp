#include "steptrack/BarRenderer.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <cstdlib>
#include <stdexcept>
#include <string>

using steptrack::Glyphs;
using steptrack::render_bar;

namespace
{
const std::string kFull = "\xE2\x96\x88";      // U+2588
const std::string kFiveEighths = "\xE2\x96\x8B"; // U+258B

// UTF-8 code points; every glyph used by the bar is one cell wide.
std::size_t cells(const std::string& s)
{
    std::size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80)
            ++n;
    return n;
}

std::string repeat(const std::string& s, int n)
{
    std::string out;
    for (int i = 0; i < n; ++i)
        out += s;
    return out;
}
} // namespace

TEST_CASE("Bar always spans exactly width cells", "[bar]")
{
    const int total = GENERATE(1, 3, 7, 150, 1000);
    const int width = GENERATE(0, 1, 5, 31, 80);
    const auto glyphs = GENERATE(Glyphs::Unicode, Glyphs::Ascii);

    for (int current = 0; current <= total + total / 2 + 1; current += (total / 13) + 1)
    {
        CAPTURE(total, width, current);
        CHECK(cells(render_bar(current, total, width, glyphs)) == static_cast<std::size_t>(width));
    }
}

TEST_CASE("Empty and complete bars", "[bar]")
{
    CHECK(render_bar(0, 150, 31) == std::string(31, ' '));
    CHECK(render_bar(150, 150, 31) == repeat(kFull, 31));
    CHECK(render_bar(0, 10, 12, Glyphs::Ascii) == std::string(12, ' '));
    CHECK(render_bar(10, 10, 12, Glyphs::Ascii) == std::string(12, '#'));
}

TEST_CASE("Partial glyph caps the filled region", "[bar]")
{
    // 47/150 of 31 cells = 77 eighths = 9 full cells + 5/8.
    CHECK(render_bar(47, 150, 31) == repeat(kFull, 9) + kFiveEighths + std::string(21, ' '));

    // 1/16 of 8 cells = 4 eighths = one half block.
    CHECK(render_bar(1, 16, 8) == std::string("\xE2\x96\x8C") + std::string(7, ' '));

    // Ascii has no partials: 77 eighths floor to 9 cells.
    CHECK(render_bar(47, 150, 31, Glyphs::Ascii) == std::string(9, '#') + std::string(22, ' '));
}

TEST_CASE("Every eighth maps to its glyph", "[bar]")
{
    const char* expected[8] = {"",
                               "\xE2\x96\x8F",
                               "\xE2\x96\x8E",
                               "\xE2\x96\x8D",
                               "\xE2\x96\x8C",
                               "\xE2\x96\x8B",
                               "\xE2\x96\x8A",
                               "\xE2\x96\x89"};
    for (int k = 0; k < 8; ++k)
    {
        CAPTURE(k);
        const std::string bar = render_bar(k, 8, 1);
        CHECK(bar == (k == 0 ? std::string(" ") : std::string(expected[k])));
    }
}

TEST_CASE("Overshoot is clamped to a full bar", "[bar]")
{
    CHECK(render_bar(200, 100, 10) == repeat(kFull, 10));
    CHECK(render_bar(101, 100, 4, Glyphs::Ascii) == "####");
}

TEST_CASE("Bar renderer rejects invalid input", "[bar][errors]")
{
    REQUIRE_THROWS_AS(render_bar(0, 0, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(render_bar(-1, 10, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(render_bar(1, 10, -1), std::invalid_argument);
}

TEST_CASE("Glyph set follows the locale", "[bar][locale]")
{
    ::unsetenv("LC_ALL");
    ::unsetenv("LC_CTYPE");

    ::setenv("LANG", "en_US.UTF-8", 1);
    CHECK(steptrack::detect_glyphs() == Glyphs::Unicode);

    ::setenv("LANG", "C", 1);
    CHECK(steptrack::detect_glyphs() == Glyphs::Ascii);

    ::setenv("LC_ALL", "de_DE.utf8", 1);
    CHECK(steptrack::detect_glyphs() == Glyphs::Unicode);

    ::unsetenv("LC_ALL");
    ::unsetenv("LANG");
    CHECK(steptrack::detect_glyphs() == Glyphs::Ascii);
}
