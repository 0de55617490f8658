#pragma once
#include "steptrack/BarRenderer.hpp"
#include "steptrack/Formatter.hpp"
#include "steptrack/Log.hpp"
#include <cctype>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → AppConfig loader and schema for the demo app.
 *
 * @details
 * @rst
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    bar:
 *      preset: advanced     # simple | regular | advanced
 *      width: 40            # cells, > 0
 *      boundary: "||"       # opening + closing character
 *      label: "Copying"     # optional prefix
 *      glyphs: auto         # auto | unicode | ascii
 *      ratio: true          # overrides the preset
 *      time_stats: true     # overrides the preset
 *
 *    demo:
 *      steps: 150           # total steps, > 0
 *      step_delay_ms: 20    # simulated work per update
 *      chunk: 1             # steps per update, > 0
 *
 *    log: info              # quiet | error | warn | info | debug
 *
 * **Semantics**
 *
 * - ``preset`` is applied first; ``ratio``/``time_stats`` and the other keys then override it.
 * - ``glyphs: auto`` (also the default when the key is absent) resolves once, at load time,
 *   from the locale (see ``detect_glyphs``).
 * - Invalid values throw ``std::runtime_error`` naming the key; YAML syntax errors propagate as
 *   ``YAML::Exception``.
 * @endrst
 */

namespace steptrack::io
{

// Relative to the repository root, where the sample config ships.
inline constexpr const char* kDefaultConfigPath = "configs/progress.yaml";

// Preset fields with the glyph set taken from the locale.
static inline FormatConfig default_format(Preset p)
{
    FormatConfig f = FormatConfig::preset(p);
    f.glyphs = detect_glyphs();
    return f;
}

struct AppConfig
{
    Preset preset = Preset::Regular;
    FormatConfig format = default_format(Preset::Regular);

    struct Demo
    {
        int total_steps = 150;
        int step_delay_ms = 20;
        int chunk = 1;
    } demo;

    logx::Level log_level = logx::Level::Info;
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}

static inline Preset parse_preset(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "simple")
        return Preset::Simple;
    if (v == "regular")
        return Preset::Regular;
    if (v == "advanced")
        return Preset::Advanced;
    throw std::runtime_error("config: bar.preset: unknown preset '" + s + "'");
}

static inline Glyphs parse_glyphs(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "auto")
        return detect_glyphs();
    if (v == "unicode" || v == "utf8" || v == "utf-8")
        return Glyphs::Unicode;
    if (v == "ascii")
        return Glyphs::Ascii;
    throw std::runtime_error("config: bar.glyphs: unknown glyph set '" + s + "'");
}

static inline int positive(const YAML::Node& n, const char* key)
{
    const int v = n.as<int>();
    if (v <= 0)
        throw std::runtime_error(std::string("config: ") + key + " must be > 0, got " +
                                 std::to_string(v));
    return v;
}

inline AppConfig load_config_from_yaml(const std::string& path)
{
    AppConfig cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto b = root["bar"])
    {
        if (auto n = b["preset"])
        {
            cfg.preset = parse_preset(n.as<std::string>());
            cfg.format = default_format(cfg.preset);
        }
        if (auto n = b["width"])
            cfg.format.bar_width = positive(n, "bar.width");
        if (auto n = b["boundary"])
        {
            const auto s = n.as<std::string>();
            if (s.size() != 2)
                throw std::runtime_error("config: bar.boundary must be exactly two characters, "
                                         "got '" +
                                         s + "'");
            cfg.format.open = s[0];
            cfg.format.close = s[1];
        }
        if (auto n = b["label"])
            cfg.format.label = n.as<std::string>();
        if (auto n = b["glyphs"])
            cfg.format.glyphs = parse_glyphs(n.as<std::string>());
        if (auto n = b["ratio"])
            cfg.format.show_ratio = n.as<bool>();
        if (auto n = b["time_stats"])
            cfg.format.show_time_stats = n.as<bool>();
    }

    if (auto d = root["demo"])
    {
        if (auto n = d["steps"])
            cfg.demo.total_steps = positive(n, "demo.steps");
        if (auto n = d["chunk"])
            cfg.demo.chunk = positive(n, "demo.chunk");
        if (auto n = d["step_delay_ms"])
        {
            cfg.demo.step_delay_ms = n.as<int>();
            if (cfg.demo.step_delay_ms < 0)
                throw std::runtime_error("config: demo.step_delay_ms must be >= 0");
        }
    }

    if (auto n = root["log"])
    {
        const auto s = n.as<std::string>();
        // Quiet doubles as the "unknown" marker: "quiet" itself is the only way to get it.
        const auto L = logx::level_from_string(s, logx::Level::Quiet);
        if (L == logx::Level::Quiet && to_lower(s) != "quiet")
            throw std::runtime_error("config: log: unknown level '" + s + "'");
        cfg.log_level = L;
    }

    return cfg;
}

} // namespace steptrack::io
