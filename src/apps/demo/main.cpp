#include "steptrack/Log.hpp"
#include "steptrack/ProgressBar.hpp"
#include "steptrack/TimeEstimator.hpp"
#include "steptrack/io/ConfigYAML.hpp" // AppConfig + load_config_from_yaml()
#include "steptrack/io/TerminalSink.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

using steptrack::ProgressBar;
using steptrack::io::AppConfig;
using steptrack::io::load_config_from_yaml;
using steptrack::io::TerminalSink;
namespace fs = std::filesystem;

static const char* preset_name(steptrack::Preset p)
{
    switch (p)
    {
    case steptrack::Preset::Simple:
        return "simple";
    case steptrack::Preset::Regular:
        return "regular";
    case steptrack::Preset::Advanced:
        return "advanced";
    }
    return "?";
}

static AppConfig load_or_default(const std::string& path)
{
    if (!fs::exists(path))
    {
        LOGW("config '%s' not found, using defaults\n", path.c_str());
        return AppConfig{};
    }
    return load_config_from_yaml(path);
}

// Simulated workload: fixed-size chunks, the last one possibly shorter.
static void run_workload(ProgressBar& bar, const AppConfig::Demo& demo)
{
    int remaining = demo.total_steps;
    while (remaining > 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(demo.step_delay_ms));
        const int n = std::min(demo.chunk, remaining);
        bar.update(n);
        remaining -= n;
    }
}

int main(int argc, char** argv)
{
    // Users can override with: STEPTRACK_LOG=quiet|error|warn|info|debug
    steptrack::logx::init({steptrack::logx::Level::Info, /*color*/ true});

    const std::string cfg_path = (argc > 1) ? argv[1] : steptrack::io::kDefaultConfigPath;
    try
    {
        const AppConfig cfg = load_or_default(cfg_path);
        if (cfg.log_level != steptrack::logx::Level::Info)
            steptrack::logx::init({cfg.log_level, true});

        LOGI("[demo] preset=%s steps=%d chunk=%d delay=%dms\n", preset_name(cfg.preset),
             cfg.demo.total_steps, cfg.demo.chunk, cfg.demo.step_delay_ms);

        ProgressBar bar(cfg.demo.total_steps, cfg.format, std::make_unique<TerminalSink>());
        run_workload(bar, cfg.demo);
        bar.finish();

        const auto took =
            steptrack::TimeEstimator::Clock::now() - bar.estimator().runtime_begin();
        LOGI("[demo] done in %s\n", steptrack::format_duration(took).c_str());
    }
    catch (const std::exception& e)
    {
        LOGE("%s\n", e.what());
        return 1;
    }
    return 0;
}
