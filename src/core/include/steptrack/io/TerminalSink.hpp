#pragma once
#include "steptrack/io/ILineSink.hpp"
#include <cstdio>
#include <string>

namespace steptrack::io
{

/// Redraws in place on a TTY ("\r" + clear line). When the stream is redirected, only the last
/// line is written, once, on finish() (no redraw spam in logs or under ctest).
class TerminalSink final : public ILineSink
{
  public:
    explicit TerminalSink(std::FILE* out = stderr, bool force_tty = false);

    void draw(const std::string& line) override;
    void finish() override;

    bool is_tty() const noexcept { return is_tty_; }

  private:
    std::FILE* out_;
    bool is_tty_;
    bool finished_{false};
    std::string last_;
};

} // namespace steptrack::io
