#include "steptrack/io/TerminalSink.hpp"
#include "steptrack/Log.hpp"
#include <stdexcept>
#include <unistd.h>

using namespace steptrack::io;

TerminalSink::TerminalSink(std::FILE* out, bool force_tty) : out_(out), is_tty_(force_tty)
{
    if (!out_)
        throw std::invalid_argument("TerminalSink: output stream is null");
    if (!is_tty_)
        is_tty_ = ::isatty(::fileno(out_));
    LOGD("[sink] terminal sink, tty=%d\n", is_tty_ ? 1 : 0);
}

void TerminalSink::draw(const std::string& line)
{
    last_ = line;
    if (!is_tty_ || finished_)
        return;
    std::fputs("\r\033[2K", out_);
    std::fputs(line.c_str(), out_);
    std::fflush(out_);
}

void TerminalSink::finish()
{
    if (finished_)
        return;
    finished_ = true;
    if (!is_tty_)
        std::fputs(last_.c_str(), out_);
    std::fputc('\n', out_);
    std::fflush(out_);
}
