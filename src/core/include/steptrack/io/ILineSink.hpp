#pragma once
#include <string>

/**
 * @file ILineSink.hpp
 * @brief Output abstraction that receives the formatted progress line.
 *
 * @details
 * A sink owns a single logical output line. `draw()` replaces its contents; `finish()`
 * terminates it. Sinks are synchronous.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct CapturingSink : steptrack::io::ILineSink {
 *     std::vector<std::string> lines;
 *     void draw(const std::string& l) override { lines.push_back(l); }
 *     void finish() override {}
 *   };
 * @endrst
 */

namespace steptrack::io
{

class ILineSink
{
  public:
    virtual ~ILineSink() = default;

    virtual void draw(const std::string& line) = 0;
    virtual void finish() = 0;
};

} // namespace steptrack::io
