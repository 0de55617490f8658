#include "steptrack/Process.hpp"
#include "steptrack/Log.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

using namespace steptrack;

static int checked_total(int total_steps)
{
    if (total_steps <= 0)
        throw std::invalid_argument("Invalid number of process steps: " +
                                    std::to_string(total_steps));
    return total_steps;
}

Process::Process(int total_steps) : total_steps_(checked_total(total_steps)) {}

void Process::register_observer(Observer cb)
{
    if (current_step_ != 0)
        throw std::runtime_error("Observer registration after process start (step " +
                                 std::to_string(current_step_) + ")");
    if (!cb)
        throw std::invalid_argument("Observer callback is empty");
    observers_.push_back(std::move(cb));
    LOGD("[process] observer #%zu registered\n", observers_.size());
}

void Process::update(int steps)
{
    if (steps < 0)
        throw std::invalid_argument("Invalid number of steps updating the process: " +
                                    std::to_string(steps));
    if (steps == 0)
        return;
    if (steps > std::numeric_limits<int>::max() - current_step_)
        throw std::overflow_error("Step count overflow: " + std::to_string(current_step_) +
                                  " + " + std::to_string(steps));

    current_step_ += steps;

    for (auto& cb : observers_)
        cb();
}
