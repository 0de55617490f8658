#pragma once
#include <cstddef>
#include <functional>
#include <vector>

/**
 * @file Process.hpp
 * @brief Step counter of a tracked process with synchronous change observers.
 *
 * @details
 * A `Process` owns the total/current step counters. Every nonzero `update()` adds to the
 * current step and then invokes all registered observers **in registration order**, on the
 * caller's thread. Observers can only be registered while the process is in its initial state
 * (`current_step() == 0`).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   steptrack::Process p(150);
 *   int calls = 0;
 *   p.register_observer([&] { ++calls; });
 *   p.update(47);  // calls == 1
 *   p.update(0);   // no-op, calls == 1
 * @endrst
 *
 * @note Exceptions thrown by an observer propagate out of `update()`; the step count has
 * already been applied at that point.
 */

namespace steptrack
{

class Process
{
  public:
    using Observer = std::function<void()>;

    /// Throws std::invalid_argument if total_steps <= 0.
    explicit Process(int total_steps);

    // Observers may capture this process's address.
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Throws std::runtime_error once progress has started, std::invalid_argument on empty cb.
    void register_observer(Observer cb);

    /// Throws std::invalid_argument if steps < 0, std::overflow_error if the sum would exceed
    /// INT_MAX; steps == 0 is a no-op.
    void update(int steps);

    int total_steps() const noexcept { return total_steps_; }
    int current_step() const noexcept { return current_step_; }
    std::size_t observer_count() const noexcept { return observers_.size(); }

  private:
    const int total_steps_;
    int current_step_{0};
    std::vector<Observer> observers_;
};

} // namespace steptrack
