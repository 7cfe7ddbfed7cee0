#pragma once

#include <tsforest/predef.hpp>

// --- --- --- --- --- ---
// --- Should not happen
// --- --- --- --- --- ---

namespace tsforest::utils {

  /// Throw an exception "should not happen" with a message.
  [[noreturn]] void inline should_not_happen(std::string const& msg) {
    throw std::logic_error("Should not happen: " + msg);
  }

} // End of namespace tsforest::utils

// --- --- --- --- --- ---
// --- Timing
// --- --- --- --- --- ---

namespace tsforest::utils {

  using myclock_t = std::chrono::steady_clock;
  using duration_t = myclock_t::duration;
  using time_point_t = myclock_t::time_point;

  /** Create a time point for "now" */
  time_point_t now();

  /** Convert a number of minutes (possibly fractional) into a duration */
  duration_t from_minutes(double minutes);

  /** Print a duration in a human readable form (from nanoseconds to hours) in an output stream. */
  void printDuration(std::ostream& out, const duration_t& elapsed);

  /** Shortcut to print in a string */
  std::string as_string(const duration_t& elapsed);

} // End of namespace tsforest::utils

// --- --- --- --- --- ---
// --- Parallel tasks
// --- --- --- --- --- ---

namespace tsforest::utils {

  /// Helper class to execute several tasks in parallel.
  /// Tasks must be prepared (with push_task) before being executed, or produced on demand by a task generator.
  /// The 'execute' methods wait for all tasks to be completed.
  /// If the number of thread required is <= 1, the current thread is used.
  /// Else, the requested number of threads are spawned, and the current thread waits for their completion.
  /// Tasks must not throw: capture errors in the task (e.g. with std::exception_ptr) and rethrow after 'execute'.
  class ParTasks {

  public:
    using task_t = std::function<void()>;
    using taskgen_t = std::function<std::optional<task_t>()>;

  private:
    std::mutex mtx;
    std::vector<std::thread> threads;
    std::queue<task_t> tasklist;

  public:

    ParTasks() = default;

    /// Non thread safe! Add all the task before calling "execute"
    void push_task(task_t func);

    /// Template version, binding one argument
    template<class Fun, class Arg>
    void push_task(Fun&& f, Arg&& arg) {
      tasklist.emplace(std::bind(std::forward<Fun>(f), std::forward<Arg>(arg)));
    }

    /// Blocking call
    void execute(size_t nbthreads);

    /// Blocking call using a task generator.
    /// The generator is always called under the lock: it does not need to be thread safe.
    /// Execution stops when the generator returns an empty optional.
    void execute(size_t nbthreads, taskgen_t tgenerator);

  private:

    void run_thread();

    void run_thread_generator(taskgen_t& tgenerator);

  };

} // end of namespace tsforest::utils
