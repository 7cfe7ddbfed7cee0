#include "utils.hpp"

namespace tsforest::utils {

  // --- --- --- --- --- ---
  // --- Timing
  // --- --- --- --- --- ---

  time_point_t now() { return myclock_t::now(); }

  duration_t from_minutes(double minutes) {
    using fminutes = std::chrono::duration<double, std::ratio<60>>;
    return std::chrono::duration_cast<duration_t>(fminutes(minutes));
  }

  void printDuration(std::ostream& out, const duration_t& elapsed) {
    using namespace std::chrono;
    auto execution_time_ns = duration_cast<nanoseconds>(elapsed).count();
    auto execution_time_us = duration_cast<microseconds>(elapsed).count();
    auto execution_time_ms = duration_cast<milliseconds>(elapsed).count();
    auto execution_time_sec = duration_cast<seconds>(elapsed).count();
    auto execution_time_min = duration_cast<minutes>(elapsed).count();
    auto execution_time_hour = duration_cast<hours>(elapsed).count();

    bool first = true;

    if (execution_time_hour>0) {
      out << execution_time_hour << "h";
      first = false;
    }

    if (execution_time_min%60>0) {
      if (!first) { out << " "; }
      out << execution_time_min%60 << "m";
      first = false;
    }

    if (execution_time_sec%60>0) {
      if (!first) { out << " "; }
      out << execution_time_sec%60 << "s";
      first = false;
    }

    if (execution_time_ms%1000>0) {
      if (!first) { out << " "; }
      out << execution_time_ms%1000 << "ms";
      first = false;
    }

    if (execution_time_us%1000>0) {
      if (!first) { out << " "; }
      out << execution_time_us%1000 << "us";
      first = false;
    }

    if (execution_time_ns%1000>0 || first) {
      if (!first) { out << " "; }
      out << execution_time_ns%1000 << "ns";
    }
  }

  std::string as_string(const duration_t& elapsed) {
    std::stringstream ss;
    printDuration(ss, elapsed);
    return ss.str();
  }

  // --- --- --- --- --- ---
  // --- Parallel tasks
  // --- --- --- --- --- ---

  void ParTasks::push_task(task_t func) { tasklist.push(std::move(func)); }

  void ParTasks::execute(size_t nbthreads) {
    if (nbthreads<=1) {
      while (!tasklist.empty()) {
        auto task = std::move(tasklist.front());
        tasklist.pop();
        task();
      }
    } else {
      threads.reserve(nbthreads);
      for (size_t i = 0; i<nbthreads; ++i) { threads.emplace_back([this]() { run_thread(); }); }
      // Wait for all threads to stop
      for (auto& thread : threads) { thread.join(); }
      threads.clear();
    }
  }

  void ParTasks::execute(size_t nbthreads, taskgen_t tgenerator) {
    // --- --- --- 1 thread
    if (nbthreads<=1) {
      auto ntask = tgenerator();
      while (ntask.has_value()) {
        auto task = std::move(ntask.value());
        task();
        ntask = tgenerator();
      }
    }
      // --- --- --- Multi thread
    else {
      threads.reserve(nbthreads);
      for (size_t i = 0; i<nbthreads; ++i) {
        threads.emplace_back([this, &tgenerator]() { run_thread_generator(tgenerator); });
      }
      // Wait for all threads to stop
      for (auto& thread : threads) { thread.join(); }
      threads.clear();
    }
  }

  void ParTasks::run_thread() {
    std::unique_lock lock(mtx);
    while (!tasklist.empty()) {
      auto task = std::move(tasklist.front());
      tasklist.pop();
      lock.unlock();
      task();
      lock.lock();
    }
  }

  void ParTasks::run_thread_generator(taskgen_t& tgenerator) {
    std::optional<task_t> ntask;
    {
      std::lock_guard lg(mtx);
      ntask = tgenerator();
    }
    while (ntask.has_value()) {
      auto task = std::move(ntask.value());
      task();
      {
        std::lock_guard lg(mtx);
        ntask = tgenerator();
      }
    }
  }

} // End of namespace tsforest::utils
