// src/core/JobSystem.h
#pragma once

// Taskflow core and algorithms
#include <taskflow/taskflow.hpp>                  // tf::Executor, tf::Taskflow, tf::Future
#include <taskflow/algorithm/for_each.hpp>        // tf::Taskflow::for_each_index

#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>

namespace fractal::core {

// Thin owner of a tf::Executor shared by the generator stages and the
// ecosystem decision pass. Blocking helpers must be called from outside the
// executor's worker threads.
class JobSystem {
public:
  // Process-wide pool sized to the hardware.
  static JobSystem& Instance();

  explicit JobSystem(std::size_t workers = Concurrency());
  ~JobSystem();
  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  tf::Executor& executor() noexcept { return _executor; }
  const tf::Executor& executor() const noexcept { return _executor; }
  [[nodiscard]] std::size_t workerCount() const noexcept { return _executor.num_workers(); }

  // Index-based parallel loop over [first, last) with step; non-blocking.
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, tf::Future<void>>
  ParallelForIndexAsync(Index first, Index last, Index step, F&& fn) {
    tf::Taskflow taskflow;
    taskflow.for_each_index(first, last, step, std::forward<F>(fn));
    return _executor.run(std::move(taskflow));
  }

  // Blocking variant; fn(i) must not throw.
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, void>
  ParallelForIndex(Index first, Index last, Index step, F&& fn) {
    if (first >= last) return;
    ParallelForIndexAsync(first, last, step, std::forward<F>(fn)).wait();
  }

  // Run a pre-built taskflow and wait for it. The taskflow must outlive the call.
  void RunAndWait(tf::Taskflow& tfw) { _executor.run(tfw).wait(); }

  static std::size_t Concurrency() noexcept {
    const unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1u : n;
  }

private:
  tf::Executor _executor;
};

} // namespace fractal::core
