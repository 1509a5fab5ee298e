/*
 * Eqv - Deep structural equivalence of object graphs
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include <chrono>
#include <string>
#include <string_view>

/**
 * Time the enclosing function when benchmarks are enabled
 */
#ifdef EQV_ENABLE_BENCHMARKS
# define EQV_FUNCTION_BENCHMARK \
  ::eqv::execution_timer _eqv_function_timer {__func__};
#else
# define EQV_FUNCTION_BENCHMARK
#endif

namespace eqv {

/**
 * Measures execution time of code blocks
 *
 * Timing starts on construction (unless disabled) and stops on
 * destruction or stop(). Every stopped interval is added to process-wide
 * statistics keyed by the timer name, see report_global_stats().
 *
 * Usage example:
 * {
 *     execution_timer timer("Operation name");
 *     // Code to measure
 * }
 */
class execution_timer {
  public:
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  void operator = (const execution_timer&) = delete;

  /**
   * Log total and maximal duration of every timer name, longest first
   */
  static void
  report_global_stats();

  /**
   * Forget all global statistics
   */
  static void
  clear_global_stats();

  void
  start();

  void
  stop();

  void
  reset();

  [[nodiscard]] bool
  running() const noexcept
  { return m_running; }

  template <typename Duration>
  [[nodiscard]] Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  /**
   * Log the time accumulated so far
   */
  void
  report() const;

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class eqv::execution_timer

} // namespace eqv
