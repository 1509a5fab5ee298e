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


#include "eqv/utilities/execution_timer.hpp"
#include "eqv/logging.hpp"

#include <functional>
#include <map>
#include <unordered_map>


namespace eqv {

static
std::unordered_map<std::string, std::chrono::nanoseconds> g_total_duration;
static
std::unordered_map<std::string, std::chrono::nanoseconds> g_max_duration;


static std::string
_format_duration(std::chrono::nanoseconds duration)
{
  const double us = std::chrono::duration<double, std::micro>(duration).count();
  if (us < 1000.0)
    return std::format("{:.3f} μs", us);
  else if (us < 1000000.0)
    return std::format("{:.3f} ms", us / 1000.0);
  else
    return std::format("{:.3f} s", us / 1000000.0);
}


execution_timer::execution_timer(std::string_view name, bool auto_start)
: m_name {name},
  m_running {false},
  m_total_duration {std::chrono::nanoseconds::zero()}
{
  if (auto_start)
    start();
}

execution_timer::~execution_timer()
{
  if (m_running)
    stop();
}

void
execution_timer::start()
{
  if (not m_running)
  {
    m_start_time = std::chrono::steady_clock::now();
    m_running = true;
  }
}

void
execution_timer::stop()
{
  if (not m_running)
    return;

  const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - m_start_time);
  m_total_duration += duration;
  m_running = false;

  g_total_duration[m_name] += duration;
  auto [it, inserted] = g_max_duration.try_emplace(m_name, duration);
  if (not inserted and duration > it->second)
    it->second = duration;
}

void
execution_timer::reset()
{
  m_running = false;
  m_total_duration = std::chrono::nanoseconds::zero();
}

void
execution_timer::report() const
{ info("\033[1m{}\033[0m completed in {}", m_name, _format_duration(m_total_duration)); }

void
execution_timer::report_global_stats()
{
  std::multimap<std::chrono::nanoseconds, std::string, std::greater<>> entries;

  for (const auto &[name, duration] : g_total_duration)
  {
    const auto it = g_max_duration.find(name);
    const std::chrono::nanoseconds max_duration =
        it == g_max_duration.end() ? std::chrono::nanoseconds::zero()
                                   : it->second;
    entries.emplace(duration,
                    std::format("\033[1m{:20}\033[0m - total: {}, max: {}", name,
                                _format_duration(duration),
                                _format_duration(max_duration)));
  }

  for (const auto &[_, text] : entries)
    info("{}", text);
}

void
execution_timer::clear_global_stats()
{
  g_total_duration.clear();
  g_max_duration.clear();
}

} // namespace eqv
