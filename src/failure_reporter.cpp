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


#include "eqv/failure_reporter.hpp"

#include <sstream>
#include <type_traits>


const eqv::default_failure_reporter eqv::default_reporter;


std::string
eqv::render_operand(const mismatch_operand &operand, const printer &p)
{
  return std::visit(
      [&](const auto &x) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(x)>, value>)
          return p(x);
        else
          return x == nullptr ? std::string {"null"}
                              : std::string {x->full_name()};
      },
      operand);
}


std::string
eqv::default_failure_reporter::render(const mismatch_report &report) const
{
  std::ostringstream buf;

  buf << report.invoking_name << "\n";
  buf << "    Comparing object equivalence, at path:\n";

  // First segment belongs to the compared value itself
  buf << "actual";
  if (not report.path.empty())
  {
    buf << report.path.front() << "\n";
    for (size_t i = 1; i < report.path.size(); ++i)
      buf << "    " << report.path[i] << "\n";
  }
  else
    buf << "\n";

  buf << "\n";
  buf << "    Expected value to be\n";
  buf << render_operand(report.expected, m_printer) << "\n";
  buf << "    but was\n";
  buf << render_operand(report.actual, m_printer);

  if (report.custom_message)
  {
    buf << "\n\n";
    buf << "Additional Info:\n";
    buf << "    " << *report.custom_message;
  }

  return buf.str();
}
