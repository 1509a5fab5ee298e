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

#include "eqv/memory.hpp"
#include "eqv/printer.hpp"
#include "eqv/type.hpp"
#include "eqv/value.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * \file failure_reporter.hpp
 * Rendering of equivalence failures
 *
 * \ingroup equivalence
 */


namespace eqv {

/**
 * Location of a comparison inside an object graph
 *
 * One segment per member, `Element [i]` or `Count`; once the type of the
 * compared values is known, ` [Full.Name]` is appended to the last segment.
 *
 * \ingroup equivalence
 */
using comparison_path = std::vector<std::string>;

/**
 * What was compared when the mismatch was found: two values, or two
 * runtime types when the types differ
 */
using mismatch_operand = std::variant<value, const type*>;

/**
 * Facts about the first divergence of two object graphs
 *
 * \ingroup equivalence
 */
struct mismatch_report {
  mismatch_operand expected;
  mismatch_operand actual;
  comparison_path path;
  std::optional<std::string> custom_message;
  std::string invoking_name;

  /**
   * Keeps cells of the operands alive wherever the report is stored
   *
   * Operands are often made up for the report alone (a `Count`, the result
   * of a property getter), and exception objects and standard containers
   * are not scanned by the collector.
   */
  gc_root pinned;
}; // struct eqv::mismatch_report


/**
 * Turns a mismatch report into a human-readable message
 *
 * \ingroup equivalence
 */
class failure_reporter {
  public:
  virtual ~failure_reporter() = default;

  [[nodiscard]] virtual std::string
  render(const mismatch_report &report) const = 0;
}; // class eqv::failure_reporter


/**
 * Renders messages of the form
 *
 *     should_be_equivalent_to
 *         Comparing object equivalence, at path:
 *     actual [Shop.Person]
 *         Age [eqv.Integer]
 *
 *         Expected value to be
 *     5
 *         but was
 *     4
 *
 * followed by an `Additional Info:` section when a custom message is given.
 *
 * \ingroup equivalence
 */
class default_failure_reporter: public failure_reporter {
  public:
  explicit default_failure_reporter(const printer &p = default_printer)
  : m_printer {p}
  { }

  // The printer is held by reference and must outlive the reporter
  default_failure_reporter(const printer&&) = delete;

  [[nodiscard]] std::string
  render(const mismatch_report &report) const override;

  private:
  const printer &m_printer;
}; // class eqv::default_failure_reporter

extern const default_failure_reporter default_reporter;


/**
 * Write an operand as it appears in failure messages
 */
[[nodiscard]] std::string
render_operand(const mismatch_operand &operand, const printer &p);

} // namespace eqv
