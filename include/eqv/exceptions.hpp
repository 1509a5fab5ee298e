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

#include "eqv/failure_reporter.hpp"
#include "eqv/type.hpp"

#include <stdexcept>
#include <string>
#include <string_view>


namespace eqv {

/**
 * Two object graphs are not equivalent
 *
 * `what()` holds the message rendered by the failure reporter.
 */
struct equivalence_mismatch: std::runtime_error {
  equivalence_mismatch(mismatch_report report, const std::string &message)
  : runtime_error(message), m_report {std::move(report)}
  { }

  [[nodiscard]] const mismatch_report&
  report() const noexcept
  { return m_report; }

  private:
  mismatch_report m_report;
}; // struct eqv::equivalence_mismatch


/**
 * A type has a shape the equivalence engine can not walk (an indexer)
 */
struct unsupported_shape: std::runtime_error {
  unsupported_shape(const type *shape, std::string_view member);

  [[nodiscard]] const type*
  shape() const noexcept
  { return m_shape; }

  [[nodiscard]] std::string_view
  member() const noexcept
  { return m_member; }

  private:
  const type *m_shape;
  std::string m_member;
}; // struct eqv::unsupported_shape


/**
 * Invalid type declaration, or a value violating a declared type
 */
struct type_error: std::runtime_error {
  type_error(std::string_view what): runtime_error(std::string(what)) { }
}; // struct eqv::type_error

} // namespace eqv
