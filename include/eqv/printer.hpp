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

#include "eqv/value.hpp"

#include <ostream>
#include <string>

/**
 * \file printer.hpp
 * Textual rendering of values
 *
 * \ingroup utils
 */


namespace eqv {

/**
 * Renders values as text
 *
 * Strings are quoted and escaped, sequences are written as `[a, b]` and
 * objects as `Type { Field = value }`. Only fields are written, properties
 * are never evaluated. A cell reached again while it is being written is
 * abbreviated as `...`.
 *
 * \ingroup utils
 */
class printer {
  public:
  /**
   * \param maxdepth Nesting depth after which containers are elided, or -1
   */
  explicit printer(int maxdepth = -1): m_maxdepth {maxdepth} { }

  void
  write(std::ostream &os, value x) const;

  void
  write(std::ostream &os, value x, int maxdepth) const;

  [[nodiscard]] std::string
  operator () (value x) const;

  [[nodiscard]] int
  maxdepth() const noexcept
  { return m_maxdepth; }

  private:
  int m_maxdepth;
}; // class eqv::printer

extern const printer default_printer;

} // namespace eqv
