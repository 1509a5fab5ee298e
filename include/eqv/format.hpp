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

#include "eqv/printer.hpp"
#include "eqv/value.hpp"

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * std::format support for values
 *
 * `{}` writes the whole value, `{:#N}` elides containers nested deeper
 * than N levels.
 *
 * \ingroup utils
 */


namespace std {

template <>
struct formatter<eqv::value, char> {
  int maxdepth = -1;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == '#')
    {
      it++;
      maxdepth = 0;
      while (it != ctx.end() and *it >= '0' and *it <= '9')
      {
        maxdepth *= 10;
        maxdepth += *it - '0';
        it++;
      }
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for eqv::value"};

    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(eqv::value x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    eqv::default_printer.write(buffer, x, maxdepth);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};

} // namespace std
