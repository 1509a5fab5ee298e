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


#include "eqv/printer.hpp"
#include "eqv/stl/vector.hpp"
#include "eqv/type.hpp"
#include "eqv/value.hpp"

#include <algorithm>
#include <format>
#include <sstream>
#include <string>


const eqv::printer eqv::default_printer;


using _memory = eqv::stl::vector<const eqv::object*>;

static void
_write_string(std::ostream &os, std::string_view str)
{
  os << '"';
  for (const char c : str)
  {
    switch (c)
    {
      case '"':
      case '\\':
        os.put('\\');
        os.put(c);
        break;

      case '\a':
      case '\b':
      case '\f':
      case '\n':
      case '\r':
      case '\t':
      case '\v':
      case '\033':
        os << std::format("\\x{:02x}", int(c));
        break;

      default:
        os.put(c);
    }
  }
  os << '"';
}


static void
_print(std::ostream &os, eqv::value val, _memory &mem, int maxdepth, int depth)
{
  using namespace eqv;

  switch (val->t)
  {
    case tag::nil:
      os << "null";
      break;

    case tag::boolean:
      os << (val->boolean ? "true" : "false");
      break;

    case tag::integer:
      os << val->integer;
      break;

    case tag::real:
      os << std::format("{}", val->real);
      break;

    case tag::str:
      _write_string(os, str_view(val));
      break;

    case tag::seq: {
      if (maxdepth >= 0 and depth >= maxdepth)
      {
        os << "[...]";
        return;
      }

      // Self-referencing sequence
      if (std::ranges::find(mem, &*val) != mem.end())
      {
        os << "...";
        return;
      }
      mem.push_back(&*val);

      os << '[';
      for (size_t i = 0; i < val->seq.len; ++i)
      {
        if (i > 0)
          os << ", ";
        _print(os, value {val->seq.data[i]}, mem, maxdepth, depth + 1);
      }
      os << ']';

      mem.pop_back();
      break;
    }

    case tag::obj: {
      const type *t = val->ty;
      os << t->full_name();

      if (t->fields().empty())
      {
        os << " {}";
        return;
      }

      if (maxdepth >= 0 and depth >= maxdepth)
      {
        os << " {...}";
        return;
      }

      if (std::ranges::find(mem, &*val) != mem.end())
      {
        os << " {...}";
        return;
      }
      mem.push_back(&*val);

      os << " { ";
      bool first = true;
      for (const field_info &field : t->fields())
      {
        if (not first)
          os << ", ";
        first = false;
        os << field.name << " = ";
        _print(os, value {val->obj.slots[field.slot]}, mem, maxdepth, depth + 1);
      }
      os << " }";

      mem.pop_back();
      break;
    }
  }
}


void
eqv::printer::write(std::ostream &os, value x, int maxdepth) const
{
  _memory mem;
  _print(os, x, mem, maxdepth, 0);
}

void
eqv::printer::write(std::ostream &os, value x) const
{ write(os, x, m_maxdepth); }

std::string
eqv::printer::operator () (value x) const
{
  std::ostringstream buf;
  write(buf, x);
  return buf.str();
}


void
eqv::write(std::ostream &os, value x)
{ default_printer.write(os, x); }
