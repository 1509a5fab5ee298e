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
#include "eqv/value.hpp"
#include "eqv/hash.hpp"
#include "eqv/stl/unordered_set.hpp"

#include <cmath>
#include <stdexcept>

using _pair_of_cells = std::pair<const eqv::object*, const eqv::object*>;
using _memory_set =
    eqv::stl::unordered_set<_pair_of_cells, eqv::identity_pair_hash>;


static bool
_equal(eqv::value a, eqv::value b, _memory_set &mem)
{
  using eqv::tag;

  if (is(a, b))
    return true;

  if (a->t != b->t)
    return false;

  switch (a->t)
  {
    case tag::nil:
      return true;

    case tag::boolean:
      return a->boolean == b->boolean;

    case tag::integer:
      return a->integer == b->integer;

    case tag::real:
      return a->real == b->real or (std::isnan(a->real) and std::isnan(b->real));

    case tag::str:
      return str_view(a) == str_view(b);

    case tag::seq: {
      if (a->ty != b->ty or a->seq.len != b->seq.len)
        return false;

      // Don't repeat test on same pairs of cells
      if (not mem.emplace(&*a, &*b).second)
        return true;

      for (size_t i = 0; i < a->seq.len; ++i)
      {
        if (not _equal(eqv::value {a->seq.data[i]}, eqv::value {b->seq.data[i]},
                       mem))
          return false;
      }
      return true;
    }

    case tag::obj: {
      if (a->ty != b->ty)
        return false;

      if (not mem.emplace(&*a, &*b).second)
        return true;

      // Equal if all slots are equal
      for (size_t i = 0; i < a->obj.nslots; ++i)
      {
        if (not _equal(eqv::value {a->obj.slots[i]},
                       eqv::value {b->obj.slots[i]}, mem))
          return false;
      }
      return true;
    }
  }

  throw std::invalid_argument {"equal() - corrupt object tag"};
}

bool
eqv::equal(value a, value b)
{
  EQV_FUNCTION_BENCHMARK

  _memory_set mem;
  return _equal(a, b, mem);
}
