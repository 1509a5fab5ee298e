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

#include <cstddef>
#include <functional>
#include <utility>

namespace eqv {

template <class T>
inline void
hash_combine(size_t &seed, const T &v)
{
  std::hash<T> hasher;
  seed ^= hasher(v) + 0x9e3779b9 + (seed<<6) + (seed>>2);
}


/**
 * Hash of a pair of cell addresses, identity based
 */
struct identity_pair_hash {
  template <typename T>
  size_t
  operator () (const std::pair<T*, T*> &p) const noexcept
  {
    size_t hash = 0;
    hash_combine(hash, static_cast<const void*>(p.first));
    hash_combine(hash, static_cast<const void*>(p.second));
    return hash;
  }
}; // struct eqv::identity_pair_hash

} // namespace eqv
