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

#include <gc.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <new>
#include <utility>
#include <type_traits>

/**
 * \file memory.hpp
 * Garbage-collected allocation for object cells
 *
 * All cells of an object graph are allocated from the Boehm GC heap, so
 * graphs may freely contain cycles and shared substructure without any
 * ownership bookkeeping on the user side.
 *
 * \ingroup memory
 */

namespace eqv {

/**
 * Create a garbage-collected object
 *
 * \tparam T The type of object to create
 * \param args Constructor arguments
 * \return Pointer to the newly created object
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  void *mem = GC_malloc(sizeof(T));
  if (mem == nullptr)
    throw std::bad_alloc {};
  return new (mem) T {std::forward<Args>(args)...};
}

/**
 * Same as make(), but the object is known not to hold pointers into the GC
 * heap, so the collector does not scan it
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_atomic(Args&& ...args)
{
  void *mem = GC_malloc_atomic(sizeof(T));
  if (mem == nullptr)
    throw std::bad_alloc {};
  return new (mem) T {std::forward<Args>(args)...};
}

/**
 * Allocate garbage-collected memory that may hold GC pointers
 *
 * \ingroup memory
 */
inline void*
allocate(size_t size)
{
  void *mem = GC_malloc(size);
  if (mem == nullptr)
    throw std::bad_alloc {};
  return mem;
}

/**
 * Allocate garbage-collected memory for pointer-free data (string bytes)
 *
 * \ingroup memory
 */
inline void*
allocate_atomic(size_t size)
{
  void *mem = GC_malloc_atomic(size);
  if (mem == nullptr)
    throw std::bad_alloc {};
  return mem;
}


/**
 * STL allocator drawing from the GC heap
 *
 * Containers using it keep the cells they point to reachable for the
 * collector, which plain `std::allocator` memory would not.
 *
 * \ingroup memory
 */
template <typename T>
struct gc_allocator {
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator() noexcept = default;

  template <typename U>
  gc_allocator(const gc_allocator<U>&) noexcept { }

  T*
  allocate(size_type n)
  { return static_cast<T*>(eqv::allocate(n * sizeof(T))); }

  void
  deallocate(T *p, [[maybe_unused]] size_type n) noexcept
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator<U>&) const noexcept
  { return true; }
}; // struct eqv::gc_allocator


/**
 * Keeps GC cells alive from memory the collector does not scan
 *
 * Pointers to the cells are stored in an uncollectable block: the collector
 * scans it but never reclaims it until the root is destroyed. Every copy
 * owns a block of its own.
 *
 * \ingroup memory
 */
class gc_root {
  public:
  gc_root() noexcept: m_cells {nullptr}, m_size {0} { }

  explicit gc_root(std::initializer_list<const void*> cells)
  : gc_root {}
  { _assign(cells.begin(), cells.size()); }

  gc_root(const gc_root &other)
  : gc_root {}
  { _assign(other.m_cells, other.m_size); }

  gc_root(gc_root &&other) noexcept
  : m_cells {std::exchange(other.m_cells, nullptr)},
    m_size {std::exchange(other.m_size, 0)}
  { }

  gc_root&
  operator = (gc_root other) noexcept
  {
    std::swap(m_cells, other.m_cells);
    std::swap(m_size, other.m_size);
    return *this;
  }

  ~gc_root()
  {
    if (m_cells)
      GC_free(m_cells);
  }

  [[nodiscard]] size_t
  size() const noexcept
  { return m_size; }

  private:
  void
  _assign(const void *const *cells, size_t n)
  {
    if (n == 0)
      return;
    void *mem = GC_malloc_uncollectable(n * sizeof(const void*));
    if (mem == nullptr)
      throw std::bad_alloc {};
    m_cells = static_cast<const void**>(mem);
    std::copy_n(cells, n, m_cells);
    m_size = n;
  }

  const void **m_cells;
  size_t m_size;
}; // class eqv::gc_root

} // namespace eqv
