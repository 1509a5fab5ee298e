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

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

/**
 * \file value.hpp
 * Dynamic object graph representation
 *
 * Object graphs are made of GC-allocated cells. Every cell carries a tag
 * telling its shape; sequences and composite objects additionally point to
 * the type descriptor they are instances of (see type.hpp).
 *
 * \ingroup core
 */


namespace eqv {

/**
 * Tag enumeration for object cells
 *
 * \ingroup core
 */
enum class tag {
  nil,
  boolean,
  integer,
  real,
  str,
  seq,
  obj,
};

class type;
struct object;

/**
 * Value class representing a reference to an object cell
 *
 * A value is never a null pointer; absence of a value is represented by the
 * `nil` singleton.
 *
 * \ingroup core
 */
class value {
  public:
  /**
   * Constructor
   *
   * \param ptr Pointer to the object (must not be null)
   */
  constexpr explicit value(object *ptr) noexcept: m_ptr {ptr} { }

  /**
   * Construct `nil`
   */
  value() noexcept;

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality, see equal()
   */
  [[nodiscard]] bool
  operator == (value other) const;

  private:
  object *m_ptr; /**< Pointer to the object */
}; // class eqv::value


/**
 * Object cell
 *
 * \ingroup core
 */
struct object {
  /**
   * Constructor
   *
   * \note Payload is left uninitialized
   * \param tag Shape of the cell
   */
  object(enum tag tag): t {tag} { }

  enum tag t; /**< Shape tag */
  const eqv::type *ty = nullptr; /**< Type descriptor (sequences and objects only) */
  union {
    bool boolean;
    int64_t integer;
    double real;
    struct { char *data; size_t len; } str;
    struct { object **data; size_t len, cap; } seq;
    struct { object **slots; size_t nslots; } obj;
  };
}; // struct eqv::object


extern const value True, False; /**< Boolean constants */
extern const value nil; /**< Null constant */


/**
 * \name Fundamental constructors
 * \{
 */

[[nodiscard]] inline value
boolean(bool x) noexcept
{ return x ? True : False; }

[[nodiscard]] inline value
integer(int64_t x)
{
  value ret {make_atomic<object>(tag::integer)};
  ret->integer = x;
  return ret;
}

[[nodiscard]] inline value
real(double x)
{
  value ret {make_atomic<object>(tag::real)};
  ret->real = x;
  return ret;
}

/**
 * Create a string value
 *
 * The contents are copied byte for byte; no encoding is assumed.
 *
 * \ingroup core
 */
[[nodiscard]] value
str(std::string_view x);

/**
 * Create an empty sequence
 *
 * \param t Sequence type of the new cell, `eqv.Sequence` if null
 * \throws std::invalid_argument If \p t is not a sequence type
 *
 * \ingroup core
 */
[[nodiscard]] value
make_sequence(const type *t = nullptr);

/**
 * Create an instance of a composite or value-struct type
 *
 * All fields start out as `nil`.
 *
 * \throws std::invalid_argument If \p t can not be instantiated this way
 *
 * \ingroup core
 */
[[nodiscard]] value
make_object(const type *t);

/**
 * Create an instance and initialize some of its fields
 *
 * \throws type_error If a value is not assignable to its field
 *
 * \ingroup core
 */
[[nodiscard]] value
make_object(const type *t,
            std::initializer_list<std::pair<std::string_view, value>> fields);

/** \} */


/**
 * \name Conversions from C++ types
 * \{
 */

[[nodiscard]] inline value
from(value x) noexcept
{ return x; }

[[nodiscard]] inline value
from(bool x) noexcept
{ return boolean(x); }

template <std::integral T>
requires (not std::same_as<T, bool>)
[[nodiscard]] value
from(T x)
{ return integer(static_cast<int64_t>(x)); }

template <std::floating_point T>
[[nodiscard]] value
from(T x)
{ return real(static_cast<double>(x)); }

[[nodiscard]] inline value
from(const char *x)
{ return str(x); }

[[nodiscard]] inline value
from(std::string_view x)
{ return str(x); }

[[nodiscard]] inline value
from(const std::string &x)
{ return str(x); }

/** \} */


/**
 * \name Type tests
 * \{
 */

[[nodiscard]] inline bool
isnil(value x) noexcept
{ return x->t == tag::nil; }

[[nodiscard]] inline bool
isbool(value x) noexcept
{ return x->t == tag::boolean; }

[[nodiscard]] inline bool
isint(value x) noexcept
{ return x->t == tag::integer; }

[[nodiscard]] inline bool
isreal(value x) noexcept
{ return x->t == tag::real; }

[[nodiscard]] inline bool
isstr(value x) noexcept
{ return x->t == tag::str; }

[[nodiscard]] inline bool
isseq(value x) noexcept
{ return x->t == tag::seq; }

[[nodiscard]] inline bool
isobj(value x) noexcept
{ return x->t == tag::obj; }

/**
 * Get the runtime type of a value
 *
 * \return Type descriptor, or null for `nil`
 *
 * \ingroup core
 */
[[nodiscard]] const type*
type_of(value x);

/** \} */


/**
 * \name Accessors
 * \{
 */

[[nodiscard]] inline bool
bool_val(value x)
{
  if (not isbool(x))
    throw std::invalid_argument {"bool_val() - not a boolean"};
  return x->boolean;
}

[[nodiscard]] inline int64_t
int_val(value x)
{
  if (not isint(x))
    throw std::invalid_argument {"int_val() - not an integer"};
  return x->integer;
}

[[nodiscard]] inline double
real_val(value x)
{
  if (not isreal(x))
    throw std::invalid_argument {"real_val() - not a real"};
  return x->real;
}

[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

[[nodiscard]] inline size_t
seq_length(value x)
{
  if (not isseq(x))
    throw std::invalid_argument {"seq_length() - not a sequence"};
  return x->seq.len;
}

/**
 * Get an element of a sequence
 *
 * \throws std::invalid_argument If \p x is not a sequence
 * \throws std::out_of_range If \p i is past the end
 */
[[nodiscard]] value
seq_ref(value x, size_t i);

void
set_element(value x, size_t i, value elt);

void
push_back(value x, value elt);

/**
 * Get a field of an object by slot number
 *
 * Slots are laid out in the order of type::fields().
 */
[[nodiscard]] value
field_ref(value x, size_t slot);

[[nodiscard]] value
get_field(value x, std::string_view name);

/**
 * Assign a field
 *
 * \throws std::invalid_argument If there is no such field
 * \throws type_error If \p field is not an instance of the declared type
 */
void
set_field(value x, std::string_view name, value field);

/** \} */


/**
 * \name Sequence constructors
 * \{
 */

/**
 * Create an `eqv.Sequence` holding the given elements
 *
 * Elements are converted with from().
 *
 * \ingroup core
 */
template <typename ...Elts>
[[nodiscard]] value
sequence(Elts&& ...elts)
{
  const value ret = make_sequence();
  (push_back(ret, from(std::forward<Elts>(elts))), ...);
  return ret;
}

/**
 * Create an `eqv.Sequence` from a range of convertible elements
 *
 * \ingroup core
 */
template <std::ranges::input_range Range>
[[nodiscard]] value
sequence_of(Range &&range)
{
  const value ret = make_sequence();
  for (auto &&x : range)
    push_back(ret, from(x));
  return ret;
}

/** \} */


/**
 * \name Basic functions
 * \{
 */

/**
 * Check if two values are the same cell
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
is(value a, value b) noexcept
{ return &*a == &*b; }

/**
 * Shallow structural equality
 *
 * Values are equal when they have the same tag, the same type and equal
 * payload, comparing elements and fields recursively. Cycles are handled.
 * Custom equality of nested value types is not consulted; use the
 * equivalence engine for member-aware comparison.
 *
 * Two NaN reals are considered equal.
 *
 * \ingroup core
 */
[[nodiscard]] bool
equal(value a, value b);

/** \} */


/**
 * Write value with the default printer
 *
 * \ingroup core
 */
void
write(std::ostream &os, value x);

inline std::ostream&
operator << (std::ostream &os, value x)
{ write(os, x); return os; }

} // namespace eqv

inline
eqv::value::value() noexcept
: m_ptr {&*eqv::nil}
{ }

inline bool
eqv::value::operator == (eqv::value other) const
{ return eqv::equal(*this, other); }
