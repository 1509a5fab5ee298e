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

#include "eqv/type.hpp"
#include "eqv/value.hpp"

#include <cstdint>
#include <span>
#include <string>

/**
 * \file sample_types.hpp
 * Types shared by the test suites
 *
 * Every type is defined on first use and lives for the rest of the process.
 */


namespace samples {

inline const eqv::type*
person()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Person"}
      .field("Name", eqv::string_type())
      .field("Age", eqv::integer_type())
      .property("IsAdult", eqv::boolean_type(), [](eqv::value self) {
        const eqv::value age = get_field(self, "Age");
        return isnil(age) ? eqv::nil : eqv::boolean(int_val(age) >= 18);
      })
      .define();
  return t;
}

inline const eqv::type*
node()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Node"}
      .field("Label", eqv::string_type())
      .field("Next", std::string {"Samples.Node"})
      .define();
  return t;
}

inline const eqv::type*
animal()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Animal"}
      .field("Name", eqv::string_type())
      .define();
  return t;
}

inline const eqv::type*
dog()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Dog"}
      .base(animal())
      .field("Breed", eqv::string_type())
      .define();
  return t;
}

inline const eqv::type*
cat()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Cat"}
      .base(animal())
      .field("Lives", eqv::integer_type())
      .define();
  return t;
}

inline const eqv::type*
owner()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Owner"}
      .field("Pet", animal())
      .define();
  return t;
}

// Value struct: compared as a whole
inline const eqv::type*
point()
{
  static const eqv::type *t =
      eqv::type_builder {"Samples.Point", eqv::type_kind::value}
          .field("X", eqv::real_type())
          .field("Y", eqv::real_type())
          .define();
  return t;
}

// Value struct with its own equality: angles equal modulo 360 degrees
inline const eqv::type*
angle()
{
  static const eqv::type *t =
      eqv::type_builder {"Samples.Angle", eqv::type_kind::value}
          .field("Degrees", eqv::integer_type())
          .equality([](eqv::value a, eqv::value b) {
            const int64_t x = int_val(get_field(a, "Degrees"));
            const int64_t y = int_val(get_field(b, "Degrees"));
            return (x - y) % 360 == 0;
          })
          .define();
  return t;
}

inline const eqv::type*
grid()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Grid"}
      .field("Width", eqv::integer_type())
      .field("Cells", eqv::sequence_type())
      .indexer("Item", eqv::integer_type(), {eqv::integer_type()},
               [](eqv::value self, std::span<const eqv::value> index) {
                 return seq_ref(get_field(self, "Cells"),
                                int_val(index.front()));
               })
      .define();
  return t;
}

inline const eqv::type*
line()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Line"}
      .field("Sku", eqv::string_type())
      .field("Quantity", eqv::integer_type())
      .define();
  return t;
}

inline const eqv::type*
order()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Order"}
      .field("Id", eqv::integer_type())
      .field("Lines", eqv::sequence_type())
      .field("Customer", person())
      .define();
  return t;
}

// Member declared as the root type
inline const eqv::type*
box()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Box"}
      .field("Content", eqv::object_type())
      .define();
  return t;
}

inline const eqv::type*
a()
{
  static const eqv::type *t = eqv::type_builder {"Samples.A"}
      .field("X", eqv::integer_type())
      .define();
  return t;
}

inline const eqv::type*
b()
{
  static const eqv::type *t = eqv::type_builder {"Samples.B"}
      .field("X", eqv::integer_type())
      .define();
  return t;
}

// Number of times Samples.Ticker::Ticks was read
inline int64_t ticker_reads = 0;

// Property-only type; every read of Ticks yields a new number
inline const eqv::type*
ticker()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Ticker"}
      .property("Ticks", eqv::integer_type(), [](eqv::value) {
        return eqv::integer(++ticker_reads);
      })
      .define();
  return t;
}

// Property lying about its type
inline const eqv::type*
liar()
{
  static const eqv::type *t = eqv::type_builder {"Samples.Liar"}
      .property("Number", eqv::integer_type(), [](eqv::value) {
        return eqv::str("forty-two");
      })
      .define();
  return t;
}

inline const eqv::type*
tags()
{
  static const eqv::type *t =
      eqv::type_builder {"Samples.Tags", eqv::type_kind::sequence}.define();
  return t;
}


inline eqv::value
make_person(std::string_view name, int64_t age)
{
  return eqv::make_object(person(), {{"Name", eqv::str(name)},
                                     {"Age", eqv::integer(age)}});
}

inline eqv::value
make_line(std::string_view sku, int64_t quantity)
{
  return eqv::make_object(line(), {{"Sku", eqv::str(sku)},
                                   {"Quantity", eqv::integer(quantity)}});
}

inline eqv::value
make_point(double x, double y)
{
  return eqv::make_object(point(), {{"X", eqv::real(x)}, {"Y", eqv::real(y)}});
}

inline eqv::value
make_angle(int64_t degrees)
{ return eqv::make_object(angle(), {{"Degrees", eqv::integer(degrees)}}); }

inline eqv::value
make_node(std::string_view label, eqv::value next = eqv::nil)
{
  return eqv::make_object(node(), {{"Label", eqv::str(label)},
                                   {"Next", next}});
}

inline eqv::value
make_dog(std::string_view name, std::string_view breed)
{
  return eqv::make_object(dog(), {{"Name", eqv::str(name)},
                                  {"Breed", eqv::str(breed)}});
}

inline eqv::value
make_cat(std::string_view name, int64_t lives)
{
  return eqv::make_object(cat(), {{"Name", eqv::str(name)},
                                  {"Lives", eqv::integer(lives)}});
}

inline eqv::value
make_grid(int64_t width)
{
  return eqv::make_object(grid(), {{"Width", eqv::integer(width)},
                                   {"Cells", eqv::sequence(1, 2, 3)}});
}

} // namespace samples
