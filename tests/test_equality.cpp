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


#include "eqv/value.hpp"
#include "sample_types.hpp"

#include <gtest/gtest.h>
#include <limits>

namespace {

// Test fixture for equality tests
class EqualityTest: public ::testing::Test { };

// Test equality of identical objects (is)
TEST_F(EqualityTest, IdenticalObjects)
{
  eqv::value val = eqv::str("test");

  // Same object should be equal
  EXPECT_TRUE(eqv::is(val, val));
  EXPECT_TRUE(eqv::equal(val, val));
}

// Test equality of nil
TEST_F(EqualityTest, Nil)
{
  EXPECT_TRUE(eqv::equal(eqv::nil, eqv::nil));
  EXPECT_TRUE(eqv::equal(eqv::nil, eqv::value {}));

  // nil should not be equal to other types
  EXPECT_FALSE(eqv::equal(eqv::nil, eqv::str("null")));
  EXPECT_FALSE(eqv::equal(eqv::nil, eqv::False));
}

// Test equality of numbers
TEST_F(EqualityTest, Numbers)
{
  eqv::value num1 = eqv::integer(42);
  eqv::value num2 = eqv::integer(42);
  eqv::value num3 = eqv::integer(7);

  // Different objects with same numeric value should be equal
  EXPECT_FALSE(eqv::is(num1, num2));
  EXPECT_TRUE(eqv::equal(num1, num2));
  EXPECT_FALSE(eqv::equal(num1, num3));

  EXPECT_TRUE(eqv::equal(eqv::real(3.14), eqv::real(3.14)));
  EXPECT_FALSE(eqv::equal(eqv::real(3.14), eqv::real(2.71)));

  // Integers and reals are never equal
  EXPECT_FALSE(eqv::equal(eqv::integer(1), eqv::real(1.0)));
}

TEST_F(EqualityTest, NaN)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(eqv::equal(eqv::real(nan), eqv::real(nan)));
  EXPECT_FALSE(eqv::equal(eqv::real(nan), eqv::real(0)));
}

// Test equality of strings
TEST_F(EqualityTest, Strings)
{
  eqv::value str1 = eqv::str("hello");
  eqv::value str2 = eqv::str("hello");
  eqv::value str3 = eqv::str("world");

  EXPECT_FALSE(eqv::is(str1, str2));
  EXPECT_TRUE(eqv::equal(str1, str2));
  EXPECT_FALSE(eqv::equal(str1, str3));

  // Embedded zeroes are part of the contents
  using namespace std::string_view_literals;
  EXPECT_FALSE(eqv::equal(eqv::str("a\0b"sv), eqv::str("a\0c"sv)));
}

// Test equality of booleans
TEST_F(EqualityTest, Booleans)
{
  EXPECT_TRUE(eqv::equal(eqv::True, eqv::True));
  EXPECT_TRUE(eqv::equal(eqv::False, eqv::boolean(false)));
  EXPECT_FALSE(eqv::equal(eqv::True, eqv::False));
}

// Test equality of sequences
TEST_F(EqualityTest, Sequences)
{
  eqv::value seq1 = eqv::sequence(1, 2, 3);
  eqv::value seq2 = eqv::sequence(1, 2, 3);
  eqv::value seq3 = eqv::sequence(1, 2, 4);

  EXPECT_FALSE(eqv::is(seq1, seq2));
  EXPECT_TRUE(eqv::equal(seq1, seq2));
  EXPECT_FALSE(eqv::equal(seq1, seq3));
  EXPECT_FALSE(eqv::equal(seq1, eqv::sequence(1, 2)));

  // Sequence types take part
  EXPECT_FALSE(eqv::equal(eqv::make_sequence(samples::tags()), eqv::sequence()));
}

// Test equality of nested sequences
TEST_F(EqualityTest, NestedSequences)
{
  eqv::value outer1 = eqv::sequence(eqv::sequence(1, 2), "end");
  eqv::value outer2 = eqv::sequence(eqv::sequence(1, 2), "end");
  EXPECT_TRUE(eqv::equal(outer1, outer2));
}

// Test equality of objects
TEST_F(EqualityTest, Objects)
{
  EXPECT_TRUE(eqv::equal(samples::make_person("Alice", 30),
                         samples::make_person("Alice", 30)));
  EXPECT_FALSE(eqv::equal(samples::make_person("Alice", 30),
                          samples::make_person("Alice", 31)));

  // Same fields but different types
  const eqv::value a = eqv::make_object(samples::a(), {{"X", eqv::integer(1)}});
  const eqv::value b = eqv::make_object(samples::b(), {{"X", eqv::integer(1)}});
  EXPECT_FALSE(eqv::equal(a, b));
}

// Test equality of different types
TEST_F(EqualityTest, DifferentTypes)
{
  eqv::value num = eqv::integer(42);
  eqv::value str = eqv::str("42");
  eqv::value seq = eqv::sequence(42);

  EXPECT_FALSE(eqv::equal(num, str));
  EXPECT_FALSE(eqv::equal(num, seq));
  EXPECT_FALSE(eqv::equal(str, seq));
}

// Test equality with cyclic structures
TEST_F(EqualityTest, CyclicStructures)
{
  // Two nodes pointing to themselves
  eqv::value cycle1 = samples::make_node("a");
  eqv::value cycle2 = samples::make_node("a");
  set_field(cycle1, "Next", cycle1);
  set_field(cycle2, "Next", cycle2);

  EXPECT_TRUE(eqv::equal(cycle1, cycle2));

  eqv::value cycle3 = samples::make_node("b");
  set_field(cycle3, "Next", cycle3);
  EXPECT_FALSE(eqv::equal(cycle1, cycle3));

  // Self-containing sequences
  eqv::value seq1 = eqv::sequence(1);
  eqv::value seq2 = eqv::sequence(1);
  push_back(seq1, seq1);
  push_back(seq2, seq2);
  EXPECT_TRUE(eqv::equal(seq1, seq2));
}

// Test equality with shared substructures
TEST_F(EqualityTest, SharedSubstructures)
{
  eqv::value shared = eqv::sequence(1, 2);

  eqv::value struct1 = eqv::sequence(shared, "end");
  eqv::value struct2 = eqv::sequence(shared, "end");

  EXPECT_TRUE(eqv::equal(struct1, struct2));
  EXPECT_TRUE(eqv::is(seq_ref(struct1, 0), seq_ref(struct2, 0)));
}

// Test operator ==
TEST_F(EqualityTest, Operator)
{
  EXPECT_TRUE(eqv::sequence(1, "two") == eqv::sequence(1, "two"));
  EXPECT_FALSE(eqv::integer(1) == eqv::integer(2));
  EXPECT_EQ(eqv::str("same"), eqv::str("same"));
}

} // anonymous namespace
