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


#include "eqv/format.hpp"
#include "eqv/printer.hpp"
#include "eqv/value.hpp"
#include "sample_types.hpp"

#include <gtest/gtest.h>
#include <format>
#include <sstream>
#include <string>

namespace {

class PrintValueTest: public ::testing::Test {
  protected:
  static std::string
  print(eqv::value x)
  { return eqv::default_printer(x); }
};


TEST_F(PrintValueTest, Scalars)
{
  EXPECT_EQ(print(eqv::nil), "null");
  EXPECT_EQ(print(eqv::True), "true");
  EXPECT_EQ(print(eqv::False), "false");
  EXPECT_EQ(print(eqv::integer(-12)), "-12");
  EXPECT_EQ(print(eqv::real(0.5)), "0.5");
}

TEST_F(PrintValueTest, Strings)
{
  EXPECT_EQ(print(eqv::str("plain")), "\"plain\"");
  EXPECT_EQ(print(eqv::str("say \"hi\"")), "\"say \\\"hi\\\"\"");
  EXPECT_EQ(print(eqv::str("a\nb")), "\"a\\x0ab\"");
}

TEST_F(PrintValueTest, Sequences)
{
  EXPECT_EQ(print(eqv::sequence()), "[]");
  EXPECT_EQ(print(eqv::sequence(1, "two", eqv::sequence(3))), "[1, \"two\", [3]]");

  const eqv::value seq = eqv::sequence(1);
  eqv::push_back(seq, seq);
  EXPECT_EQ(print(seq), "[1, ...]");
}

TEST_F(PrintValueTest, Objects)
{
  EXPECT_EQ(print(samples::make_person("Alice", 30)),
            "Samples.Person { Name = \"Alice\", Age = 30 }");
  EXPECT_EQ(print(eqv::make_object(samples::ticker())), "Samples.Ticker {}");

  const eqv::value node = samples::make_node("loop");
  eqv::set_field(node, "Next", node);
  EXPECT_EQ(print(node), "Samples.Node { Label = \"loop\", Next = Samples.Node {...} }");
}

TEST_F(PrintValueTest, MaxDepth)
{
  const eqv::value x = eqv::sequence(1, eqv::sequence(2, eqv::sequence(3)));

  const eqv::printer shallow {1};
  EXPECT_EQ(shallow(x), "[1, [...]]");
  EXPECT_EQ(shallow.maxdepth(), 1);

  std::ostringstream buf;
  eqv::default_printer.write(buf, x, 0);
  EXPECT_EQ(buf.str(), "[...]");

  EXPECT_EQ(eqv::printer {1}(samples::make_person("Bob", 5)),
            "Samples.Person { Name = \"Bob\", Age = 5 }");
  EXPECT_EQ(eqv::printer {0}(samples::make_person("Bob", 5)),
            "Samples.Person {...}");
}

TEST_F(PrintValueTest, StreamAndFormat)
{
  std::ostringstream buf;
  buf << eqv::sequence(1, 2);
  EXPECT_EQ(buf.str(), "[1, 2]");

  const eqv::value x = eqv::sequence(eqv::sequence(1));
  EXPECT_EQ(std::format("{}", x), "[[1]]");
  EXPECT_EQ(std::format("{:#1}", x), "[[...]]");
}

} // anonymous namespace
