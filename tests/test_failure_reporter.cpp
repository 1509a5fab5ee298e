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

#include "eqv/equivalence.hpp"
#include "eqv/failure_reporter.hpp"
#include "eqv/printer.hpp"
#include "sample_types.hpp"

#include <gtest/gtest.h>
#include <string>
#include <type_traits>

namespace {

class FailureReporterTest: public ::testing::Test {
  protected:
  static std::string
  message_of(eqv::value actual, eqv::value expected,
             std::optional<std::string_view> custom_message = std::nullopt)
  {
    try
    {
      eqv::should_be_equivalent_to(actual, expected, custom_message);
    }
    catch (const eqv::equivalence_mismatch &exn)
    {
      return exn.what();
    }
    ADD_FAILURE() << "values turned out equivalent";
    return {};
  }
};


// Writes the path only
class path_reporter: public eqv::failure_reporter {
  public:
  std::string
  render(const eqv::mismatch_report &report) const override
  {
    std::string ret;
    for (const std::string &segment : report.path)
      ret += "/" + segment;
    return ret;
  }
};


TEST_F(FailureReporterTest, MemberMismatch)
{
  const std::string message = message_of(samples::make_person("Alice", 4),
                                         samples::make_person("Alice", 5));
  EXPECT_EQ(message,
            "should_be_equivalent_to\n"
            "    Comparing object equivalence, at path:\n"
            "actual [Samples.Person]\n"
            "    Age [eqv.Integer]\n"
            "\n"
            "    Expected value to be\n"
            "5\n"
            "    but was\n"
            "4");
}

TEST_F(FailureReporterTest, CountMismatch)
{
  const std::string message = message_of(eqv::sequence(1, 2, 3),
                                         eqv::sequence(1, 2));
  EXPECT_EQ(message,
            "should_be_equivalent_to\n"
            "    Comparing object equivalence, at path:\n"
            "actual [eqv.Sequence]\n"
            "    Count\n"
            "\n"
            "    Expected value to be\n"
            "2\n"
            "    but was\n"
            "3");
}

TEST_F(FailureReporterTest, NullAtRoot)
{
  const std::string message = message_of(eqv::nil, eqv::str("text"));
  EXPECT_EQ(message,
            "should_be_equivalent_to\n"
            "    Comparing object equivalence, at path:\n"
            "actual\n"
            "\n"
            "    Expected value to be\n"
            "\"text\"\n"
            "    but was\n"
            "null");
}

TEST_F(FailureReporterTest, TypeMismatch)
{
  const eqv::value a = eqv::make_object(samples::a(), {{"X", eqv::integer(1)}});
  const eqv::value b = eqv::make_object(samples::b(), {{"X", eqv::integer(1)}});
  EXPECT_EQ(message_of(a, b),
            "should_be_equivalent_to\n"
            "    Comparing object equivalence, at path:\n"
            "actual\n"
            "\n"
            "    Expected value to be\n"
            "Samples.B\n"
            "    but was\n"
            "Samples.A");
}

TEST_F(FailureReporterTest, AdditionalInfo)
{
  const std::string message =
      message_of(eqv::str("abc"), eqv::str("abd"), "checksum of the header");
  EXPECT_EQ(message,
            "should_be_equivalent_to\n"
            "    Comparing object equivalence, at path:\n"
            "actual [eqv.String]\n"
            "\n"
            "    Expected value to be\n"
            "\"abd\"\n"
            "    but was\n"
            "\"abc\"\n"
            "\n"
            "Additional Info:\n"
            "    checksum of the header");
}

TEST_F(FailureReporterTest, RenderOperands)
{
  EXPECT_EQ(eqv::render_operand(eqv::integer(42), eqv::default_printer), "42");
  EXPECT_EQ(eqv::render_operand(samples::person(), eqv::default_printer),
            "Samples.Person");
  EXPECT_EQ(eqv::render_operand(static_cast<const eqv::type*>(nullptr),
                                eqv::default_printer),
            "null");
}

TEST_F(FailureReporterTest, PrinterOfDefaultReporter)
{
  // Nested containers elided past the first level
  const eqv::printer shallow {1};
  const eqv::default_failure_reporter reporter {shallow};
  const eqv::mismatch_report report {
      eqv::sequence(eqv::sequence(1)),
      eqv::sequence(eqv::sequence(2)),
      {" [eqv.Sequence]"},
      std::nullopt,
      "check"};
  EXPECT_EQ(reporter.render(report),
            "check\n"
            "    Comparing object equivalence, at path:\n"
            "actual [eqv.Sequence]\n"
            "\n"
            "    Expected value to be\n"
            "[[...]]\n"
            "    but was\n"
            "[[...]]");
}

TEST_F(FailureReporterTest, CustomReporter)
{
  const path_reporter reporter;
  const eqv::equivalence_checker checker {{}, reporter};

  try
  {
    checker.check(eqv::sequence(1, 2), eqv::sequence(1, 3));
    ADD_FAILURE() << "no exception thrown";
  }
  catch (const eqv::equivalence_mismatch &exn)
  {
    EXPECT_STREQ(exn.what(), "/ [eqv.Sequence]/Element [1] [eqv.Integer]");
  }
}

TEST_F(FailureReporterTest, CollaboratorsMustOutliveTheirUsers)
{
  // Temporaries would dangle once the constructor returns
  static_assert(not std::is_constructible_v<eqv::equivalence_checker,
                                            const eqv::equivalency_options&,
                                            path_reporter>);
  static_assert(not std::is_constructible_v<eqv::default_failure_reporter,
                                            eqv::printer>);

  static_assert(std::is_constructible_v<eqv::equivalence_checker,
                                        const eqv::equivalency_options&,
                                        const path_reporter&>);
  static_assert(std::is_constructible_v<eqv::default_failure_reporter,
                                        const eqv::printer&>);

  const path_reporter reporter;
  const eqv::equivalence_checker checker {{}, reporter};
  EXPECT_FALSE(checker.equivalent(eqv::integer(1), eqv::integer(2)));
}

} // anonymous namespace
