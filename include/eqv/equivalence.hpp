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

#include "eqv/exceptions.hpp"
#include "eqv/failure_reporter.hpp"
#include "eqv/value.hpp"

#include <optional>
#include <string_view>

/**
 * \file equivalence.hpp
 * Deep structural equivalence of object graphs
 *
 * Two graphs are walked in parallel: strings are compared byte for byte,
 * sequences position by position, value types with their own equality and
 * composite objects field by field, then property by property, in
 * declaration order. The first divergence raises equivalence_mismatch with
 * the path leading to it. Reference cycles and shared substructure are
 * compared once per pair of cells.
 *
 * Recursion depth follows the depth of the graphs; there is no limit.
 *
 * \ingroup equivalence
 */


namespace eqv {

/**
 * \ingroup equivalence
 */
struct equivalency_options {
  /**
   * Compare members using the runtime type of the values found there
   * instead of the declared type of the member
   *
   * With declared types, a member declared as a base type is compared
   * by the members of that base type only, and a member declared as
   * `eqv.Object` is not looked into at all.
   */
  bool compare_using_runtime_types = false;
}; // struct eqv::equivalency_options


/**
 * Equivalence checks with fixed options and failure reporter
 *
 * Holds no state between checks; a single checker may be shared.
 *
 * \ingroup equivalence
 */
class equivalence_checker {
  public:
  explicit equivalence_checker(const equivalency_options &options = {},
                               const failure_reporter &reporter = default_reporter)
  : m_options {options}, m_reporter {reporter}
  { }

  // The reporter is held by reference and must outlive the checker
  equivalence_checker(const equivalency_options&, const failure_reporter&&) = delete;

  /**
   * Compare two object graphs
   *
   * \param actual Graph under test
   * \param expected Reference graph
   * \param custom_message Passed to the failure reporter
   * \param invoking_name Name of the assertion, passed to the failure reporter
   * \throws equivalence_mismatch At the first divergence
   * \throws unsupported_shape If an indexer is met
   * \throws type_error If a property getter returns a value of a wrong type
   */
  void
  check(value actual, value expected,
        std::optional<std::string_view> custom_message = std::nullopt,
        std::string_view invoking_name = "should_be_equivalent_to") const;

  /**
   * Same as check(), but tells the outcome instead of throwing on mismatch
   *
   * \throws unsupported_shape If an indexer is met
   */
  [[nodiscard]] bool
  equivalent(value actual, value expected) const;

  [[nodiscard]] const equivalency_options&
  options() const noexcept
  { return m_options; }

  private:
  equivalency_options m_options;
  const failure_reporter &m_reporter;
}; // class eqv::equivalence_checker


/**
 * Assert that \p actual is structurally equivalent to \p expected
 *
 * \throws equivalence_mismatch At the first divergence
 * \throws unsupported_shape If an indexer is met
 *
 * \ingroup equivalence
 */
void
should_be_equivalent_to(value actual, value expected,
                        const equivalency_options &options,
                        std::optional<std::string_view> custom_message = std::nullopt);

/**
 * Same as above with default options
 *
 * \ingroup equivalence
 */
void
should_be_equivalent_to(value actual, value expected,
                        std::optional<std::string_view> custom_message = std::nullopt);

/**
 * \ingroup equivalence
 */
[[nodiscard]] bool
is_equivalent(value actual, value expected,
              const equivalency_options &options = {});

} // namespace eqv
