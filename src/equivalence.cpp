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
#include "eqv/exceptions.hpp"
#include "eqv/hash.hpp"
#include "eqv/logging.hpp"
#include "eqv/stl/unordered_set.hpp"
#include "eqv/type.hpp"
#include "eqv/utilities/execution_timer.hpp"

#include <format>
#include <string>
#include <utility>
#include <variant>


namespace {

using _pair_of_cells = std::pair<const eqv::object*, const eqv::object*>;
using _visited_pairs =
    eqv::stl::unordered_set<_pair_of_cells, eqv::identity_pair_hash>;

struct _comparison_context {
  _visited_pairs visited;
  const eqv::equivalency_options &options;
  const eqv::failure_reporter &reporter;
  std::optional<std::string> custom_message;
  std::string_view invoking_name;
};

} // anonymous namespace


static void
_compare(eqv::value actual, eqv::value expected, const eqv::type *forced_type,
         eqv::comparison_path path, _comparison_context &ctx);


static const void*
_cell_of(const eqv::mismatch_operand &operand)
{
  const eqv::value *x = std::get_if<eqv::value>(&operand);
  return x ? static_cast<const void*>(&**x) : nullptr;
}


[[noreturn]] static void
_throw_mismatch(eqv::mismatch_operand actual, eqv::mismatch_operand expected,
                const eqv::comparison_path &path,
                const _comparison_context &ctx)
{
  eqv::gc_root pinned {_cell_of(expected), _cell_of(actual)};
  eqv::mismatch_report report {std::move(expected), std::move(actual), path,
                               ctx.custom_message,
                               std::string {ctx.invoking_name},
                               std::move(pinned)};
  const std::string message = ctx.reporter.render(report);
  throw eqv::equivalence_mismatch {std::move(report), message};
}


static eqv::comparison_path
_extend(const eqv::comparison_path &path, std::string segment)
{
  eqv::comparison_path ret = path;
  ret.push_back(std::move(segment));
  return ret;
}


static bool
_both_values_are_null(eqv::value actual, eqv::value expected,
                      const eqv::comparison_path &path,
                      const _comparison_context &ctx)
{
  if (isnil(expected))
  {
    if (isnil(actual))
      return true;

    _throw_mismatch(actual, expected, path, ctx);
  }
  else if (isnil(actual))
  {
    _throw_mismatch(actual, expected, path, ctx);
  }

  return false;
}


static const eqv::type*
_type_to_compare(eqv::value actual, eqv::value expected,
                 const eqv::comparison_path &path,
                 const _comparison_context &ctx)
{
  const eqv::type *expected_type = type_of(expected);
  const eqv::type *actual_type = type_of(actual);

  if (actual_type != expected_type)
    _throw_mismatch(actual_type, expected_type, path, ctx);

  return actual_type;
}


static void
_add_type_to_path(const eqv::type *type, eqv::comparison_path &path)
{
  std::string annotation = std::format(" [{}]", type->full_name());
  if (path.empty())
    path.push_back(std::move(annotation));
  else
    path.back() += annotation;
}


// Records the pair; true if it was already there
static bool
_already_compared(eqv::value actual, eqv::value expected,
                  _comparison_context &ctx)
{
  if (is(actual, expected))
    return true;
  return not ctx.visited.emplace(&*actual, &*expected).second;
}


static void
_compare_strings(eqv::value actual, eqv::value expected,
                 const eqv::comparison_path &path,
                 const _comparison_context &ctx)
{
  // Ordinal comparison, no normalization of any kind
  if (str_view(actual) != str_view(expected))
    _throw_mismatch(actual, expected, path, ctx);
}


static void
_compare_value_types(eqv::value actual, eqv::value expected,
                     const eqv::type *type, const eqv::comparison_path &path,
                     const _comparison_context &ctx)
{
  if (not type->equals(actual, expected))
    _throw_mismatch(actual, expected, path, ctx);
}


static void
_compare_sequences(eqv::value actual, eqv::value expected,
                   const eqv::comparison_path &path, _comparison_context &ctx)
{
  if (_already_compared(actual, expected, ctx))
  {
    eqv::debug("sequences already compared");
    return;
  }

  const size_t actual_length = seq_length(actual);
  const size_t expected_length = seq_length(expected);

  if (actual_length != expected_length)
  {
    _throw_mismatch(eqv::integer(actual_length),
                    eqv::integer(expected_length), _extend(path, "Count"),
                    ctx);
  }

  for (size_t i = 0; i < actual_length; ++i)
  {
    _compare(seq_ref(actual, i), seq_ref(expected, i), nullptr,
             _extend(path, std::format("Element [{}]", i)), ctx);
  }
}


static eqv::value
_get_property(eqv::value self, const eqv::property_info &property)
{
  const eqv::value ret = property.getter(self);
  if (not is_instance(ret, property.declared))
  {
    throw eqv::type_error {
        std::format("property {} of {} returned {} instead of {}",
                    property.name, type_of(self)->full_name(),
                    type_of(ret)->full_name(),
                    property.declared->full_name())};
  }
  return ret;
}


static void
_compare_fields(eqv::value actual, eqv::value expected, const eqv::type *type,
                const eqv::comparison_path &path, _comparison_context &ctx)
{
  for (const eqv::field_info &field : type->fields())
  {
    const eqv::value actual_value = field_ref(actual, field.slot);
    const eqv::value expected_value = field_ref(expected, field.slot);

    const eqv::type *forced_type =
        ctx.options.compare_using_runtime_types ? nullptr : field.declared;

    _compare(actual_value, expected_value, forced_type,
             _extend(path, field.name), ctx);
  }
}


static void
_compare_properties(eqv::value actual, eqv::value expected,
                    const eqv::type *type, const eqv::comparison_path &path,
                    _comparison_context &ctx)
{
  for (const eqv::property_info &property : type->properties())
  {
    // There is no general way to list all values behind an indexer
    if (property.is_indexer())
      throw eqv::unsupported_shape {type, property.name};

    const eqv::value actual_value = _get_property(actual, property);
    const eqv::value expected_value = _get_property(expected, property);

    const eqv::type *forced_type =
        ctx.options.compare_using_runtime_types ? nullptr : property.declared;

    _compare(actual_value, expected_value, forced_type,
             _extend(path, property.name), ctx);
  }
}


static void
_compare_reference_types(eqv::value actual, eqv::value expected,
                         const eqv::type *type,
                         const eqv::comparison_path &path,
                         _comparison_context &ctx)
{
  if (_already_compared(actual, expected, ctx))
  {
    eqv::debug("objects already compared");
    return;
  }

  _compare_fields(actual, expected, type, path, ctx);
  _compare_properties(actual, expected, type, path, ctx);
}


static void
_compare(eqv::value actual, eqv::value expected, const eqv::type *forced_type,
         eqv::comparison_path path, _comparison_context &ctx)
{
  if (_both_values_are_null(actual, expected, path, ctx))
    return;

  const eqv::type *type =
      forced_type ? forced_type : _type_to_compare(actual, expected, path, ctx);

  _add_type_to_path(type, path);

  eqv::debug("{}: {:#2} vs {:#2}", path.back(), actual, expected);
  eqv::indent _ {};

  switch (type->kind())
  {
    case eqv::type_kind::string:
      _compare_strings(actual, expected, path, ctx);
      break;

    case eqv::type_kind::sequence:
      _compare_sequences(actual, expected, path, ctx);
      break;

    case eqv::type_kind::value:
      _compare_value_types(actual, expected, type, path, ctx);
      break;

    case eqv::type_kind::object:
      _compare_reference_types(actual, expected, type, path, ctx);
      break;
  }
}


void
eqv::equivalence_checker::check(value actual, value expected,
                                std::optional<std::string_view> custom_message,
                                std::string_view invoking_name) const
{
  EQV_FUNCTION_BENCHMARK

  _comparison_context ctx {
      {},
      m_options,
      m_reporter,
      custom_message ? std::optional<std::string> {*custom_message}
                     : std::nullopt,
      invoking_name};
  _compare(actual, expected, nullptr, {}, ctx);
}


bool
eqv::equivalence_checker::equivalent(value actual, value expected) const
{
  try
  {
    check(actual, expected);
    return true;
  }
  catch (const equivalence_mismatch &exn)
  {
    debug("not equivalent:\n{}", exn.what());
    return false;
  }
}


void
eqv::should_be_equivalent_to(value actual, value expected,
                             const equivalency_options &options,
                             std::optional<std::string_view> custom_message)
{
  const equivalence_checker checker {options};
  checker.check(actual, expected, custom_message, "should_be_equivalent_to");
}


void
eqv::should_be_equivalent_to(value actual, value expected,
                             std::optional<std::string_view> custom_message)
{ should_be_equivalent_to(actual, expected, equivalency_options {}, custom_message); }


bool
eqv::is_equivalent(value actual, value expected,
                   const equivalency_options &options)
{
  const equivalence_checker checker {options};
  return checker.equivalent(actual, expected);
}
