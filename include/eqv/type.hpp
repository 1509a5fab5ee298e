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

#include "eqv/value.hpp"

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * \file type.hpp
 * Type descriptors and the type registry
 *
 * A type descriptor lists the members of a type in declaration order:
 * fields (stored in the slots of object cells) and properties (computed by
 * getters). Descriptors are built once with type_builder, registered under
 * their full name and live until the end of the program.
 *
 * \ingroup types
 */


namespace eqv {

/**
 * Shape of the instances of a type
 *
 * \ingroup types
 */
enum class type_kind {
  object,   /**< Reference type compared member by member */
  value,    /**< Type with atomic equality (scalars, value structs) */
  string,   /**< Text, compared byte for byte */
  sequence, /**< Ordered collection, compared position by position */
};

[[nodiscard]] std::string_view
type_kind_name(type_kind kind) noexcept;


struct field_info {
  std::string name;
  const type *declared;
  size_t slot;
}; // struct eqv::field_info

using property_getter = std::function<value(value self)>;
using indexer_getter =
    std::function<value(value self, std::span<const value> index)>;
using value_equality = std::function<bool(value a, value b)>;

/**
 * Property description
 *
 * A property with index parameters is an indexer; it has no value on its
 * own and is accessed with `indexed_getter` instead of `getter`.
 */
struct property_info {
  std::string name;
  const type *declared;
  property_getter getter;
  std::vector<const type*> index_parameters;
  indexer_getter indexed_getter;

  [[nodiscard]] bool
  is_indexer() const noexcept
  { return not index_parameters.empty(); }
}; // struct eqv::property_info


/**
 * Type descriptor
 *
 * \ingroup types
 */
class type {
  public:
  type(std::string name, type_kind kind, const type *base);

  type(const type&) = delete;
  void operator = (const type&) = delete;

  [[nodiscard]] std::string_view
  full_name() const noexcept
  { return m_name; }

  [[nodiscard]] type_kind
  kind() const noexcept
  { return m_kind; }

  [[nodiscard]] const type*
  base() const noexcept
  { return m_base; }

  /**
   * Public fields, inherited ones first, each group in declaration order
   */
  [[nodiscard]] std::span<const field_info>
  fields() const noexcept
  { return m_fields; }

  /**
   * Public properties, inherited ones first, each group in declaration order
   */
  [[nodiscard]] std::span<const property_info>
  properties() const noexcept
  { return m_properties; }

  [[nodiscard]] const field_info*
  find_field(std::string_view name) const noexcept;

  [[nodiscard]] const property_info*
  find_property(std::string_view name) const noexcept;

  /**
   * Check if this type is \p other or derives from it
   */
  [[nodiscard]] bool
  derives_from(const type *other) const noexcept;

  /**
   * Equality of two instances of a value type
   *
   * Uses the equality given at definition, or equal() if there was none.
   */
  [[nodiscard]] bool
  equals(value a, value b) const;

  private:
  friend class type_builder;

  std::string m_name;
  type_kind m_kind;
  const type *m_base;
  std::vector<field_info> m_fields;
  std::vector<property_info> m_properties;
  value_equality m_equality;
}; // class eqv::type


/**
 * Declare and register a new type
 *
 * Usage example:
 * \code
 * const type *person = type_builder {"Shop.Person"}
 *     .field("Name", string_type())
 *     .field("Age", integer_type())
 *     .define();
 * \endcode
 *
 * \ingroup types
 */
class type_builder {
  public:
  explicit type_builder(std::string name, type_kind kind = type_kind::object);

  /**
   * Set the base type
   *
   * Defaults to `eqv.Object` for composite types and to `eqv.Sequence` for
   * sequence types. Value types can not have a base.
   */
  type_builder&
  base(const type *base);

  type_builder&
  field(std::string name, const type *declared);

  /**
   * Declare a field whose type is looked up by name at define()
   *
   * This is the only way to declare a field of the type being defined.
   */
  type_builder&
  field(std::string name, std::string declared_name);

  type_builder&
  property(std::string name, const type *declared, property_getter getter);

  type_builder&
  indexer(std::string name, const type *declared,
          std::vector<const type*> index_parameters, indexer_getter getter);

  /**
   * Set equality of a value type
   */
  type_builder&
  equality(value_equality eq);

  /**
   * Validate the declaration and register the type
   *
   * \throws type_error If the declaration is invalid or the name is taken
   */
  const type*
  define();

  private:
  struct _field_decl {
    std::string name;
    const type *declared;
    std::string declared_name;
  };

  std::string m_name;
  type_kind m_kind;
  const type *m_base;
  bool m_has_base;
  std::vector<_field_decl> m_fields;
  std::vector<property_info> m_properties;
  value_equality m_equality;
}; // class eqv::type_builder


/**
 * Look up a registered type
 *
 * \return The type, or null if there is none with this name
 *
 * \ingroup types
 */
[[nodiscard]] const type*
find_type(std::string_view name);

/**
 * Check if instances of \p actual may be stored where \p declared is expected
 *
 * \ingroup types
 */
[[nodiscard]] bool
is_assignable(const type *declared, const type *actual) noexcept;

/**
 * Check if \p x may be stored where \p declared is expected
 *
 * `nil` is an instance of every type.
 *
 * \ingroup types
 */
[[nodiscard]] bool
is_instance(value x, const type *declared);


/**
 * \name Built-in types
 * \{
 */

/** Root of all types; has no members */
[[nodiscard]] const type* object_type();
[[nodiscard]] const type* boolean_type();
[[nodiscard]] const type* integer_type();
[[nodiscard]] const type* real_type();
[[nodiscard]] const type* string_type();
[[nodiscard]] const type* sequence_type();

/** \} */

} // namespace eqv
