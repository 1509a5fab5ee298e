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


#include "eqv/type.hpp"
#include "eqv/exceptions.hpp"
#include "eqv/logging.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <map>
#include <memory>


using _registry_map =
    std::map<std::string, std::unique_ptr<eqv::type>, std::less<>>;

static _registry_map&
_registry()
{
  static _registry_map registry;
  return registry;
}

static const eqv::type*
_register(std::unique_ptr<eqv::type> t)
{
  const eqv::type *ret = t.get();
  const auto [it, inserted] =
      _registry().emplace(std::string {t->full_name()}, std::move(t));
  if (not inserted)
    throw eqv::type_error {
        std::format("type {} is already defined", it->first)};
  return ret;
}

static const eqv::type*
_builtin(std::string name, eqv::type_kind kind, const eqv::type *base)
{ return _register(std::make_unique<eqv::type>(std::move(name), kind, base)); }


const eqv::type*
eqv::object_type()
{
  static const type *t = _builtin("eqv.Object", type_kind::object, nullptr);
  return t;
}

const eqv::type*
eqv::boolean_type()
{
  static const type *t = _builtin("eqv.Boolean", type_kind::value, nullptr);
  return t;
}

const eqv::type*
eqv::integer_type()
{
  static const type *t = _builtin("eqv.Integer", type_kind::value, nullptr);
  return t;
}

const eqv::type*
eqv::real_type()
{
  static const type *t = _builtin("eqv.Real", type_kind::value, nullptr);
  return t;
}

const eqv::type*
eqv::string_type()
{
  static const type *t =
      _builtin("eqv.String", type_kind::string, object_type());
  return t;
}

const eqv::type*
eqv::sequence_type()
{
  static const type *t =
      _builtin("eqv.Sequence", type_kind::sequence, object_type());
  return t;
}

// Built-in names must be taken before any user type can claim them
static void
_ensure_builtins()
{
  static_cast<void>(eqv::object_type());
  static_cast<void>(eqv::boolean_type());
  static_cast<void>(eqv::integer_type());
  static_cast<void>(eqv::real_type());
  static_cast<void>(eqv::string_type());
  static_cast<void>(eqv::sequence_type());
}


std::string_view
eqv::type_kind_name(type_kind kind) noexcept
{
  switch (kind)
  {
    case type_kind::object: return "object";
    case type_kind::value: return "value";
    case type_kind::string: return "string";
    case type_kind::sequence: return "sequence";
  }
  return "<invalid>";
}


////////////////////////////////////////////////////////////////////////////////
//
//                              Descriptors
//
eqv::type::type(std::string name, type_kind kind, const type *base)
: m_name {std::move(name)}, m_kind {kind}, m_base {base}
{ }


const eqv::field_info*
eqv::type::find_field(std::string_view name) const noexcept
{
  const auto it = std::ranges::find(m_fields, name, &field_info::name);
  return it == m_fields.end() ? nullptr : &*it;
}


const eqv::property_info*
eqv::type::find_property(std::string_view name) const noexcept
{
  const auto it = std::ranges::find(m_properties, name, &property_info::name);
  return it == m_properties.end() ? nullptr : &*it;
}


bool
eqv::type::derives_from(const type *other) const noexcept
{
  for (const type *t = this; t != nullptr; t = t->m_base)
  {
    if (t == other)
      return true;
  }
  return false;
}


bool
eqv::type::equals(value a, value b) const
{ return m_equality ? m_equality(a, b) : equal(a, b); }


bool
eqv::is_assignable(const type *declared, const type *actual) noexcept
{
  if (declared == nullptr or actual == nullptr)
    return false;
  return declared == object_type() or actual->derives_from(declared);
}


bool
eqv::is_instance(value x, const type *declared)
{ return isnil(x) or is_assignable(declared, type_of(x)); }


const eqv::type*
eqv::find_type(std::string_view name)
{
  _ensure_builtins();
  const auto it = _registry().find(name);
  return it == _registry().end() ? nullptr : it->second.get();
}


////////////////////////////////////////////////////////////////////////////////
//
//                                Builder
//
eqv::type_builder::type_builder(std::string name, type_kind kind)
: m_name {std::move(name)},
  m_kind {kind},
  m_base {nullptr},
  m_has_base {false}
{ }


eqv::type_builder&
eqv::type_builder::base(const type *base)
{
  m_base = base;
  m_has_base = true;
  return *this;
}


eqv::type_builder&
eqv::type_builder::field(std::string name, const type *declared)
{
  m_fields.emplace_back(std::move(name), declared, std::string {});
  return *this;
}


eqv::type_builder&
eqv::type_builder::field(std::string name, std::string declared_name)
{
  m_fields.emplace_back(std::move(name), nullptr, std::move(declared_name));
  return *this;
}


eqv::type_builder&
eqv::type_builder::property(std::string name, const type *declared,
                            property_getter getter)
{
  m_properties.push_back({std::move(name), declared, std::move(getter), {}, {}});
  return *this;
}


eqv::type_builder&
eqv::type_builder::indexer(std::string name, const type *declared,
                           std::vector<const type*> index_parameters,
                           indexer_getter getter)
{
  if (index_parameters.empty())
    throw type_error {
        std::format("{}.{} - indexer without index parameters", m_name, name)};
  m_properties.push_back({std::move(name), declared, {},
                          std::move(index_parameters), std::move(getter)});
  return *this;
}


eqv::type_builder&
eqv::type_builder::equality(value_equality eq)
{
  m_equality = std::move(eq);
  return *this;
}


const eqv::type*
eqv::type_builder::define()
{
  _ensure_builtins();

  if (m_name.empty())
    throw type_error {"type without a name"};
  if (find_type(m_name) != nullptr)
    throw type_error {std::format("type {} is already defined", m_name)};

  // Resolve the base type
  const type *base = m_base;
  switch (m_kind)
  {
    case type_kind::object:
      if (not m_has_base)
        base = object_type();
      else if (base == nullptr or base->kind() != type_kind::object)
        throw type_error {
            std::format("{} - base of a composite type must be composite",
                        m_name)};
      break;

    case type_kind::sequence:
      if (not m_has_base)
        base = sequence_type();
      else if (base == nullptr or base->kind() != type_kind::sequence)
        throw type_error {
            std::format("{} - base of a sequence type must be a sequence",
                        m_name)};
      if (not m_fields.empty() or not m_properties.empty())
        throw type_error {
            std::format("{} - sequence types can't have members", m_name)};
      break;

    case type_kind::value:
      if (m_has_base)
        throw type_error {
            std::format("{} - value types can't have a base type", m_name)};
      break;

    case type_kind::string:
      throw type_error {
          std::format("{} - only eqv.String is a string type", m_name)};
  }

  if (m_equality and m_kind != type_kind::value)
    throw type_error {
        std::format("{} - equality can only be given to value types", m_name)};

  auto t = std::make_unique<type>(m_name, m_kind, base);
  if (base != nullptr)
  {
    t->m_fields.assign(base->m_fields.begin(), base->m_fields.end());
    t->m_properties.assign(base->m_properties.begin(),
                           base->m_properties.end());
  }

  auto check_name = [&](const std::string &name) {
    if (name.empty())
      throw type_error {std::format("{} - member without a name", m_name)};
    if (t->find_field(name) != nullptr or t->find_property(name) != nullptr)
      throw type_error {
          std::format("{} - member {} is declared twice", m_name, name)};
  };

  for (const _field_decl &decl : m_fields)
  {
    check_name(decl.name);

    const type *declared = decl.declared;
    if (declared == nullptr and not decl.declared_name.empty())
    {
      declared = decl.declared_name == m_name ? t.get()
                                              : find_type(decl.declared_name);
      if (declared == nullptr)
        throw type_error {
            std::format("{}.{} - unknown type {}", m_name, decl.name,
                        decl.declared_name)};
    }
    if (declared == nullptr)
      throw type_error {
          std::format("{}.{} - field without a type", m_name, decl.name)};

    t->m_fields.push_back({decl.name, declared, t->m_fields.size()});
  }

  for (const property_info &prop : m_properties)
  {
    check_name(prop.name);
    if (prop.declared == nullptr)
      throw type_error {
          std::format("{}.{} - property without a type", m_name, prop.name)};
    if (prop.is_indexer() ? not prop.indexed_getter : not prop.getter)
      throw type_error {
          std::format("{}.{} - property without a getter", m_name, prop.name)};
    t->m_properties.push_back(prop);
  }

  t->m_equality = m_equality;

  debug("defined {} type {} ({} fields, {} properties)",
        type_kind_name(m_kind), m_name, t->m_fields.size(),
        t->m_properties.size());
  return _register(std::move(t));
}
