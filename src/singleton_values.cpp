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


////////////////////////////////////////////////////////////////////////////////
//
//                             Booleans
//
static eqv::object*
_initialize_boolean(eqv::object *ptr, bool val)
{
  ptr->boolean = val;
  return ptr;
}

static
eqv::object True_object {eqv::tag::boolean}, False_object {eqv::tag::boolean};
const eqv::value eqv::True {_initialize_boolean(&True_object, true)},
                 eqv::False {_initialize_boolean(&False_object, false)};

////////////////////////////////////////////////////////////////////////////////
//
//                              Nil
//
static
eqv::object nil_object {eqv::tag::nil};
const eqv::value eqv::nil {&nil_object};
