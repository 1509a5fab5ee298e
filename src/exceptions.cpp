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


#include "eqv/exceptions.hpp"

#include <format>


eqv::unsupported_shape::unsupported_shape(const type *shape,
                                          std::string_view member)
: runtime_error(std::format("Comparing types that have indexers is not "
                            "supported ({}.{})",
                            shape->full_name(), member)),
  m_shape {shape},
  m_member {member}
{ }
