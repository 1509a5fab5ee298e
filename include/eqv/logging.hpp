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

#include "eqv/format.hpp" // IWYU pragma: export

#include <array>
#include <cstddef>
#include <format>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

/**
 * \file logging.hpp
 * Leveled diagnostics on stderr
 *
 * Messages are formatted with std::format and prefixed with the current
 * nesting depth, see eqv::indent.
 *
 * \ingroup utils
 */


namespace eqv {

enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

namespace detail {

inline constexpr std::array<std::string_view, 5> loglevel_names {
  "silent", "error", "warning", "info", "debug"
};

} // namespace eqv::detail

inline std::string_view
loglevel_name(loglevel lvl)
{ return detail::loglevel_names.at(static_cast<size_t>(lvl)); }

/**
 * \throws std::runtime_error If \p name is not one of the level names
 */
inline loglevel
parse_loglevel(std::string_view name)
{
  for (size_t i = 0; i < detail::loglevel_names.size(); ++i)
  {
    if (detail::loglevel_names[i] == name)
      return static_cast<loglevel>(i);
  }
  throw std::runtime_error {std::format("Invalid loglevel name ({})", name)};
}

inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


/** Nesting depth of log messages */
extern size_t logging_indent;

/** Process-wide verbosity, `warning` unless changed */
extern loglevel loglevel;


/**
 * Prefix every line of \p text with \p prefix
 */
[[nodiscard]] inline std::string
indent_lines(std::string_view prefix, const std::string &text)
{
  std::istringstream input {text};
  std::string result, line;
  while (std::getline(input, line))
  {
    result += prefix;
    result += line;
    result += '\n';
  }
  return result;
}


namespace detail {

inline std::string
nesting_prefix(size_t depth)
{
  std::string prefix;
  for (size_t i = 1; i < depth; ++i)
    prefix += "\033[2m¦\033[0m ";
  if (depth > 0)
    prefix += "| ";
  return prefix;
}

template <typename... Args> void
log(enum loglevel level, std::string_view label,
    std::format_string<Args...> fmt, Args &&...args)
{
  if (not (eqv::loglevel >= level))
    return;
  const std::string text = std::format(fmt, std::forward<Args>(args)...);
  std::cerr << "eqv " << label << ' '
            << indent_lines(nesting_prefix(logging_indent), text);
}

} // namespace eqv::detail


/**
 * Compiled out with `EQV_RELEASE_BUILD`
 */
template <typename... Args> void
debug([[maybe_unused]] std::format_string<Args...> fmt,
      [[maybe_unused]] Args &&...args)
{
#ifndef EQV_RELEASE_BUILD
  detail::log(loglevel::debug, "\033[7;1mdebug\033[0m", fmt,
              std::forward<Args>(args)...);
#endif
}

template <typename... Args> void
info(std::format_string<Args...> fmt, Args &&...args)
{ detail::log(loglevel::info, "info", fmt, std::forward<Args>(args)...); }

template <typename... Args> void
warning(std::format_string<Args...> fmt, Args &&...args)
{
  detail::log(loglevel::warning, "\033[38;5;3;1mwarning\033[0m", fmt,
              std::forward<Args>(args)...);
}

template <typename... Args> void
error(std::format_string<Args...> fmt, Args &&...args)
{
  detail::log(loglevel::error, "\033[38;5;1;1merror\033[0m", fmt,
              std::forward<Args>(args)...);
}


/**
 * Nest log messages for the lifetime of the object
 */
struct indent {
  explicit indent(size_t depth = 1)
  : m_depth {depth}
  { logging_indent += m_depth; }

  ~indent()
  { logging_indent -= m_depth; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  size_t m_depth;
}; // struct eqv::indent

} // namespace eqv
