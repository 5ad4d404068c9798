/*
 * Mallow - Reader for a small Lisp-family language
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

#include "mallow/format.hpp" // IWYU pragma: export

#include <cstddef>
#include <exception>
#include <ostream>
#include <string>
#include <string_view>
#include <sys/types.h>


namespace mlw {

enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

inline std::string_view
loglevel_name(loglevel lvl)
{
  switch (lvl)
  {
    case loglevel::silent: return "silent";
    case loglevel::error: return "error";
    case loglevel::warning: return "warning";
    case loglevel::info: return "info";
    case loglevel::debug: return "debug";
  }
  std::terminate();
}

loglevel
parse_loglevel(std::string_view name);


inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


extern size_t logging_indent;

extern loglevel loglevel;

extern std::ostream *log_stream;

/** Keep ANSI colors in log records; off when the log is not a terminal */
extern bool log_colors;


struct add_indent {
  add_indent(size_t indent): m_indent {indent} { }

  inline friend std::ostream&
  operator << (std::ostream &os, const add_indent &self) noexcept
  {
    for (size_t i = 1; i < self.m_indent; ++i)
      os << "\e[2m¦\e[0m ";
    if (self.m_indent > 0)
      os << "| ";
    return os;
  }

  private:
  size_t m_indent;
};


namespace detail {

/**
 * Write a log record to the log stream
 *
 * First line of \p message follows the \p label, following lines are
 * indented according to the current logging indentation.
 */
void
log_message(std::string_view label, const std::string &message);

} // namespace mlw::detail


template <typename... Args> void
debug([[maybe_unused]] Args &&...args)
{
#ifndef MALLOW_RELEASE_BUILD
  if (loglevel >= loglevel::debug)
    detail::log_message("\e[7;1mdebug\e[0m",
                        detail::concat(std::forward<Args>(args)...));
#endif
}


template <typename... Args> void
info(Args &&...args)
{
  if (loglevel >= loglevel::info)
    detail::log_message("", detail::concat(std::forward<Args>(args)...));
}


template <typename... Args> void
warning(Args &&...args)
{
  if (loglevel >= loglevel::warning)
    detail::log_message("\e[38;5;3;1mwarning\e[0m",
                        detail::concat(std::forward<Args>(args)...));
}


template <typename... Args> void
error(Args &&...args)
{
  if (loglevel >= loglevel::error)
    detail::log_message("\e[38;5;1;1merror\e[0m",
                        detail::concat(std::forward<Args>(args)...));
}


struct indent {
  indent(ssize_t inc = 1)
  : m_inc {inc}
  { logging_indent += m_inc; }

  ~indent()
  { logging_indent -= m_inc; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  ssize_t m_inc;
}; // struct mlw::indent

} // namespace mlw
