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

#include <sstream>
#include <string>
#include <utility>

/**
 * \file format.hpp
 * Formatting utilities
 *
 * Stream-based message composition used by logging and error reporting.
 * Any type with an `operator <<` can take part in a message.
 *
 * \ingroup utils
 */


namespace mlw {

/**
 * \namespace mlw::detail
 * Implementation details
 */
namespace detail {

/**
 * Format a single value to an output stream
 *
 * \tparam Os Output stream type
 * \tparam Head Value type
 * \param os Output stream
 * \param head Value to format
 *
 * \ingroup utils
 */
template <typename Os, typename Head>
void
format(Os &os, Head&& head)
{ os << std::forward<Head>(head); }

/**
 * Format multiple values to an output stream
 *
 * \tparam Os Output stream type
 * \tparam Head First value type
 * \tparam Tail Rest of value types
 * \param os Output stream
 * \param head First value to format
 * \param tail Rest of values to format
 *
 * \ingroup utils
 */
template <typename Os, typename Head, typename ...Tail>
void
format(Os &os, Head&& head, Tail&& ...tail)
{
  os << std::forward<Head>(head);
  return format(os, std::forward<Tail>(tail)...);
}

/**
 * Concatenate string representations of all arguments
 *
 * \ingroup utils
 */
template <typename ...Args>
[[nodiscard]] std::string
concat(Args&& ...args)
{
  std::ostringstream buf;
  if constexpr (sizeof...(Args) > 0)
    format(buf, std::forward<Args>(args)...);
  return std::move(buf).str();
}

} // namespace mlw::detail

} // namespace mlw
