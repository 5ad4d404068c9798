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

#include "mallow/data.hpp"

#include <ostream>
#include <string>
#include <string_view>

/**
 * \file printer.hpp
 * Textual representation of data trees
 *
 * \ingroup core
 */


namespace mlw {

/**
 * Write \p x to \p os
 *
 * With \p readably set, strings are quoted and escaped so that the output
 * reads back into an equal tree.
 *
 * \ingroup core
 */
void
print(std::ostream &os, const data &x, bool readably = true);

/**
 * Print \p x into a string
 *
 * \ingroup core
 */
[[nodiscard]] std::string
pr_str(const data &x, bool readably = true);

/**
 * Quote and escape \p text as a string literal
 *
 * \ingroup core
 */
[[nodiscard]] std::string
escape(std::string_view text);

inline std::ostream&
operator << (std::ostream &os, const data &x)
{
  print(os, x, true);
  return os;
}

} // namespace mlw
