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

#include "mallow/token.hpp"
#include "mallow/exceptions.hpp"

#include <optional>
#include <string_view>

/**
 * \file tokenizer.hpp
 * Tokenizer splitting source text into byte-range tokens
 *
 * \ingroup lisp
 */


namespace mlw {

/**
 * Split \p buffer into tokens
 *
 * Whitespace (space, tab, newline and comma) separates tokens and is never
 * part of one. Bytes are not decoded, so multi-byte UTF-8 sequences end up
 * inside atoms, strings and comments as they are.
 *
 * \param buffer Source text; must outlive returned tokens
 * \param source_name Name of the source used in error locations
 * \return Tokens in order of their start offsets
 * \throws unterminated_string If a string literal is not closed
 *
 * \ingroup lisp
 */
[[nodiscard]] token_sequence
tokenize(std::string_view buffer, std::string_view source_name = "<string>");


namespace detail {

[[nodiscard]] constexpr bool
is_whitespace(char c) noexcept
{ return c == ' ' or c == ',' or c == '\t' or c == '\n'; }

[[nodiscard]] constexpr bool
is_special(char c) noexcept
{
  switch (c)
  {
    case '(': case ')': case '[': case ']': case '{': case '}':
    case '\'': case '`': case '~': case '^': case '@':
      return true;
    default:
      return false;
  }
}

// Sub-scanners used by tokenize(). Each one inspects \p buffer at \p cursor
// and, on a match, advances \p cursor past the recognized token.

/**
 * Move \p cursor past whitespace
 *
 * \return False if end of \p buffer was reached
 */
bool
skip_whitespace(std::string_view buffer, size_t &cursor) noexcept;

/** Two-character splice-unquote marker `~@` */
[[nodiscard]] std::optional<token>
scan_marker(std::string_view buffer, size_t &cursor) noexcept;

/** Single bracket or reader-macro character */
[[nodiscard]] std::optional<token>
scan_special(std::string_view buffer, size_t &cursor) noexcept;

/**
 * String literal including both quotes
 *
 * \throws unterminated_string If end of \p buffer precedes the closing quote
 */
[[nodiscard]] std::optional<token>
scan_string(std::string_view buffer, size_t &cursor,
            std::string_view source_name = "<string>");

/** Comment from `;` up to (not including) the next newline */
[[nodiscard]] std::optional<token>
scan_comment(std::string_view buffer, size_t &cursor) noexcept;

/** Maximal run of bytes not starting any other token class */
[[nodiscard]] std::optional<token>
scan_atom(std::string_view buffer, size_t &cursor) noexcept;

} // namespace mlw::detail

} // namespace mlw
