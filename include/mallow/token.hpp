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

#include <cassert>
#include <cstddef>
#include <string_view>
#include <vector>

/**
 * \file token.hpp
 * Lexical token representation
 *
 * \ingroup lisp
 */


namespace mlw {

/**
 * Half-open byte range `[start, end)` of a single lexical unit
 *
 * Token does not own any text, the buffer it was produced from must outlive
 * it.
 *
 * \ingroup lisp
 */
struct token {
  size_t start; ///< Offset of the first byte
  size_t end;   ///< Offset past the last byte

  /**
   * Bytes of \p buffer denoted by this token
   *
   * \param buffer Buffer the token was produced from
   */
  [[nodiscard]] std::string_view
  in(std::string_view buffer) const noexcept
  {
    assert(start < end);
    assert(end <= buffer.size());
    return buffer.substr(start, end - start);
  }

  [[nodiscard]] size_t
  length() const noexcept
  { return end - start; }

  bool
  operator == (const token &other) const = default;
}; // struct mlw::token


/** Tokens of a single buffer in source order */
using token_sequence = std::vector<token>;


/**
 * Syntactic class of a token, derived from its text
 *
 * \ingroup lisp
 */
enum class token_class {
  open_bracket,  ///< ( [ {
  close_bracket, ///< ) ] }
  reader_macro,  ///< ' ` ~ ~@ ^ @
  string,        ///< "..."
  comment,       ///< ;...
  atom,          ///< anything else
};

[[nodiscard]] inline token_class
classify(std::string_view text) noexcept
{
  assert(not text.empty());
  switch (text[0])
  {
    case '(': case '[': case '{':
      return token_class::open_bracket;

    case ')': case ']': case '}':
      return token_class::close_bracket;

    case '\'': case '`': case '~': case '^': case '@':
      return token_class::reader_macro;

    case '"':
      return token_class::string;

    case ';':
      return token_class::comment;

    default:
      return token_class::atom;
  }
}

} // namespace mlw
