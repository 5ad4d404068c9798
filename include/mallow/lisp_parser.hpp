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
#include "mallow/exceptions.hpp"
#include "mallow/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file lisp_parser.hpp
 * Parser building data trees from token sequences
 *
 * \ingroup lisp
 */


namespace mlw {

/**
 * Maximal depth of nested lists and reader macros
 *
 * Deeper input raises nesting_too_deep instead of exhausting the stack.
 *
 * \ingroup lisp
 */
inline constexpr size_t max_nesting_depth = 1000;


/**
 * Result of parsing a single form
 *
 * \ingroup lisp
 */
struct parse_result {
  data form;       ///< First complete form
  size_t consumed; ///< Number of tokens consumed, including skipped comments
};


/**
 * Parse the first form of \p tokens
 *
 * \param tokens Tokens of \p buffer as produced by tokenize()
 * \param buffer Text the tokens refer to
 * \param source_name Name of the source used in error locations
 * \throws no_form If \p tokens hold nothing but comments
 * \throws unexpected_eof If a list or a reader macro is left incomplete
 * \throws unbalanced_close On a closing bracket without an opening one
 * \throws mismatched_bracket On a closing bracket of a wrong kind
 * \throws invalid_number On an integer literal out of range
 * \throws nesting_too_deep If forms nest deeper than max_nesting_depth
 *
 * \ingroup lisp
 */
[[nodiscard]] parse_result
parse(const token_sequence &tokens, std::string_view buffer,
      std::string_view source_name = "<string>");

/**
 * Parse a form starting at \p pos
 *
 * On success \p pos is moved past the consumed tokens; if an exception is
 * thrown \p pos is left unchanged.
 *
 * \ingroup lisp
 */
[[nodiscard]] data
parse_form(const token_sequence &tokens, std::string_view buffer, size_t &pos,
           std::string_view source_name = "<string>");

/**
 * Tokenize \p buffer and parse its first form
 *
 * \ingroup lisp
 */
[[nodiscard]] data
read_str(std::string_view buffer, std::string_view source_name = "<string>");

/**
 * Tokenize \p buffer and parse all of its forms
 *
 * \ingroup lisp
 */
[[nodiscard]] std::vector<data>
read_all(std::string_view buffer, std::string_view source_name = "<string>");


/**
 * Resolve escape sequences in the body of a string literal
 *
 * \param body Text between the quotes
 */
[[nodiscard]] std::string
unescape(std::string_view body);

/**
 * Check if atom text denotes an integer (optional `-` followed by digits)
 */
[[nodiscard]] bool
is_number(std::string_view text) noexcept;

/**
 * Name of the symbol a reader-macro marker expands to
 *
 * \return Symbol name, or nothing if \p marker is not a reader macro
 */
[[nodiscard]] std::optional<std::string_view>
reader_macro_symbol(std::string_view marker) noexcept;

} // namespace mlw
