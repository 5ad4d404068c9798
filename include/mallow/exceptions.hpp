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

#include "mallow/source_location.hpp"

#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * \file exceptions.hpp
 * Error types raised by the reader
 *
 * \ingroup lisp
 */


namespace mlw {

struct bad_code: std::runtime_error {
  bad_code(std::string_view what): runtime_error(std::string(what)) { }
  bad_code(std::string_view what, const source_location &location);

  [[nodiscard]] const std::optional<source_location>&
  location() const noexcept
  { return m_location; }

  /**
   * Write error message followed by the highlighted fragment of \p text
   * (when location is available)
   */
  void
  display(std::ostream &os, std::string_view text) const noexcept;

  std::string
  display(std::string_view text) const
  {
    std::ostringstream buf;
    display(buf, text);
    return buf.str();
  }

  private:
  std::optional<source_location> m_location;
}; // struct mlw::bad_code


/**
 * Kinds of reader failures
 *
 * \ingroup lisp
 */
enum class error_kind {
  unterminated_string, ///< String literal not closed before end of input
  unexpected_eof,      ///< List or reader macro incomplete at end of input
  unbalanced_close,    ///< Closing bracket without an open one
  mismatched_bracket,  ///< Closing bracket of a different kind than the open one
  no_form,             ///< Nothing but comments and whitespace left
  invalid_number,      ///< Integer literal out of range
  nesting_too_deep,    ///< Lists or reader macros nested beyond the limit
};

[[nodiscard]] std::string_view
error_kind_name(error_kind kind) noexcept;


/**
 * Base class for all errors raised by tokenizer and parser
 *
 * \ingroup lisp
 */
struct read_error: public bad_code {
  read_error(error_kind kind, std::string_view what)
  : bad_code {what}, m_kind {kind}
  { }

  read_error(error_kind kind, std::string_view what,
             const source_location &location)
  : bad_code {what, location}, m_kind {kind}
  { }

  [[nodiscard]] error_kind
  kind() const noexcept
  { return m_kind; }

  private:
  error_kind m_kind;
}; // struct mlw::read_error


struct unterminated_string: public read_error {
  explicit unterminated_string(const source_location &location)
  : read_error {error_kind::unterminated_string,
                "Unterminated string literal", location}
  { }
};

struct unexpected_eof: public read_error {
  unexpected_eof(std::string_view what, const source_location &location)
  : read_error {error_kind::unexpected_eof, what, location}
  { }
};

struct unbalanced_close: public read_error {
  explicit unbalanced_close(const source_location &location)
  : read_error {error_kind::unbalanced_close,
                "Closing bracket without matching opening bracket", location}
  { }
};

struct mismatched_bracket: public read_error {
  mismatched_bracket(std::string_view what, const source_location &location)
  : read_error {error_kind::mismatched_bracket, what, location}
  { }
};

struct no_form: public read_error {
  no_form()
  : read_error {error_kind::no_form, "No form to read"}
  { }
};

struct invalid_number: public read_error {
  invalid_number(std::string_view what, const source_location &location)
  : read_error {error_kind::invalid_number, what, location}
  { }
};

struct nesting_too_deep: public read_error {
  nesting_too_deep(std::string_view what, const source_location &location)
  : read_error {error_kind::nesting_too_deep, what, location}
  { }
};

} // namespace mlw
