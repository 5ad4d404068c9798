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

#include <deque>
#include <string>
#include <string_view>

/**
 * \file lisp_reader.hpp
 * Lisp reader implementation
 *
 * This file defines a reader for Lisp-style expressions that allows
 * gradual parsing of text fragments.
 *
 * \ingroup lisp
 */


namespace mlw {

/**
 * Utility class allowing gradual parsing of text fragments into data trees
 *
 * Every fragment is treated as a line of text. Forms may span several
 * fragments; string literals may span several lines.
 *
 * \ingroup lisp
 */
class lisp_reader {
  public:
  explicit lisp_reader(std::string source_name = "<repl>");

  /**
   * Feed next line of text
   *
   * \throws read_error On malformed input; text buffered so far is dropped
   * (see failed_text())
   */
  void
  operator << (std::string_view input);

  /**
   * Take next complete form
   *
   * \return False if no complete form is available
   */
  bool
  operator >> (data &result);

  /** Check if an incomplete form is waiting for more text */
  [[nodiscard]] bool
  pending() const noexcept
  { return not m_pending.empty(); }

  /** Drop incomplete text and all forms not taken yet */
  void
  reset() noexcept;

  /** Text that the most recent failed read was performed on */
  [[nodiscard]] const std::string&
  failed_text() const noexcept
  { return m_failed_text; }

  [[nodiscard]] const std::string&
  source_name() const noexcept
  { return m_source_name; }

  private:
  std::string m_source_name;
  std::string m_pending;
  std::string m_failed_text;
  std::deque<data> m_values;
}; // class mlw::lisp_reader

} // namespace mlw
