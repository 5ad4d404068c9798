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

#include <cstddef>
#include <string>
#include <string_view>

/**
 * \file source_location.hpp
 * Source location tracking for reader diagnostics
 *
 * This file defines utilities for describing and displaying byte ranges of
 * the text handed to the reader.
 *
 * \ingroup lisp
 */

namespace mlw {

/**
 * Structure representing a location in the input buffer
 *
 * \ingroup lisp
 */
struct source_location {
  source_location() = default;

  source_location(std::string_view source_, size_t start, size_t end)
  : source {source_},
    start {start},
    end {end}
  { }

  bool
  operator == (const source_location &other) const = default;

  std::string source; ///< Source name (filepath, "<string>", "<repl>")
  size_t start = 0; ///< Start offset in the input buffer
  size_t end = 0;   ///< End offset in the input buffer (exclusive)
};

/**
 * Display a fragment of \p text according to location with surrounding
 * context and highlighting of the location region
 *
 * \param location Source location to display
 * \param text Buffer the location refers to
 * \param context_lines Number of context lines to show before and after the location
 * \param hlstyle Escape sequence starting the highlighted region
 * \param ctxstyle Escape sequence for the context around the region
 * \param endstyle Escape sequence resetting styles
 * \return Formatted string with the text fragment and highlighting
 */
[[nodiscard]] std::string
display_location(const source_location &location, std::string_view text,
                 size_t context_lines = 2,
                 std::string_view hlstyle = "\e[38;5;1;1m",
                 std::string_view ctxstyle = "",
                 std::string_view endstyle = "\e[0m");

} // namespace mlw
