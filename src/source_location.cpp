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


#include "mallow/source_location.hpp"
#include "mallow/format.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>


static std::string_view
_safe_substr(std::string_view str, size_t start, size_t length)
{
  start = std::min(start, str.size());
  return str.substr(start, length);
}

static std::string_view
_safe_substr(std::string_view str, size_t start)
{
  start = std::min(start, str.size());
  return str.substr(start);
}

// Index of the line containing byte at \p offset
static size_t
_line_of(const std::vector<size_t> &line_offsets, size_t offset)
{
  const auto it =
      std::upper_bound(line_offsets.begin(), line_offsets.end(), offset);
  return std::distance(line_offsets.begin(), it) - 1;
}

std::string
mlw::display_location(const mlw::source_location &location,
                      std::string_view text, size_t context_lines,
                      std::string_view hlstyle, std::string_view ctxstyle,
                      std::string_view endstyle)
{
  if (location.start > text.size() or location.end > text.size() or
      location.start > location.end)
    return detail::concat("<invalid location in ", location.source, ">");

  // Find line and column information
  std::vector<size_t> line_offsets;
  line_offsets.push_back(0); // First line starts at offset 0
  for (size_t i = 0; i < text.size(); ++i)
  {
    if (text[i] == '\n')
      line_offsets.push_back(i + 1);
  }

  // Last byte of the region decides the end line; empty regions stay on the
  // start line
  const size_t last = location.end > location.start ? location.end - 1
                                                    : location.start;
  const size_t start_line = _line_of(line_offsets, location.start);
  const size_t end_line = _line_of(line_offsets, last);

  // Expand line range with context lines
  const size_t display_start =
      start_line > context_lines ? start_line - context_lines : 0;
  const size_t display_end =
      std::min(end_line + context_lines, line_offsets.size() - 1);

  // Build the output
  std::ostringstream output;
  output << "in " << location.source << ":" << start_line + 1 << ":"
         << location.start - line_offsets[start_line] + 1 << " to "
         << end_line + 1 << ":" << location.end - line_offsets[end_line] + 1
         << "\n";

  // Display the lines with context
  for (size_t i = display_start; i <= display_end; ++i)
  {
    // Calculate the end of this line
    size_t line_end =
        (i + 1 < line_offsets.size()) ? line_offsets[i + 1] - 1 : text.size();
    if (line_end > line_offsets[i] and text[line_end - 1] == '\r')
      line_end--; // Handle CRLF line endings

    // Extract the line content
    const std::string_view line =
        _safe_substr(text, line_offsets[i], line_end - line_offsets[i]);

    // Trailing newline of the buffer does not make a line of its own
    if (i == display_end and i > end_line and line.empty())
      break;

    // Format the line number
    output << std::setw(4) << i + 1 << " | " << ctxstyle;

    if (i >= start_line and i <= end_line)
    {
      // Columns of the highlighted region within this line
      const size_t begin_col =
          i == start_line ? location.start - line_offsets[i] : 0;
      const size_t end_col =
          i == end_line ? location.end - line_offsets[i] : line.size();

      output << _safe_substr(line, 0, begin_col);
      output << endstyle << hlstyle;
      output << _safe_substr(line, begin_col, end_col - begin_col);
      output << endstyle << ctxstyle; // Reset formatting
      output << _safe_substr(line, end_col);
    }
    else
    { // Regular line, no highlighting
      output << line;
    }

    output << endstyle << "\n";
  }

  return output.str();
}
