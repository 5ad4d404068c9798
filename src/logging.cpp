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


#include "mallow/logging.hpp"

#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>


namespace mlw {

size_t logging_indent = 0;

enum loglevel loglevel = loglevel::info;

std::ostream *log_stream = &std::cerr;

bool log_colors = true;

} // namespace mlw


enum mlw::loglevel
mlw::parse_loglevel(std::string_view name)
{
  if (name == "silent")
    return loglevel::silent;
  if (name == "error")
    return loglevel::error;
  if (name == "warning")
    return loglevel::warning;
  if (name == "info")
    return loglevel::info;
  if (name == "debug")
    return loglevel::debug;
  throw std::runtime_error {
      detail::concat("Invalid loglevel name (", name, ")")};
}


// Drop ANSI escape sequences (`\e[...m`) from a string
static std::string
_strip_escape_sequences(const std::string &input)
{
  static const std::regex escape_seq_regex("\\\e\\[[^m]*m");
  return std::regex_replace(input, escape_seq_regex, "");
}


void
mlw::detail::log_message(std::string_view label, const std::string &message)
{
  std::ostringstream record;

  record << "mallow ";
  if (not label.empty())
    record << label << ' ';

  std::istringstream input {message};
  std::string line;
  bool first = true;
  while (std::getline(input, line))
  {
    if (not first)
      record << "       " << add_indent(logging_indent + 1);
    else if (logging_indent > 0)
      record << add_indent(logging_indent);
    record << line << "\n";
    first = false;
  }

  // Empty messages still produce a record
  if (first)
    record << "\n";

  if (log_colors)
    *log_stream << record.str();
  else
    *log_stream << _strip_escape_sequences(record.str());
}
