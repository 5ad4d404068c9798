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


#include "mallow/tokenizer.hpp"


bool
mlw::detail::skip_whitespace(std::string_view buffer, size_t &cursor) noexcept
{
  while (cursor < buffer.size() and is_whitespace(buffer[cursor]))
    cursor++;
  return cursor < buffer.size();
}


std::optional<mlw::token>
mlw::detail::scan_marker(std::string_view buffer, size_t &cursor) noexcept
{
  if (buffer.substr(cursor, 2) != "~@")
    return std::nullopt;

  const token result {cursor, cursor + 2};
  cursor += 2;
  return result;
}


std::optional<mlw::token>
mlw::detail::scan_special(std::string_view buffer, size_t &cursor) noexcept
{
  if (cursor >= buffer.size() or not is_special(buffer[cursor]))
    return std::nullopt;

  const token result {cursor, cursor + 1};
  cursor += 1;
  return result;
}


std::optional<mlw::token>
mlw::detail::scan_string(std::string_view buffer, size_t &cursor,
                         std::string_view source_name)
{
  if (cursor >= buffer.size() or buffer[cursor] != '"')
    return std::nullopt;

  const size_t start = cursor;
  size_t pos = start + 1;
  while (pos < buffer.size())
  {
    switch (buffer[pos])
    {
      case '\\':
        // Escaped byte never terminates the literal
        pos += 2;
        break;

      case '"':
        cursor = pos + 1;
        return token {start, cursor};

      default:
        pos += 1;
    }
  }

  throw unterminated_string {source_location {source_name, start, buffer.size()}};
}


std::optional<mlw::token>
mlw::detail::scan_comment(std::string_view buffer, size_t &cursor) noexcept
{
  if (cursor >= buffer.size() or buffer[cursor] != ';')
    return std::nullopt;

  const size_t start = cursor;
  const size_t newline = buffer.find('\n', start);
  cursor = newline == std::string_view::npos ? buffer.size() : newline;
  return token {start, cursor};
}


std::optional<mlw::token>
mlw::detail::scan_atom(std::string_view buffer, size_t &cursor) noexcept
{
  const auto is_atom_byte = [](char c) {
    return not is_whitespace(c) and not is_special(c) and c != '"' and c != ';';
  };

  if (cursor >= buffer.size() or not is_atom_byte(buffer[cursor]))
    return std::nullopt;

  const size_t start = cursor;
  while (cursor < buffer.size() and is_atom_byte(buffer[cursor]))
    cursor++;
  return token {start, cursor};
}


mlw::token_sequence
mlw::tokenize(std::string_view buffer, std::string_view source_name)
{
  using namespace detail;

  token_sequence tokens;
  size_t cursor = 0;

  while (skip_whitespace(buffer, cursor))
  {
    // NOTE: order matters, `~@` has to be tried before the single `~`
    if (const std::optional<token> marker = scan_marker(buffer, cursor))
    {
      tokens.push_back(*marker);
      continue;
    }

    if (const std::optional<token> special = scan_special(buffer, cursor))
    {
      tokens.push_back(*special);
      continue;
    }

    if (const std::optional<token> str = scan_string(buffer, cursor, source_name))
    {
      tokens.push_back(*str);
      continue;
    }

    if (const std::optional<token> comment = scan_comment(buffer, cursor))
    {
      tokens.push_back(*comment);
      continue;
    }

    if (const std::optional<token> atom = scan_atom(buffer, cursor))
    {
      tokens.push_back(*atom);
      continue;
    }

    // Skip unrecognized byte
    cursor++;
  }

  return tokens;
}
