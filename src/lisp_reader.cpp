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


#include "mallow/lisp_reader.hpp"
#include "mallow/lisp_parser.hpp"
#include "mallow/logging.hpp"
#include "mallow/tokenizer.hpp"


mlw::lisp_reader::lisp_reader(std::string source_name)
: m_source_name {std::move(source_name)}
{ }


void
mlw::lisp_reader::operator << (std::string_view input)
{
  m_pending.append(input);
  m_pending.push_back('\n');

  // Convert pending text into tokens; an open string literal at the end is
  // left for the next line
  std::string_view text = m_pending;
  token_sequence tokens;
  try { tokens = tokenize(text, m_source_name); }
  catch (const unterminated_string &exn)
  {
    debug("string literal continues on the next line");
    text = text.substr(0, exn.location()->start);
    tokens = tokenize(text, m_source_name);
  }

  // Parse all available expressions from accumulated tokens
  size_t cursor = 0;
  size_t consumed = 0; // bytes of text taken by complete forms
  while (true)
  {
    try
    {
      data form = parse_form(tokens, text, cursor, m_source_name);
      consumed = tokens[cursor - 1].end;
      m_values.push_back(std::move(form));
    }
    catch (const no_form&) // Only comments and whitespace left
    {
      consumed = text.size();
      break;
    }
    catch (const unexpected_eof&) // Not enough tokens to produce an expression
    {
      debug("waiting for the rest of the form");
      break;
    }
    catch (const read_error &exn)
    {
      debug("dropping pending text: ", exn.what());
      m_failed_text = std::move(m_pending);
      m_pending.clear();
      throw;
    }
  }

  // Erase consumed text
  m_pending.erase(0, consumed);
}


bool
mlw::lisp_reader::operator >> (mlw::data &result)
{
  if (m_values.empty())
    return false;
  result = std::move(m_values.front());
  m_values.pop_front();
  return true;
}


void
mlw::lisp_reader::reset() noexcept
{
  m_pending.clear();
  m_values.clear();
}
