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


#include "mallow/printer.hpp"

#include <sstream>


static void
_print(std::ostream &os, const mlw::data &val, bool readably)
{
  using namespace mlw;

  switch (val.t())
  {
    case tag::num:
      os << std::get<number>(val.as_atom()).value;
      break;

    case tag::sym:
      os << std::get<symbol>(val.as_atom()).name;
      break;

    case tag::str: {
      const std::string &text = std::get<string_literal>(val.as_atom()).text;
      if (readably)
        os << escape(text);
      else
        os << text;
      break;
    }

    case tag::list: {
      const list_form &l = val.as_list();
      os << opening(l.kind);
      bool first = true;
      for (const data &elt : l.items)
      {
        if (not first)
          os << ' ';
        _print(os, elt, readably);
        first = false;
      }
      os << closing(l.kind);
      break;
    }
  }
}


void
mlw::print(std::ostream &os, const data &x, bool readably)
{ _print(os, x, readably); }


std::string
mlw::pr_str(const data &x, bool readably)
{
  std::ostringstream buf;
  _print(buf, x, readably);
  return buf.str();
}


std::string
mlw::escape(std::string_view text)
{
  std::string result;
  result.reserve(text.size() + 2);
  result.push_back('"');
  for (const char c : text)
  {
    switch (c)
    {
      case '"':
      case '\\':
        result.push_back('\\');
        result.push_back(c);
        break;

      case '\n':
        result.append("\\n");
        break;

      case '\t':
        result.append("\\t");
        break;

      case '\r':
        result.append("\\r");
        break;

      default:
        result.push_back(c);
    }
  }
  result.push_back('"');
  return result;
}
