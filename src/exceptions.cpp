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


#include "mallow/exceptions.hpp"
#include "mallow/source_location.hpp"


mlw::bad_code::bad_code(std::string_view what, const source_location &location)
: runtime_error(std::string(what)), m_location {location}
{ }


void
mlw::bad_code::display(std::ostream &os, std::string_view text) const noexcept
{
  // Write basic error report
  os << what();

  // Write location if available
  if (m_location)
    os << "\n" << display_location(m_location.value(), text);
}


std::string_view
mlw::error_kind_name(error_kind kind) noexcept
{
  switch (kind)
  {
    case error_kind::unterminated_string: return "UnterminatedString";
    case error_kind::unexpected_eof: return "UnexpectedEof";
    case error_kind::unbalanced_close: return "UnbalancedClose";
    case error_kind::mismatched_bracket: return "MismatchedBracket";
    case error_kind::no_form: return "NoForm";
    case error_kind::invalid_number: return "InvalidNumber";
    case error_kind::nesting_too_deep: return "NestingTooDeep";
  }
  return "Unknown";
}
