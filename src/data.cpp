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


#include "mallow/data.hpp"

#include <algorithm>


namespace {

template <typename ...F>
struct overloaded: F... { using F::operator()...; };

template <typename ...F>
overloaded(F...) -> overloaded<F...>;

} // anonymous namespace


mlw::tag
mlw::data::t() const noexcept
{
  if (is_list())
    return tag::list;

  return std::visit(overloaded {
    [](const number&) { return tag::num; },
    [](const symbol&) { return tag::sym; },
    [](const string_literal&) { return tag::str; },
  }, std::get<atom>(m_node));
}


bool
mlw::operator == (const mlw::data &a, const mlw::data &b)
{
  if (a.is_atom() and b.is_atom())
    return a.as_atom() == b.as_atom();

  if (a.is_list() and b.is_list())
  {
    const list_form &la = a.as_list();
    const list_form &lb = b.as_list();
    return la.kind == lb.kind and
           std::ranges::equal(la.items, lb.items);
  }

  return false;
}


bool
mlw::issym(const mlw::data &x, std::string_view name) noexcept
{
  if (not x.is_atom())
    return false;
  const symbol *s = std::get_if<symbol>(&x.as_atom());
  return s and s->name == name;
}


bool
mlw::isstr(const mlw::data &x, std::string_view text) noexcept
{
  if (not x.is_atom())
    return false;
  const string_literal *s = std::get_if<string_literal>(&x.as_atom());
  return s and s->text == text;
}


bool
mlw::isnum(const mlw::data &x, std::int64_t value) noexcept
{
  if (not x.is_atom())
    return false;
  const number *n = std::get_if<number>(&x.as_atom());
  return n and n->value == value;
}
