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
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * \file data.hpp
 * Parse tree produced by the reader
 *
 * \ingroup core
 */


namespace mlw {

/**
 * Tag enumeration for node types
 *
 * \ingroup core
 */
enum class tag {
  num,
  sym,
  str,
  list,
};

/**
 * Bracket pair delimiting a list
 *
 * \ingroup core
 */
enum class bracket {
  paren,  ///< ( )
  square, ///< [ ]
  curly,  ///< { }
};

[[nodiscard]] constexpr char
opening(bracket kind) noexcept
{
  switch (kind)
  {
    case bracket::paren: return '(';
    case bracket::square: return '[';
    case bracket::curly: return '{';
  }
  return '(';
}

[[nodiscard]] constexpr char
closing(bracket kind) noexcept
{
  switch (kind)
  {
    case bracket::paren: return ')';
    case bracket::square: return ']';
    case bracket::curly: return '}';
  }
  return ')';
}


/** Integer literal */
struct number {
  std::int64_t value;

  bool
  operator == (const number &other) const = default;
};

/** Symbol; text is owned */
struct symbol {
  std::string name;

  bool
  operator == (const symbol &other) const = default;
};

/** String literal with escape sequences already resolved */
struct string_literal {
  std::string text;

  bool
  operator == (const string_literal &other) const = default;
};

/**
 * Leaf value of the parse tree
 *
 * \ingroup core
 */
using atom = std::variant<number, symbol, string_literal>;


class data;

/**
 * Ordered sequence of nodes, owning its elements
 *
 * \ingroup core
 */
struct list_form {
  bracket kind = bracket::paren;
  std::vector<data> items;
};


/**
 * Node of the parse tree: either an atom or a list
 *
 * Besides the value itself a node remembers the byte range of the source
 * buffer it was read from. The range is informational and does not take part
 * in comparisons.
 *
 * \ingroup core
 */
class data {
  public:
  using node = std::variant<atom, list_form>;

  /** Empty list `()` */
  data(): m_node {list_form {}}, m_start {0}, m_end {0} { }

  data(atom value, size_t start = 0, size_t end = 0)
  : m_node {std::move(value)}, m_start {start}, m_end {end}
  { }

  data(list_form value, size_t start = 0, size_t end = 0)
  : m_node {std::move(value)}, m_start {start}, m_end {end}
  { }

  [[nodiscard]] tag
  t() const noexcept;

  [[nodiscard]] bool
  is_atom() const noexcept
  { return std::holds_alternative<atom>(m_node); }

  [[nodiscard]] bool
  is_list() const noexcept
  { return std::holds_alternative<list_form>(m_node); }

  /**
   * \throws std::bad_variant_access If the node is a list
   */
  [[nodiscard]] const atom&
  as_atom() const
  { return std::get<atom>(m_node); }

  /**
   * \throws std::bad_variant_access If the node is an atom
   */
  [[nodiscard]] const list_form&
  as_list() const
  { return std::get<list_form>(m_node); }

  [[nodiscard]] list_form&
  as_list()
  { return std::get<list_form>(m_node); }

  [[nodiscard]] const node&
  get() const noexcept
  { return m_node; }

  /** Offset of the first byte of the source text of this node */
  [[nodiscard]] size_t
  start() const noexcept
  { return m_start; }

  /** Offset past the last byte of the source text of this node */
  [[nodiscard]] size_t
  end() const noexcept
  { return m_end; }

  /**
   * Structural equality
   *
   * Source offsets are ignored.
   */
  friend bool
  operator == (const data &a, const data &b);

  private:
  node m_node;
  size_t m_start;
  size_t m_end;
}; // class mlw::data

bool
operator == (const data &a, const data &b);


/**
 * \name Constructors
 * \{
 */

[[nodiscard]] inline data
num(std::int64_t value)
{ return data {atom {number {value}}}; }

[[nodiscard]] inline data
sym(std::string_view name)
{ return data {atom {symbol {std::string {name}}}}; }

[[nodiscard]] inline data
str(std::string_view text)
{ return data {atom {string_literal {std::string {text}}}}; }

[[nodiscard]] inline data
list(std::vector<data> items, bracket kind = bracket::paren)
{ return data {list_form {kind, std::move(items)}}; }

[[nodiscard]] inline data
list(std::initializer_list<data> items, bracket kind = bracket::paren)
{ return list(std::vector<data>(items), kind); }

/** \} */


/**
 * \name Predicates
 * \{
 */

/** Check if \p x is a symbol named \p name */
[[nodiscard]] bool
issym(const data &x, std::string_view name) noexcept;

/** Check if \p x is a string with contents \p text */
[[nodiscard]] bool
isstr(const data &x, std::string_view text) noexcept;

/** Check if \p x is a number equal to \p value */
[[nodiscard]] bool
isnum(const data &x, std::int64_t value) noexcept;

/** \} */

} // namespace mlw
