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


#include "mallow/lisp_parser.hpp"
#include "mallow/format.hpp"
#include "mallow/tokenizer.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>


namespace {

struct parser_state {
  const mlw::token_sequence &tokens;
  std::string_view buffer;
  std::string_view source_name;

  std::string_view
  text(const mlw::token &tok) const
  { return tok.in(buffer); }

  mlw::source_location
  location(const mlw::token &tok) const
  { return {source_name, tok.start, tok.end}; }
};

} // anonymous namespace


static mlw::bracket
_bracket_of(char c) noexcept
{
  switch (c)
  {
    case '[': case ']': return mlw::bracket::square;
    case '{': case '}': return mlw::bracket::curly;
    default: return mlw::bracket::paren;
  }
}


// Move pos past comments; false if no tokens left
static bool
_skip_comments(const parser_state &st, size_t &pos)
{
  while (pos < st.tokens.size() and
         mlw::classify(st.text(st.tokens[pos])) == mlw::token_class::comment)
    pos++;
  return pos < st.tokens.size();
}


static mlw::data
_parse_any(const parser_state &st, size_t &pos, size_t depth);


// Parse a form which the construct opened by `opener` can not do without
static mlw::data
_parse_required(const parser_state &st, size_t &pos, const mlw::token &opener,
                size_t depth)
{
  using namespace mlw;

  if (not _skip_comments(st, pos))
    throw unexpected_eof {
        detail::concat("Unexpected end of input after '", st.text(opener), "'"),
        st.location(opener)};
  return _parse_any(st, pos, depth);
}


static mlw::data
_parse_list(const parser_state &st, size_t &pos, size_t depth)
{
  using namespace mlw;

  const token &open = st.tokens[pos++];
  const bracket kind = _bracket_of(st.text(open)[0]);

  std::vector<data> items;
  while (true)
  {
    if (not _skip_comments(st, pos))
      throw unexpected_eof {
          detail::concat("Unexpected end of input while parsing list opened "
                         "with '", opening(kind), "'"),
          st.location(open)};

    const token &tok = st.tokens[pos];
    const std::string_view text = st.text(tok);
    if (classify(text) == token_class::close_bracket)
    {
      if (text[0] != closing(kind))
        throw mismatched_bracket {
            detail::concat("Expected '", closing(kind), "' to close '",
                           opening(kind), "', got '", text, "'"),
            st.location(tok)};
      pos++;
      return data {list_form {kind, std::move(items)}, open.start, tok.end};
    }

    items.push_back(_parse_any(st, pos, depth + 1));
  }
}


static mlw::data
_parse_reader_macro(const parser_state &st, size_t &pos, size_t depth)
{
  using namespace mlw;

  const token &marker = st.tokens[pos++];
  const std::string_view text = st.text(marker);
  const std::string_view head = reader_macro_symbol(text).value();

  std::vector<data> items;
  items.emplace_back(atom {symbol {std::string {head}}}, marker.start,
                     marker.end);

  if (text == "^")
  {
    // ^meta target -> (with-meta target meta)
    data meta = _parse_required(st, pos, marker, depth + 1);
    data target = _parse_required(st, pos, marker, depth + 1);
    const size_t end = target.end();
    items.push_back(std::move(target));
    items.push_back(std::move(meta));
    return data {list_form {bracket::paren, std::move(items)}, marker.start,
                 end};
  }

  data arg = _parse_required(st, pos, marker, depth + 1);
  const size_t end = arg.end();
  items.push_back(std::move(arg));
  return data {list_form {bracket::paren, std::move(items)}, marker.start, end};
}


static mlw::data
_parse_atom(const parser_state &st, size_t &pos)
{
  using namespace mlw;

  const token &tok = st.tokens[pos];
  const std::string_view text = st.text(tok);

  if (classify(text) == token_class::string)
  {
    pos++;
    const std::string_view body = text.substr(1, text.size() - 2);
    return data {atom {string_literal {unescape(body)}}, tok.start, tok.end};
  }

  if (is_number(text))
  {
    std::int64_t value = 0;
    const auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc {} or ptr != text.data() + text.size())
      throw invalid_number {
          detail::concat("Integer literal out of range: ", text),
          st.location(tok)};
    pos++;
    return data {atom {number {value}}, tok.start, tok.end};
  }

  pos++;
  return data {atom {symbol {std::string {text}}}, tok.start, tok.end};
}


static mlw::data
_parse_any(const parser_state &st, size_t &pos, size_t depth)
{
  using namespace mlw;

  const token &tok = st.tokens[pos];
  const std::string_view text = st.text(tok);
  if (depth >= max_nesting_depth)
    throw nesting_too_deep {
        detail::concat("Forms nested deeper than ", max_nesting_depth,
                       " levels"),
        st.location(tok)};

  switch (classify(text))
  {
    case token_class::open_bracket:
      return _parse_list(st, pos, depth);

    case token_class::close_bracket:
      throw unbalanced_close {st.location(tok)};

    case token_class::reader_macro:
      // Anything but an exact marker (e.g. "@foo" from a foreign tokenizer)
      // is read as a symbol
      if (reader_macro_symbol(text))
        return _parse_reader_macro(st, pos, depth);
      break;

    case token_class::comment:
      if (not _skip_comments(st, pos))
        throw no_form {};
      return _parse_any(st, pos, depth);

    case token_class::string:
    case token_class::atom:
      break;
  }

  return _parse_atom(st, pos);
}


mlw::data
mlw::parse_form(const token_sequence &tokens, std::string_view buffer,
                size_t &pos, std::string_view source_name)
{
  // Work on a copy to preserve `pos` argument upon exception
  size_t proxypos = pos;
  const parser_state st {tokens, buffer, source_name};

  if (not _skip_comments(st, proxypos))
    throw no_form {};

  data result = _parse_any(st, proxypos, 0);
  pos = proxypos;
  return result;
}


mlw::parse_result
mlw::parse(const token_sequence &tokens, std::string_view buffer,
           std::string_view source_name)
{
  size_t pos = 0;
  data form = parse_form(tokens, buffer, pos, source_name);
  return {std::move(form), pos};
}


mlw::data
mlw::read_str(std::string_view buffer, std::string_view source_name)
{
  const token_sequence tokens = tokenize(buffer, source_name);
  return parse(tokens, buffer, source_name).form;
}


std::vector<mlw::data>
mlw::read_all(std::string_view buffer, std::string_view source_name)
{
  const token_sequence tokens = tokenize(buffer, source_name);
  const parser_state st {tokens, buffer, source_name};

  std::vector<data> result;
  size_t pos = 0;
  while (_skip_comments(st, pos))
    result.push_back(parse_form(tokens, buffer, pos, source_name));
  return result;
}


std::string
mlw::unescape(std::string_view body)
{
  std::string result;
  result.reserve(body.size());

  for (size_t i = 0; i < body.size(); ++i)
  {
    if (body[i] != '\\' or i + 1 == body.size())
    {
      result.push_back(body[i]);
      continue;
    }

    const char c = body[++i];
    switch (c)
    {
      case 'n': result.push_back('\n'); break;
      case 't': result.push_back('\t'); break;
      case 'r': result.push_back('\r'); break;
      // \" and \\ as well as unknown escapes keep the escaped byte
      default: result.push_back(c); break;
    }
  }

  return result;
}


bool
mlw::is_number(std::string_view text) noexcept
{
  if (not text.empty() and text[0] == '-')
    text.remove_prefix(1);
  return not text.empty() and
         std::ranges::all_of(text, [](char c) { return c >= '0' and c <= '9'; });
}


std::optional<std::string_view>
mlw::reader_macro_symbol(std::string_view marker) noexcept
{
  if (marker == "'")
    return "quote";
  if (marker == "`")
    return "quasiquote";
  if (marker == "~")
    return "unquote";
  if (marker == "~@")
    return "splice-unquote";
  if (marker == "@")
    return "deref";
  if (marker == "^")
    return "with-meta";
  return std::nullopt;
}
