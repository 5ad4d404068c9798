#include "mallow/lisp_parser.hpp"
#include "mallow/tokenizer.hpp"
#include "mallow/data.hpp"
#include "mallow/printer.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <string>

namespace {

using mlw::list;
using mlw::num;
using mlw::str;
using mlw::sym;


// Test parsing a simple list
TEST(LispParserTest, ParseList) {
  const std::string text = "(+ 1 2)";
  const mlw::token_sequence tokens = mlw::tokenize(text);
  const mlw::parse_result result = mlw::parse(tokens, text);

  ASSERT_EQ(result.form.t(), mlw::tag::list);
  EXPECT_EQ(result.consumed, 5);
  EXPECT_EQ(result.form, list({sym("+"), num(1), num(2)}));
  EXPECT_EQ(result.form.as_list().kind, mlw::bracket::paren);
}

// Test parsing a symbol
TEST(LispParserTest, ParseSymbol) {
  const mlw::data result = mlw::read_str("symbol");
  ASSERT_EQ(result.t(), mlw::tag::sym);
  ASSERT_TRUE(mlw::issym(result, "symbol"));
}

// Test parsing numbers
TEST(LispParserTest, ParseNumber) {
  ASSERT_TRUE(mlw::isnum(mlw::read_str("42"), 42));
  ASSERT_TRUE(mlw::isnum(mlw::read_str("-17"), -17));
  ASSERT_TRUE(mlw::isnum(mlw::read_str("007"), 7));
}

// Things resembling numbers are symbols
TEST(LispParserTest, ParseNumberLikeSymbols) {
  ASSERT_TRUE(mlw::issym(mlw::read_str("-"), "-"));
  ASSERT_TRUE(mlw::issym(mlw::read_str("1.5"), "1.5"));
  ASSERT_TRUE(mlw::issym(mlw::read_str("+1"), "+1"));
  ASSERT_TRUE(mlw::issym(mlw::read_str("12abc"), "12abc"));
  ASSERT_TRUE(mlw::issym(mlw::read_str("--1"), "--1"));
}

TEST(LispParserTest, ParseNumberLimits) {
  const std::int64_t max = std::numeric_limits<std::int64_t>::max();
  const std::int64_t min = std::numeric_limits<std::int64_t>::min();
  ASSERT_TRUE(mlw::isnum(mlw::read_str("9223372036854775807"), max));
  ASSERT_TRUE(mlw::isnum(mlw::read_str("-9223372036854775808"), min));
  ASSERT_THROW((void)mlw::read_str("9223372036854775808"), mlw::invalid_number);
}

// Test parsing strings
TEST(LispParserTest, ParseString) {
  const mlw::data result = mlw::read_str("\"hello, world\"");
  ASSERT_EQ(result.t(), mlw::tag::str);
  ASSERT_TRUE(mlw::isstr(result, "hello, world"));
}

TEST(LispParserTest, ParseStringEscapes) {
  ASSERT_TRUE(mlw::isstr(mlw::read_str(R"("a\"b")"), "a\"b"));
  ASSERT_TRUE(mlw::isstr(mlw::read_str(R"("a\\b")"), "a\\b"));
  ASSERT_TRUE(mlw::isstr(mlw::read_str(R"("1\n2\t3")"), "1\n2\t3"));
  ASSERT_TRUE(mlw::isstr(mlw::read_str(R"("")"), ""));
}

TEST(LispParserTest, Unescape) {
  EXPECT_EQ(mlw::unescape(R"(a\"b)"), "a\"b");
  EXPECT_EQ(mlw::unescape(R"(\\\")"), "\\\"");
  EXPECT_EQ(mlw::unescape(R"(a\rb\n)"), "a\rb\n");
  EXPECT_EQ(mlw::unescape(R"(\q)"), "q");
  EXPECT_EQ(mlw::unescape("plain"), "plain");
}

// Test parsing nested lists
TEST(LispParserTest, ParseNestedLists) {
  const mlw::data result = mlw::read_str("(a (b c) d)");
  ASSERT_EQ(result, list({sym("a"), list({sym("b"), sym("c")}), sym("d")}));
}

TEST(LispParserTest, ParseEmptyLists) {
  ASSERT_EQ(mlw::read_str("()"), list({}));
  ASSERT_EQ(mlw::read_str("[]"), list({}, mlw::bracket::square));
  ASSERT_EQ(mlw::read_str("{}"), list({}, mlw::bracket::curly));
  ASSERT_NE(mlw::read_str("[]"), mlw::read_str("()"));
}

TEST(LispParserTest, ParseBracketKinds) {
  const mlw::data result = mlw::read_str("(let [x {a 1}] x)");
  ASSERT_EQ(result,
            list({sym("let"),
                  list({sym("x"), list({sym("a"), num(1)}, mlw::bracket::curly)},
                       mlw::bracket::square),
                  sym("x")}));
}

// Test parsing reader macros
TEST(LispParserTest, ParseQuote) {
  ASSERT_EQ(mlw::read_str("'(1 2 3)"),
            list({sym("quote"), list({num(1), num(2), num(3)})}));
  ASSERT_EQ(mlw::read_str("`x"), list({sym("quasiquote"), sym("x")}));
  ASSERT_EQ(mlw::read_str("~x"), list({sym("unquote"), sym("x")}));
  ASSERT_EQ(mlw::read_str("@x"), list({sym("deref"), sym("x")}));
}

TEST(LispParserTest, ParseSpliceUnquote) {
  const std::string text = "~@(1 2)";
  const mlw::token_sequence tokens = mlw::tokenize(text);
  ASSERT_EQ(tokens[0].in(text), "~@");
  ASSERT_EQ(mlw::parse(tokens, text).form,
            list({sym("splice-unquote"), list({num(1), num(2)})}));
}

TEST(LispParserTest, ParseWithMeta) {
  ASSERT_EQ(mlw::read_str("^{\"a\" 1} [1 2 3]"),
            list({sym("with-meta"),
                  list({num(1), num(2), num(3)}, mlw::bracket::square),
                  list({str("a"), num(1)}, mlw::bracket::curly)}));
}

TEST(LispParserTest, ParseNestedReaderMacros) {
  ASSERT_EQ(mlw::read_str("''a"),
            list({sym("quote"), list({sym("quote"), sym("a")})}));
  ASSERT_EQ(mlw::read_str("`(a ~b ~@c)"),
            list({sym("quasiquote"),
                  list({sym("a"), list({sym("unquote"), sym("b")}),
                        list({sym("splice-unquote"), sym("c")})})}));
}

TEST(LispParserTest, ReaderMacroSymbol) {
  EXPECT_EQ(mlw::reader_macro_symbol("'"), "quote");
  EXPECT_EQ(mlw::reader_macro_symbol("~@"), "splice-unquote");
  EXPECT_EQ(mlw::reader_macro_symbol("^"), "with-meta");
  EXPECT_FALSE(mlw::reader_macro_symbol("x").has_value());
  EXPECT_FALSE(mlw::reader_macro_symbol("@@").has_value());
}

// Comments are not part of the tree
TEST(LispParserTest, SkipComments) {
  ASSERT_EQ(mlw::read_str("; leading\n(a ; inner\n b) ; trailing"),
            list({sym("a"), sym("b")}));
  ASSERT_EQ(mlw::read_str("'; between\nx"), list({sym("quote"), sym("x")}));
}

TEST(LispParserTest, ConsumedCount) {
  const std::string text = "; c\n(a b) c";
  const mlw::token_sequence tokens = mlw::tokenize(text);
  const mlw::parse_result result = mlw::parse(tokens, text);
  ASSERT_EQ(result.form, list({sym("a"), sym("b")}));
  EXPECT_EQ(result.consumed, 5);
}

TEST(LispParserTest, ParseFormAdvancesCursor) {
  const std::string text = "1 (2) three";
  const mlw::token_sequence tokens = mlw::tokenize(text);
  size_t pos = 0;
  EXPECT_EQ(mlw::parse_form(tokens, text, pos), num(1));
  EXPECT_EQ(pos, 1);
  EXPECT_EQ(mlw::parse_form(tokens, text, pos), list({num(2)}));
  EXPECT_EQ(pos, 4);
  EXPECT_EQ(mlw::parse_form(tokens, text, pos), sym("three"));
  EXPECT_EQ(pos, 5);
  EXPECT_THROW((void)mlw::parse_form(tokens, text, pos), mlw::no_form);
  EXPECT_EQ(pos, 5);
}

TEST(LispParserTest, ParseFormKeepsCursorOnError) {
  const std::string text = "a (b";
  const mlw::token_sequence tokens = mlw::tokenize(text);
  size_t pos = 1;
  EXPECT_THROW((void)mlw::parse_form(tokens, text, pos), mlw::unexpected_eof);
  EXPECT_EQ(pos, 1);
}

TEST(LispParserTest, Spans) {
  const std::string text = "  (ab 'c)";
  const mlw::data result = mlw::read_str(text);
  EXPECT_EQ(result.start(), 2);
  EXPECT_EQ(result.end(), 9);

  const mlw::data &ab = result.as_list().items[0];
  EXPECT_EQ(ab.start(), 3);
  EXPECT_EQ(ab.end(), 5);

  const mlw::data &quoted = result.as_list().items[1];
  EXPECT_EQ(quoted.start(), 6);
  EXPECT_EQ(quoted.end(), 8);
  EXPECT_EQ(quoted.as_list().items[0].start(), 6);
  EXPECT_EQ(quoted.as_list().items[0].end(), 7);
}

TEST(LispParserTest, ReadAll) {
  const std::vector<mlw::data> forms =
      mlw::read_all("(def! a 1) ; one\n[a] \"s\" ; end");
  ASSERT_EQ(forms.size(), 3);
  EXPECT_EQ(forms[0], list({sym("def!"), sym("a"), num(1)}));
  EXPECT_EQ(forms[1], list({sym("a")}, mlw::bracket::square));
  EXPECT_EQ(forms[2], str("s"));
}

TEST(LispParserTest, ReadAllEmpty) {
  EXPECT_TRUE(mlw::read_all("").empty());
  EXPECT_TRUE(mlw::read_all(" ; nothing here\n;; at all").empty());
}


// Errors

TEST(LispParserErrorTest, NoForm) {
  const std::string text = "; just a comment";
  const mlw::token_sequence tokens = mlw::tokenize(text);
  ASSERT_THROW((void)mlw::parse(tokens, text), mlw::no_form);
  ASSERT_THROW((void)mlw::read_str(""), mlw::no_form);
  ASSERT_THROW((void)mlw::read_str("  ,  "), mlw::no_form);
}

TEST(LispParserErrorTest, MismatchedBracket) {
  try
  {
    (void)mlw::read_str("(]");
    FAIL() << "no exception thrown";
  }
  catch (const mlw::mismatched_bracket &exn)
  {
    EXPECT_EQ(exn.kind(), mlw::error_kind::mismatched_bracket);
    EXPECT_STREQ(exn.what(), "Expected ')' to close '(', got ']'");
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->start, 1);
    EXPECT_EQ(exn.location()->end, 2);
  }

  ASSERT_THROW((void)mlw::read_str("[a (b])"), mlw::mismatched_bracket);
  ASSERT_THROW((void)mlw::read_str("{)"), mlw::mismatched_bracket);
}

TEST(LispParserErrorTest, UnbalancedClose) {
  ASSERT_THROW((void)mlw::read_str(")"), mlw::unbalanced_close);
  ASSERT_THROW((void)mlw::read_str("  ]"), mlw::unbalanced_close);
  ASSERT_THROW((void)mlw::read_str("(')"), mlw::unbalanced_close);

  // Extra closer after a complete form is left for the next parse
  const std::string text = "(a))";
  const mlw::token_sequence tokens = mlw::tokenize(text);
  size_t pos = 0;
  EXPECT_EQ(mlw::parse_form(tokens, text, pos), list({sym("a")}));
  EXPECT_THROW((void)mlw::parse_form(tokens, text, pos), mlw::unbalanced_close);
  EXPECT_THROW((void)mlw::read_all(text), mlw::unbalanced_close);
}

TEST(LispParserErrorTest, UnexpectedEof) {
  try
  {
    (void)mlw::read_str("(a (b c)", "test.mal");
    FAIL() << "no exception thrown";
  }
  catch (const mlw::unexpected_eof &exn)
  {
    EXPECT_EQ(exn.kind(), mlw::error_kind::unexpected_eof);
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(*exn.location(), (mlw::source_location {"test.mal", 0, 1}));
  }

  ASSERT_THROW((void)mlw::read_str("'"), mlw::unexpected_eof);
  ASSERT_THROW((void)mlw::read_str("~@ ; nothing"), mlw::unexpected_eof);
  ASSERT_THROW((void)mlw::read_str("^{}"), mlw::unexpected_eof);
  ASSERT_THROW((void)mlw::read_str("[1 2 ; open"), mlw::unexpected_eof);
}

TEST(LispParserErrorTest, UnterminatedString) {
  ASSERT_THROW((void)mlw::read_str("\"unterminated"), mlw::unterminated_string);
  ASSERT_THROW((void)mlw::read_all("(a) \"b"), mlw::unterminated_string);
}

TEST(LispParserErrorTest, InvalidNumberLocation) {
  try
  {
    (void)mlw::read_str("(x 99999999999999999999)");
    FAIL() << "no exception thrown";
  }
  catch (const mlw::read_error &exn)
  {
    EXPECT_EQ(exn.kind(), mlw::error_kind::invalid_number);
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->start, 3);
    EXPECT_EQ(exn.location()->end, 23);
  }
}

TEST(LispParserErrorTest, NestingAtLimit) {
  const size_t n = mlw::max_nesting_depth;
  const std::string text = std::string(n, '[') + std::string(n, ']');
  const mlw::data result = mlw::read_str(text);
  EXPECT_EQ(mlw::pr_str(result), text);
}

TEST(LispParserErrorTest, NestingTooDeep) {
  const size_t n = 100000;
  const std::string text = std::string(n, '(') + std::string(n, ')');
  try
  {
    (void)mlw::read_str(text);
    FAIL() << "no exception thrown";
  }
  catch (const mlw::read_error &exn)
  {
    EXPECT_EQ(exn.kind(), mlw::error_kind::nesting_too_deep);
    ASSERT_TRUE(exn.location().has_value());
    EXPECT_EQ(exn.location()->start, mlw::max_nesting_depth);
    EXPECT_EQ(exn.location()->end, mlw::max_nesting_depth + 1);
  }

  // Unclosed lists hit the limit before the end of input
  ASSERT_THROW((void)mlw::read_str(std::string(n, '(')), mlw::nesting_too_deep);
}

TEST(LispParserErrorTest, ReaderMacrosTooDeep) {
  const size_t n = mlw::max_nesting_depth;
  ASSERT_NO_THROW((void)mlw::read_str(std::string(n - 1, '\'') + "x"));
  ASSERT_THROW((void)mlw::read_str(std::string(n, '\'') + "x"),
               mlw::nesting_too_deep);
  ASSERT_THROW((void)mlw::read_str(std::string(100000, '@') + "x"),
               mlw::nesting_too_deep);
}

TEST(LispParserErrorTest, ErrorKindNames) {
  EXPECT_EQ(mlw::error_kind_name(mlw::error_kind::unterminated_string),
            "UnterminatedString");
  EXPECT_EQ(mlw::error_kind_name(mlw::error_kind::unexpected_eof),
            "UnexpectedEof");
  EXPECT_EQ(mlw::error_kind_name(mlw::error_kind::unbalanced_close),
            "UnbalancedClose");
  EXPECT_EQ(mlw::error_kind_name(mlw::error_kind::mismatched_bracket),
            "MismatchedBracket");
  EXPECT_EQ(mlw::error_kind_name(mlw::error_kind::no_form), "NoForm");
  EXPECT_EQ(mlw::error_kind_name(mlw::error_kind::invalid_number),
            "InvalidNumber");
  EXPECT_EQ(mlw::error_kind_name(mlw::error_kind::nesting_too_deep),
            "NestingTooDeep");
}

} // namespace
