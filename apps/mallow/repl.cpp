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
#include "repl.hpp"

#include "mallow/logging.hpp"

#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <readline/readline.h>
#include <readline/history.h>


// Symbols seen in forms read so far
static std::set<std::string> used_symbols;

// Heads of reader-macro expansions are always offered
static constexpr std::string_view reader_macro_heads[] = {
  "quote", "quasiquote", "unquote", "splice-unquote", "deref", "with-meta"
};


bool
prompt_line(const std::string &prompt, std::string &line)
{
  char *input = readline(prompt.c_str());
  if (input == nullptr)
    return false; // EOF

  line = input;
  if (not line.empty())
    add_history(input);
  free(input);
  return true;
}


// Candidates are collected on the first call for a word (state 0) and handed
// out one per call afterwards; readline takes ownership of returned strings.
static char *
_next_candidate(const char *text, int state)
{
  static std::vector<std::string> candidates;
  static size_t next;

  if (state == 0)
  {
    const std::string_view prefix {text};
    candidates.clear();
    next = 0;
    for (const std::string_view head : reader_macro_heads)
    {
      if (head.starts_with(prefix))
        candidates.emplace_back(head);
    }
    for (auto it = used_symbols.lower_bound(std::string {prefix});
         it != used_symbols.end() and it->starts_with(prefix); ++it)
      candidates.push_back(*it);
  }

  if (next == candidates.size())
    return nullptr;
  return strdup(candidates[next++].c_str());
}


static char **
_complete(const char *text, int, int)
{
  // Only forms' symbols are completed, never file names
  rl_attempted_completion_over = 1;
  return rl_completion_matches(text, _next_candidate);
}


void
init_readline(const repl_options &options)
{
  rl_readline_name = "mallow"; // for $if conditionals in inputrc
  rl_attempted_completion_function = _complete;
  rl_bind_key('\t', rl_complete);

  stifle_history(options.history_size);
  if (const int err = read_history(options.history_file.c_str()))
    mlw::debug("no history loaded from ", options.history_file, ": ",
               std::strerror(err));
}


void
cleanup_readline(const repl_options &options)
{
  if (const int err = write_history(options.history_file.c_str()))
  {
    mlw::warning("failed to save history to ", options.history_file, ": ",
                 std::strerror(err));
    return;
  }
  history_truncate_file(options.history_file.c_str(), options.history_size);
}


// Remember symbols of \p expr for completion
void
extract_symbols(const mlw::data &expr)
{
  switch (expr.t())
  {
    case mlw::tag::list:
      for (const mlw::data &elt : expr.as_list().items)
        extract_symbols(elt);
      break;

    case mlw::tag::sym:
      used_symbols.emplace(std::get<mlw::symbol>(expr.as_atom()).name);
      break;

    case mlw::tag::num:
    case mlw::tag::str:
      break;
  }
}
