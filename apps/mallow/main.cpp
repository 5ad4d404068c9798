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

#include "mallow/lisp_parser.hpp"
#include "mallow/lisp_reader.hpp"
#include "mallow/logging.hpp"
#include "mallow/printer.hpp"
#include "mallow/tokenizer.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>

namespace std {
namespace fs = std::filesystem;
}


// Write slices of all tokens of `text` on a single line
static void
print_tokens(std::string_view text, std::string_view source_name)
{
  const mlw::token_sequence tokens = mlw::tokenize(text, source_name);
  bool first = true;
  for (const mlw::token &tok : tokens)
  {
    std::cout << (first ? "" : " ") << mlw::escape(tok.in(text));
    first = false;
  }
  std::cout << std::endl;
}


static int
process_file(const std::fs::path &path, const repl_options &options)
{
  using namespace mlw;

  std::ifstream infile {path, std::ios::binary};
  if (not infile)
  {
    error("could not open input file '", path.string(), "'");
    return EXIT_FAILURE;
  }
  const std::string text {std::istreambuf_iterator<char> {infile},
                          std::istreambuf_iterator<char> {}};
  info("read ", text.size(), " bytes from ", path.string());

  try
  {
    if (options.tokens)
    {
      print_tokens(text, path.string());
      return EXIT_SUCCESS;
    }

    for (const data &form : read_all(text, path.string()))
      std::cout << form << std::endl;
  }
  catch (const read_error &exn)
  {
    error(error_kind_name(exn.kind()), ": ", exn.display(text));
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}


static void
read_print_loop(const repl_options &options)
{
  using namespace mlw;

  // Initialize readline
  init_readline(options);

  // Run REPL
  lisp_reader reader;
  std::string line;
  while (prompt_line(reader.pending() ? options.continuation_prompt
                                      : options.prompt, line))
  {
    if (options.tokens)
    {
      try { print_tokens(line, reader.source_name()); }
      catch (const unterminated_string &exn)
      { std::cout << exn.display(line); }
      continue;
    }

    // Feed new piece of text into the reader
    try { reader << line; }
    catch (const read_error &exn)
    {
      std::cout << exn.display(reader.failed_text());
    }

    // Print new expressions
    data expr;
    while (reader >> expr)
    {
      std::cout << expr << std::endl;
      // Extract symbols for autocompletion
      extract_symbols(expr);
    }
  }
  std::cout << "\ngoodbye" << std::endl;

  // Clean up readline before exiting
  cleanup_readline(options);
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace mlw;

  std::string verbosity {loglevel_name(loglevel::info)};
  repl_options options;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help", "produce help message")
    ("input-file", po::value<std::fs::path>(), "input file to process")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity")
    ("prompt", po::value<std::string>(&options.prompt)->default_value(options.prompt), "REPL prompt")
    ("history-file", po::value<std::string>(&options.history_file)->default_value(options.history_file), "file to keep REPL history in")
    ("history-size", po::value<int>(&options.history_size)->default_value(options.history_size), "maximal number of history entries")
    ("tokens", po::bool_switch(&options.tokens), "print tokens instead of forms");

  po::positional_options_description posdesc;
  posdesc.add("input-file", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error(e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [input-file]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  // Set global log-level
  try { loglevel = parse_loglevel(verbosity); }
  catch (const std::runtime_error &exn)
  {
    error(exn.what());
    return EXIT_FAILURE;
  }

  // No colors in logs redirected to a file
  log_colors = isatty(STDERR_FILENO);

  if (options.history_size < 0)
  {
    error("history size must not be negative");
    return EXIT_FAILURE;
  }

  if (varmap.contains("input-file"))
    return process_file(varmap["input-file"].as<std::fs::path>(), options);

  read_print_loop(options);
  return EXIT_SUCCESS;
}
