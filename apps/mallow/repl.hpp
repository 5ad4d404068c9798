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

#include "mallow/data.hpp"

#include <string>


struct repl_options {
  std::string prompt = "user> ";
  std::string continuation_prompt = "  ... ";
  std::string history_file = ".mallow_history";
  int history_size = 10;
  bool tokens = false; // print token slices instead of forms
};


void
init_readline(const repl_options &options);

void
cleanup_readline(const repl_options &options);

bool
prompt_line(const std::string &prompt, std::string &line);

void
extract_symbols(const mlw::data &expr);
