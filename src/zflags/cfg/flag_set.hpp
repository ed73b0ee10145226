/* zflags
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "zflags/cfg/cfg_fwd.hpp"
#include "zflags/log/log.hpp"
#include <boost/noncopyable.hpp>
#include <boost/program_options/option.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace boost::program_options
{
class options_description;
}

namespace zflags::cfg
{

// Types.

/**
 * A named registry of command-line flags, each backed by an Option_value cell, plus the parser that applies a command
 * line to those cells.  The cells are not owned; they must outlive the Flag_set.
 *
 * ### Command-line syntax ###
 * Tokenizing is done by boost.program_options, configured so that each registered flag `name` may be written as any
 * of:
 *   - `-name=value` or `--name=value`; the value may be empty (`-name=`), in which case the cell is given empty
 *     text and accepts or rejects it like any other value;
 *   - `-name value` or `--name value`, unless the cell is a bool flag (Option_value::is_bool_flag());
 *   - `-name` or `--name` alone, only if the cell is a bool flag, meaning `-name=true`.
 *
 * Abbreviations are not accepted.  Any token not starting with `-`, and every token after a lone `--`, is a
 * positional argument (see args()).  `-h`, `-help` and `--help` request the usage message (print_help()).
 *
 * Each occurrence of a flag calls Option_value::set() on its cell in command-line order, so a later occurrence
 * overwrites an earlier one.  Parsing stops at the first error; the cells set before it keep their new values.
 *
 * ### Error handling ###
 * The On_error mode given at construction decides what a failed parse() does: either report the error like any other
 * zflags API (On_error::S_CONTINUE), or print the error and usage to standard error and exit the process
 * (On_error::S_EXIT), which is what a typical `main()` wants.
 */
class Flag_set :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// What parse() does on error.
  enum class On_error
  {
    /// Report the error per zflags::Error_code conventions.
    S_CONTINUE,
    /**
     * Print the error (if any) and the usage message to `std::cerr`, then `exit()`: with status 0 if the usage
     * message was requested, else 2.
     */
    S_EXIT
  };

  // Constructors/destructor.

  /**
   * Constructs an empty flag set.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param name
   *        Name of the set, for usage and error messages.
   * @param on_error
   *        See On_error.
   */
  explicit Flag_set(log::Logger* logger_ptr, util::String_view name, On_error on_error = On_error::S_CONTINUE);

  // Methods.

  /**
   * Registers a flag.
   *
   * @param name
   *        Flag name without dashes; must be non-empty and must not contain `,` or `=`.
   * @param value
   *        The cell.  Not null.  Must outlive `*this`.
   * @param help
   *        Description for the usage message.
   * @param err_code
   *        See zflags::Error_code docs for error reporting semantics.  zflags::cfg::error::Code generated:
   *        error::Code::S_FLAG_REDEFINED (name already registered, or reserved for help),
   *        error::Code::S_FLAG_SYNTAX (name malformed).
   */
  void add_flag(util::String_view name, Option_value* value, util::String_view help, Error_code* err_code = 0);

  /**
   * Parses the given command line (the arguments of `main()`), setting the registered cells.
   *
   * @param argc
   *        Number of elements in `argv`.
   * @param argv
   *        The program name, followed by the arguments.
   * @param err_code
   *        See zflags::Error_code docs for error reporting semantics.  Only in On_error::S_CONTINUE mode can this
   *        report an error.  zflags::cfg::error::Code generated: error::Code::S_UNKNOWN_FLAG,
   *        error::Code::S_FLAG_SYNTAX, error::Code::S_HELP_REQUESTED, error::Code::S_INVALID_VALUE (a cell rejected
   *        its value).
   */
  void parse(int argc, const char* const* argv, Error_code* err_code = 0);

  /**
   * Identical to the other parse() but takes the arguments (not including the program name) as a vector.
   *
   * @param args
   *        Arguments.
   * @param err_code
   *        See other parse().
   */
  void parse(const std::vector<std::string>& args, Error_code* err_code = 0);

  /**
   * Sets the cell of the given registered flag as if `-name=value` were parsed.  Unaffected by On_error.
   *
   * @param name
   *        Flag name without dashes.
   * @param value
   *        Text to pass to Option_value::set().
   * @param err_code
   *        See zflags::Error_code docs for error reporting semantics.  zflags::cfg::error::Code generated:
   *        error::Code::S_UNKNOWN_FLAG, error::Code::S_INVALID_VALUE.
   */
  void set(util::String_view name, util::String_view value, Error_code* err_code = 0);

  /**
   * Returns the cell registered under the given name, or null if none.
   *
   * @param name
   *        Flag name without dashes.
   * @return See above.
   */
  Option_value* lookup(util::String_view name) const;

  /**
   * Whether parse() has completed successfully at least once.
   *
   * @return See above.
   */
  bool parsed() const;

  /**
   * Positional arguments found by the last parse().
   *
   * @return See above.
   */
  const std::vector<std::string>& args() const;

  /**
   * Prints the usage message: a heading naming the set, then one entry per registered flag (in registration order)
   * with its value type and help text.
   *
   * @param os
   *        Destination.
   */
  void print_help(std::ostream& os) const;

  /**
   * See ctor.
   *
   * @return See above.
   */
  const std::string& name() const;

private:
  // Types.

  /// One registered flag.
  struct Flag
  {
    /// Name without dashes.
    std::string m_name;
    /// The cell.
    Option_value* m_value;
    /// Help text.
    std::string m_help;
  };

  // Methods.

  /**
   * Builds the boost.program_options description of the registered flags plus help.
   *
   * @return See above.
   */
  std::unique_ptr<boost::program_options::options_description> make_options_description() const;

  /**
   * Handles a parse() error per #m_on_error: may exit the process; otherwise emits `code` into `*err_code`.
   *
   * @param code
   *        The error.
   * @param detail
   *        Human-readable description for logs and the printed message.
   * @param err_code
   *        Not null.
   */
  void handle_parse_error(const Error_code& code, util::String_view detail, Error_code* err_code);

  /**
   * boost.program_options style parser, consulted before the built-in ones for each token, that takes a
   * `-name=` or `--name=` token (registered `name`, nothing after `=`) as flag `name` with the empty value.
   * boost.program_options itself rejects an empty adjacent value as a syntax error; this way the cell decides
   * whether empty text is valid.  Other tokens are left alone (empty result).
   *
   * @param tokens
   *        Remaining command-line tokens; not empty.  The first one is removed if and only if it is taken.
   * @return The parsed flag; or empty.
   */
  std::vector<boost::program_options::option> parse_empty_value(std::vector<std::string>& tokens) const;

  // Data.

  /// See ctor.
  const std::string m_name;

  /// See ctor.
  const On_error m_on_error;

  /// Registered flags in registration order.
  std::vector<Flag> m_flags;

  /// Index into #m_flags by name.
  std::map<std::string, size_t, std::less<>> m_flag_idx_by_name;

  /// See args().
  std::vector<std::string> m_args;

  /// See parsed().
  bool m_parsed;
}; // class Flag_set

} // namespace zflags::cfg
