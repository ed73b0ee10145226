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
#include "zflags/cfg/flag_set.hpp"
#include "zflags/cfg/error.hpp"
#include "zflags/cfg/option_value.hpp"
#include "zflags/error/error.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cassert>
#include <cstdlib>
#include <iostream>

namespace zflags::cfg
{

// Static initializations.

namespace
{

/// Name under which boost.program_options knows the usage-message request; with its short form.
const std::string S_HELP_OPTION_SPEC = "help,h";

/// Long name of the usage-message request.
const std::string S_HELP_NAME = "help";

/// Short name of the usage-message request.
const std::string S_HELP_SHORT_NAME = "h";

/**
 * boost.program_options command-line style: Unix style plus single-dash long options, without abbreviations.
 * Grouped short options are off, so a single-dash token is never split into several flags.
 */
const int S_CMD_LINE_STYLE
  = (boost::program_options::command_line_style::unix_style
     | boost::program_options::command_line_style::allow_long_disguise)
    & ~boost::program_options::command_line_style::allow_guessing
    & ~boost::program_options::command_line_style::allow_sticky;

} // namespace (anon)

// Implementations.

Flag_set::Flag_set(log::Logger* logger_ptr, util::String_view name, On_error on_error) :
  log::Log_context(logger_ptr),
  m_name(name),
  m_on_error(on_error),
  m_parsed(false)
{
  ZFLAGS_LOG_DEBUG("Flag set [" << m_name << "]: created.");
}

void Flag_set::add_flag(util::String_view name, Option_value* value, util::String_view help, Error_code* err_code)
{
  if (zflags::error::exec_void_and_throw_on_error([&](Error_code* actual_err_code)
                                                    { add_flag(name, value, help, actual_err_code); },
                                                  err_code, ZFLAGS_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else

  assert(value);

  if (name.empty() || (name.find_first_of(",=") != util::String_view::npos) || (name.front() == '-'))
  {
    ZFLAGS_LOG_WARNING("Flag set [" << m_name << "]: flag name [" << name << "] is malformed.");
    ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_FLAG_SYNTAX);
    return;
  }
  // else
  if ((name == S_HELP_NAME) || (name == S_HELP_SHORT_NAME)
      || (m_flag_idx_by_name.find(name) != m_flag_idx_by_name.end()))
  {
    ZFLAGS_LOG_WARNING("Flag set [" << m_name << "]: flag [" << name << "] redefined.");
    ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_FLAG_REDEFINED);
    return;
  }
  // else

  m_flag_idx_by_name.emplace(std::string(name), m_flags.size());
  m_flags.push_back(Flag{std::string(name), value, std::string(help)});

  ZFLAGS_LOG_DEBUG("Flag set [" << m_name << "]: registered flag [" << name << "] of type "
                   "[" << value->type_name() << "].");
  err_code->clear();
} // Flag_set::add_flag()

void Flag_set::parse(int argc, const char* const* argv, Error_code* err_code)
{
  // Skip the program name.
  std::vector<std::string> args;
  if (argc > 1)
  {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, err_code);
}

void Flag_set::parse(const std::vector<std::string>& args, Error_code* err_code)
{
  if (zflags::error::exec_void_and_throw_on_error([&](Error_code* actual_err_code)
                                                    { parse(args, actual_err_code); },
                                                  err_code, ZFLAGS_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else

  namespace opts = boost::program_options;
  using std::string;

  ZFLAGS_LOG_INFO("Flag set [" << m_name << "]: parsing [" << args.size() << "] command-line arguments.");

  m_args.clear();

  std::vector<opts::option> options;
  {
    const auto desc = make_options_description();
    try
    {
      options = opts::command_line_parser(args).options(*desc).style(S_CMD_LINE_STYLE)
                  .extra_style_parser([&](std::vector<string>& tokens) { return parse_empty_value(tokens); })
                  .run().options;
    }
    catch (const opts::unknown_option& exc)
    {
      handle_parse_error(error::Code::S_UNKNOWN_FLAG, exc.what(), err_code);
      return;
    }
    catch (const opts::error& exc)
    {
      handle_parse_error(error::Code::S_FLAG_SYNTAX, exc.what(), err_code);
      return;
    }
  } // const auto desc = ...

  size_t n_flags = 0;
  for (const auto& option : options)
  {
    if (option.position_key != -1)
    {
      // Not a flag.
      assert(!option.value.empty());
      m_args.push_back(option.value.front());
      continue;
    }
    // else

    if (option.string_key == S_HELP_NAME)
    {
      handle_parse_error(error::Code::S_HELP_REQUESTED, "usage message requested", err_code);
      return;
    }
    // else

    const auto flag_it = m_flag_idx_by_name.find(option.string_key);
    assert(flag_it != m_flag_idx_by_name.end()); // Otherwise program_options would have thrown unknown_option.
    const auto& flag = m_flags[flag_it->second];

    string text;
    if (option.value.empty())
    {
      // A bare bool flag.
      text = "true";
    }
    else if (flag.m_value->is_bool_flag() && (option.original_tokens.size() > 1))
    {
      /* program_options gave the optional value of a bool flag from the token after it; a bool flag takes a value
       * only in the `=` form, so that token is positional. */
      text = "true";
      m_args.insert(m_args.end(), option.value.begin(), option.value.end());
    }
    else
    {
      text = option.value.front();
    }

    Error_code set_err_code;
    flag.m_value->set(text, &set_err_code);
    if (set_err_code)
    {
      handle_parse_error(set_err_code,
                         util::ostream_op_string("invalid argument \"", text, "\" for \"-", flag.m_name, "\" flag: ",
                                                 set_err_code.message()),
                         err_code);
      return;
    }
    // else
    ++n_flags;
    ZFLAGS_LOG_DEBUG("Flag set [" << m_name << "]: flag [" << flag.m_name << "] set to [" << text << "].");
  } // for (option : options)

  m_parsed = true;
  ZFLAGS_LOG_INFO("Flag set [" << m_name << "]: parsed [" << n_flags << "] flags and "
                  "[" << m_args.size() << "] positional arguments.");
  err_code->clear();
} // Flag_set::parse()

void Flag_set::set(util::String_view name, util::String_view value, Error_code* err_code)
{
  if (zflags::error::exec_void_and_throw_on_error([&](Error_code* actual_err_code)
                                                    { set(name, value, actual_err_code); },
                                                  err_code, ZFLAGS_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else

  const auto option_value = lookup(name);
  if (!option_value)
  {
    ZFLAGS_LOG_WARNING("Flag set [" << m_name << "]: cannot set unknown flag [" << name << "].");
    ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_UNKNOWN_FLAG);
    return;
  }
  // else

  option_value->set(value, err_code); // It will log on error.
}

std::vector<boost::program_options::option> Flag_set::parse_empty_value(std::vector<std::string>& tokens) const
{
  using util::String_view;

  std::vector<boost::program_options::option> result;
  assert(!tokens.empty());
  const String_view token(tokens.front());

  // Looking for exactly `-name=` or `--name=`, with `name` registered.
  if ((token.size() < 3) || (token.front() != '-') || (token.back() != '='))
  {
    return result;
  }
  // else
  auto name = token.substr(1, token.size() - 2);
  if (name.front() == '-')
  {
    name.remove_prefix(1);
  }
  if (name.empty() || (name.find('=') != String_view::npos) || (!lookup(name)))
  {
    return result;
  }
  // else

  boost::program_options::option opt;
  opt.string_key = std::string(name);
  opt.value.emplace_back();
  opt.original_tokens.push_back(tokens.front());
  result.push_back(std::move(opt));

  tokens.erase(tokens.begin());
  return result;
} // Flag_set::parse_empty_value()

Option_value* Flag_set::lookup(util::String_view name) const
{
  const auto flag_it = m_flag_idx_by_name.find(name);
  return (flag_it == m_flag_idx_by_name.end()) ? nullptr : m_flags[flag_it->second].m_value;
}

bool Flag_set::parsed() const
{
  return m_parsed;
}

const std::vector<std::string>& Flag_set::args() const
{
  return m_args;
}

const std::string& Flag_set::name() const
{
  return m_name;
}

void Flag_set::print_help(std::ostream& os) const
{
  os << *(make_options_description());
}

std::unique_ptr<boost::program_options::options_description> Flag_set::make_options_description() const
{
  namespace opts = boost::program_options;
  using std::string;

  auto desc = std::make_unique<opts::options_description>(util::ostream_op_string("Usage of ", m_name, ':'));
  auto add = desc->add_options();
  for (const auto& flag : m_flags)
  {
    const auto value_semantic = opts::value<string>()->value_name(flag.m_value->type_name());
    if (flag.m_value->is_bool_flag())
    {
      // Lets the value be omitted; parse() then supplies "true" itself.
      value_semantic->implicit_value(string("true"));
    }

    const auto current_str = flag.m_value->str();
    const auto help = current_str.empty() ? flag.m_help
                                          : util::ostream_op_string(flag.m_help, " (current: ", current_str, ')');
    add(flag.m_name.c_str(), value_semantic, help.c_str());
  }
  add(S_HELP_OPTION_SPEC.c_str(), "Print this usage message.");

  return desc;
} // Flag_set::make_options_description()

void Flag_set::handle_parse_error(const Error_code& code, util::String_view detail, Error_code* err_code)
{
  const bool help_requested = code == error::Code::S_HELP_REQUESTED;
  if (help_requested)
  {
    ZFLAGS_LOG_INFO("Flag set [" << m_name << "]: " << detail << '.');
  }
  else
  {
    ZFLAGS_LOG_WARNING("Flag set [" << m_name << "]: command line rejected: " << detail << '.');
  }

  if (m_on_error == On_error::S_EXIT)
  {
    if (!help_requested)
    {
      std::cerr << m_name << ": " << detail << '\n';
    }
    print_help(std::cerr);
    std::cerr.flush();
    std::exit(help_requested ? EXIT_SUCCESS : 2);
  }
  // else

  ZFLAGS_ERROR_EMIT_ERROR(code);
} // Flag_set::handle_parse_error()

} // namespace zflags::cfg
