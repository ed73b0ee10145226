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
#include "zflags/cfg/option_value.hpp"
#include "zflags/cfg/error.hpp"
#include "zflags/error/error.hpp"
#include "zflags/log/legacy_verbosity.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <algorithm>
#include <cassert>
#include <charconv>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

namespace zflags::cfg
{

// Static initializations.

namespace
{

/// Highest custom verbosity `N` whose `verbose_sev(N)` fits in log::Sev; the threshold of any higher `N` saturates.
const unsigned int S_MAX_SEV_VERBOSITY
  = -static_cast<int>(std::numeric_limits<std::underlying_type_t<log::Sev>>::min());

/// Highest custom verbosity that does not raise the log::Legacy_verbosity knob.
const unsigned int S_MAX_NON_LEGACY_VERBOSITY = 3;

} // namespace (anon)

// Option_value implementations.

Option_value::Option_value(log::Logger* logger_ptr) :
  log::Log_context(logger_ptr),
  m_is_set(false)
{
  // Nothing else.
}

void Option_value::set(util::String_view text, Error_code* err_code)
{
  if (zflags::error::exec_void_and_throw_on_error([&](Error_code* actual_err_code)
                                                    { set(text, actual_err_code); },
                                                  err_code, ZFLAGS_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else

  do_set(text, err_code);
  if (*err_code)
  {
    // It logged.
    return;
  }
  // else

  m_is_set = true;
  ZFLAGS_LOG_DEBUG("Option of type [" << type_name() << "] set from [" << text << "]; "
                   "value is now [" << str() << "].");
}

bool Option_value::is_set() const
{
  return m_is_set;
}

bool Option_value::is_bool_flag() const // Virtual.
{
  return false;
}

// Encoder_value implementations.

Encoder_value::Encoder_value(log::Logger* logger_ptr) :
  Option_value(logger_ptr)
{
  // Nothing else.
}

void Encoder_value::do_set(util::String_view text, Error_code* err_code) // Virtual.
{
  if (text == "json")
  {
    m_value = Encoder_choice::S_JSON;
  }
  else if (text == "console")
  {
    m_value = Encoder_choice::S_CONSOLE;
  }
  else
  {
    ZFLAGS_LOG_WARNING("Unknown encoder [" << text << "]; expected [json] or [console].");
    ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_INVALID_VALUE);
    return;
  }

  err_code->clear();
}

Encoder_choice Encoder_value::value() const
{
  return m_value.value_or(Encoder_choice::S_JSON);
}

std::string Encoder_value::str() const // Virtual.
{
  return m_value ? util::ostream_op_string(*m_value) : std::string();
}

std::string Encoder_value::type_name() const // Virtual.
{
  return "encoder";
}

// Level_value implementations.

Level_value::Level_value(log::Legacy_verbosity* legacy_verbosity, log::Logger* logger_ptr) :
  Option_value(logger_ptr),
  m_legacy_verbosity(legacy_verbosity),
  m_value(log::Sev::S_INFO),
  m_verbosity(0)
{
  // Nothing else.
}

void Level_value::do_set(util::String_view text, Error_code* err_code) // Virtual.
{
  const auto resolution = resolve_level(text, err_code);
  if (*err_code)
  {
    ZFLAGS_LOG_WARNING("Invalid log level [" << text << "]; expected [debug], [info], [error] or a positive "
                       "integer.");
    ZFLAGS_ERROR_LOG_ERROR(*err_code);
    return;
  }
  // else

  if (resolution.m_legacy_verbosity)
  {
    const auto verbosity = *resolution.m_legacy_verbosity;
    if (m_legacy_verbosity)
    {
      Error_code legacy_err_code;
      m_legacy_verbosity->set_verbosity(verbosity, &legacy_err_code);
      if (legacy_err_code)
      {
        ZFLAGS_LOG_WARNING("Log level [" << text << "] requires legacy verbosity [" << verbosity << "], but setting "
                           "it failed: [" << legacy_err_code << "] [" << legacy_err_code.message() << "].");
        ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_INVALID_VALUE);
        return;
      }
      // else
      ZFLAGS_LOG_INFO("Log level [" << text << "] raised legacy verbosity to [" << verbosity << "].");
    }
    else
    {
      ZFLAGS_LOG_DEBUG("Log level [" << text << "] implies legacy verbosity [" << verbosity << "], but there is "
                       "no legacy verbosity facility to set.");
    }
  }

  m_value = resolution.m_sev;
  m_verbosity = resolution.m_verbosity;
  err_code->clear();
} // Level_value::do_set()

log::Sev Level_value::value() const
{
  return m_value;
}

std::string Level_value::str() const // Virtual.
{
  using log::Sev;

  switch (m_value)
  {
  case Sev::S_DEBUG:
    return "debug";
  case Sev::S_INFO:
    return "info";
  case Sev::S_ERROR:
    return "error";
  default:
    // Only the above and custom verbose levels can be set.
    assert((m_value < Sev::S_DEBUG) && (m_verbosity != 0));
    return std::to_string(m_verbosity);
  }
}

std::string Level_value::type_name() const // Virtual.
{
  return "level";
}

// Sample_value implementations.

Sample_value::Sample_value(log::Logger* logger_ptr) :
  Option_value(logger_ptr),
  m_value(false)
{
  // Nothing else.
}

void Sample_value::do_set(util::String_view text, Error_code* err_code) // Virtual.
{
  if (!parse_bool(text, &m_value))
  {
    ZFLAGS_LOG_WARNING("Invalid sample setting [" << text << "]; expected a boolean.");
    ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_INVALID_VALUE);
    return;
  }
  err_code->clear();
}

bool Sample_value::value() const
{
  return m_value;
}

std::string Sample_value::str() const // Virtual.
{
  return m_value ? "true" : "false";
}

std::string Sample_value::type_name() const // Virtual.
{
  return "sample";
}

bool Sample_value::is_bool_flag() const // Virtual.
{
  return true;
}

// Time_format_value implementations.

Time_format_value::Time_format_value(log::Logger* logger_ptr) :
  Option_value(logger_ptr),
  m_value(Time_format::S_UNIX)
{
  // Nothing else.
}

void Time_format_value::do_set(util::String_view text, Error_code* err_code) // Virtual.
{
  if (text.size() <= 1)
  {
    // Too short to be a typo of anything; taken as the default.
    m_value = Time_format::S_UNIX;
  }
  else if (text == "unix")
  {
    m_value = Time_format::S_UNIX;
  }
  else if (text == "iso8601")
  {
    m_value = Time_format::S_ISO8601;
  }
  else
  {
    ZFLAGS_LOG_WARNING("Unknown time format [" << text << "]; expected [unix] or [iso8601].");
    ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_INVALID_VALUE);
    return;
  }

  err_code->clear();
}

Time_format Time_format_value::value() const
{
  return m_value;
}

std::string Time_format_value::str() const // Virtual.
{
  return util::ostream_op_string(m_value);
}

std::string Time_format_value::type_name() const // Virtual.
{
  return "string";
}

// Bool_value implementations.

Bool_value::Bool_value(bool default_value, log::Logger* logger_ptr) :
  Option_value(logger_ptr),
  m_value(default_value)
{
  // Nothing else.
}

void Bool_value::do_set(util::String_view text, Error_code* err_code) // Virtual.
{
  if (!parse_bool(text, &m_value))
  {
    ZFLAGS_LOG_WARNING("Invalid boolean [" << text << "].");
    ZFLAGS_ERROR_EMIT_ERROR(error::Code::S_INVALID_VALUE);
    return;
  }
  err_code->clear();
}

bool Bool_value::value() const
{
  return m_value;
}

std::string Bool_value::str() const // Virtual.
{
  return m_value ? "true" : "false";
}

std::string Bool_value::type_name() const // Virtual.
{
  return "bool";
}

bool Bool_value::is_bool_flag() const // Virtual.
{
  return true;
}

// Free function implementations.

Level_resolution resolve_level(util::String_view text, Error_code* err_code)
{
  ZFLAGS_ERROR_EXEC_AND_THROW_ON_ERROR(Level_resolution, resolve_level, text, _1);
  // else

  using boost::algorithm::to_lower_copy;
  using log::Sev;
  using std::string;

  Level_resolution resolution{Sev::S_INFO, 0, std::nullopt};

  const auto lower = to_lower_copy(string(text));
  if (lower == "debug")
  {
    resolution.m_sev = Sev::S_DEBUG;
  }
  else if (lower == "info")
  {
    resolution.m_sev = Sev::S_INFO;
  }
  else if (lower == "error")
  {
    resolution.m_sev = Sev::S_ERROR;
  }
  else
  {
    // Decimal integer, optionally with a leading '+'; the whole text must be consumed.
    const char* begin = lower.data();
    const char* const end = begin + lower.size();
    if ((begin != end) && (*begin == '+'))
    {
      ++begin;
    }

    // A '-' is not consumed, so negative input fails here too.
    unsigned int verbosity = 0;
    const auto result = std::from_chars(begin, end, verbosity);
    if ((begin == end) || (result.ec != std::errc()) || (result.ptr != end) || (verbosity == 0))
    {
      *err_code = error::Code::S_INVALID_VALUE;
      return resolution;
    }
    // else

    resolution.m_verbosity = verbosity;
    resolution.m_sev = log::verbose_sev(std::min(verbosity, S_MAX_SEV_VERBOSITY));
    if (verbosity > S_MAX_NON_LEGACY_VERBOSITY)
    {
      resolution.m_legacy_verbosity = verbosity;
    }
  }

  err_code->clear();
  return resolution;
} // resolve_level()

bool parse_bool(util::String_view text, bool* result)
{
  assert(result);

  if ((text == "1") || (text == "t") || (text == "T") || (text == "TRUE") || (text == "true") || (text == "True"))
  {
    *result = true;
    return true;
  }
  // else
  if ((text == "0") || (text == "f") || (text == "F") || (text == "FALSE") || (text == "false") || (text == "False"))
  {
    *result = false;
    return true;
  }
  // else
  return false;
}

std::ostream& operator<<(std::ostream& os, Encoder_choice val)
{
  return os << ((val == Encoder_choice::S_CONSOLE) ? "console" : "json");
}

std::ostream& operator<<(std::ostream& os, Time_format val)
{
  return os << ((val == Time_format::S_ISO8601) ? "iso8601" : "unix");
}

} // namespace zflags::cfg
