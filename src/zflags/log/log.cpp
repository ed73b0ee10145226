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
#include "zflags/log/log.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <ostream>

namespace zflags::log
{

// Implementations.

std::string sev_to_lower_str(Sev sev)
{
  switch (sev)
  {
  case Sev::S_DEBUG:
    return "debug";
  case Sev::S_INFO:
    return "info";
  case Sev::S_WARNING:
    return "warn";
  case Sev::S_ERROR:
    return "error";
  case Sev::S_DPANIC:
    return "dpanic";
  case Sev::S_PANIC:
    return "panic";
  case Sev::S_FATAL:
    return "fatal";
  }
  // Custom verbose (or otherwise unnamed) severity.
  return util::ostream_op_string("Level(", int(sev), ')');
}

std::string sev_to_capital_str(Sev sev)
{
  /* Every named value is the all-caps version of its lower-case name; and "Level(-5)" => "LEVEL(-5)" works too,
   * as digits and parentheses are unaffected. */
  return boost::algorithm::to_upper_copy(sev_to_lower_str(sev));
}

std::ostream& operator<<(std::ostream& os, Sev val)
{
  return os << sev_to_lower_str(val);
}

Field::Field(util::String_view key, Value value) :
  m_key(key),
  m_value(std::move(value))
{
  // Nothing else.
}

const std::string& Field::key() const
{
  return m_key;
}

const Field::Value& Field::value() const
{
  return m_value;
}

Field make_field(util::String_view key, util::String_view val)
{
  return Field(key, Field::Value(std::in_place_type<std::string>, val));
}

Field make_field(util::String_view key, const char* val)
{
  return make_field(key, util::String_view(val));
}

Field make_field(util::String_view key, double val)
{
  return Field(key, Field::Value(std::in_place_type<double>, val));
}

Field make_field(util::String_view key, bool val)
{
  return Field(key, Field::Value(std::in_place_type<bool>, val));
}

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing.
}

Log_context::Log_context(const Log_context& src) = default;

Log_context::Log_context(Log_context&& src) :
  m_logger(src.m_logger)
{
  src.m_logger = 0;
}

Log_context& Log_context::operator=(const Log_context& src) = default;

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src != this)
  {
    m_logger = src.m_logger;
    src.m_logger = 0;
  }
  return *this;
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

void Log_context::set_logger(Logger* logger)
{
  m_logger = logger;
}

void Log_context::swap(Log_context& other)
{
  using std::swap;
  swap(m_logger, other.m_logger);
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

Msg_fragment_writer::Msg_fragment_writer(Write_func&& write_func) :
  m_write_func(std::move(write_func))
{
  // Nothing else.
}

std::ostream& operator<<(std::ostream& os, const Msg_fragment_writer& val)
{
  val.m_write_func(os);
  return os;
}

} // namespace zflags::log
