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
#include "zflags/cfg/log_flags.hpp"
#include "zflags/cfg/flag_set.hpp"
#include "zflags/error/error.hpp"
#include "zflags/log/legacy_verbosity.hpp"
#include <cassert>

namespace zflags::cfg
{

// Static initializations.

const util::String_view Log_flags::S_DEVEL_FLAG_NAME = "zap-devel";
const util::String_view Log_flags::S_ENCODER_FLAG_NAME = "zap-encoder";
const util::String_view Log_flags::S_LEVEL_FLAG_NAME = "zap-level";
const util::String_view Log_flags::S_SAMPLE_FLAG_NAME = "zap-sample";
const util::String_view Log_flags::S_TIME_FORMAT_FLAG_NAME = "zap-timeformat";

// Implementations.

Log_flags::Log_flags(log::Logger* logger_ptr, log::Legacy_verbosity* legacy_verbosity) :
  log::Log_context(logger_ptr),
  m_devel(false, logger_ptr),
  m_encoder(logger_ptr),
  m_level(legacy_verbosity, logger_ptr),
  m_sample(logger_ptr),
  m_time_format(logger_ptr)
{
  // Nothing else.
}

log::Legacy_verbosity* Log_flags::default_legacy_verbosity() // Static.
{
  return &(log::Process_legacy_verbosity::get_singleton());
}

void Log_flags::register_flags(Flag_set* flag_set, Error_code* err_code)
{
  if (zflags::error::exec_void_and_throw_on_error([&](Error_code* actual_err_code)
                                                    { register_flags(flag_set, actual_err_code); },
                                                  err_code, ZFLAGS_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else

  assert(flag_set);

  flag_set->add_flag(S_DEVEL_FLAG_NAME, &m_devel,
                     "Enable zap development mode (changes defaults to console encoder, debug log level, "
                       "and disables sampling)",
                     err_code);
  if (!*err_code)
  {
    flag_set->add_flag(S_ENCODER_FLAG_NAME, &m_encoder, "Zap log encoding ('json' or 'console')", err_code);
  }
  if (!*err_code)
  {
    flag_set->add_flag(S_LEVEL_FLAG_NAME, &m_level,
                       "Zap log level (one of 'debug', 'info', 'error' or any integer value > 0)", err_code);
  }
  if (!*err_code)
  {
    flag_set->add_flag(S_SAMPLE_FLAG_NAME, &m_sample,
                       "Enable zap log sampling. Sampling will be disabled for integer log levels > 1", err_code);
  }
  if (!*err_code)
  {
    flag_set->add_flag(S_TIME_FORMAT_FLAG_NAME, &m_time_format,
                       "Use 'unix' or 'iso8601' time formatting. 'unix' is the default.", err_code);
  }

  if (*err_code)
  {
    ZFLAGS_LOG_WARNING("Could not register the zap flags into flag set [" << flag_set->name() << "].");
    return;
  }
  // else
  ZFLAGS_LOG_DEBUG("Registered the zap flags into flag set [" << flag_set->name() << "].");
} // Log_flags::register_flags()

Logger_options Log_flags::options() const
{
  Logger_options options{m_devel.value(), std::nullopt, std::nullopt, std::nullopt, m_time_format.value()};
  if (m_encoder.is_set())
  {
    options.m_encoder = m_encoder.value();
  }
  if (m_level.is_set())
  {
    options.m_level = m_level.value();
  }
  if (m_sample.is_set())
  {
    options.m_sample = m_sample.value();
  }
  return options;
}

} // namespace zflags::cfg
