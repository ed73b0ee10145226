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
#include "zflags/cfg/logger_factory.hpp"
#include "zflags/log/encoder.hpp"
#include "zflags/log/sampling_logger.hpp"
#include "zflags/log/stream_logger.hpp"
#include <iostream>
#include <ostream>

namespace zflags::cfg
{

// Implementations.

Resolved_logger_config resolve_logger_config(const Logger_options& options)
{
  using log::Sev;

  if (options.m_development)
  {
    return Resolved_logger_config{Encoder_choice::S_CONSOLE, Sev::S_DEBUG, false, options.m_time_format};
  }
  // else

  const auto level = options.m_level.value_or(Sev::S_INFO);
  const bool sample = (level >= Sev::S_DEBUG) && options.m_sample.value_or(true);

  return Resolved_logger_config{options.m_encoder.value_or(Encoder_choice::S_JSON), level, sample,
                                options.m_time_format};
}

std::unique_ptr<log::Encoder> build_encoder(Encoder_choice encoder, Time_format time_format)
{
  using log::Encoder_config;

  auto config = (encoder == Encoder_choice::S_CONSOLE) ? Encoder_config::development()
                                                       : Encoder_config::production();
  if (time_format == Time_format::S_ISO8601)
  {
    config.m_time_encoding = Encoder_config::Time_encoding::S_ISO8601;
  }

  if (encoder == Encoder_choice::S_CONSOLE)
  {
    return std::make_unique<log::Console_encoder>(config);
  }
  // else
  return std::make_unique<log::Json_encoder>(config);
}

std::unique_ptr<log::Logger> build_logger(const Logger_options& options, std::ostream& os)
{
  const auto resolved = resolve_logger_config(options);

  std::unique_ptr<log::Logger> logger
    = std::make_unique<log::Stream_logger>(resolved.m_level,
                                           build_encoder(resolved.m_encoder, resolved.m_time_format),
                                           os);
  if (resolved.m_sample)
  {
    logger = std::make_unique<log::Sampling_logger>(std::move(logger));
  }

  return logger;
}

std::unique_ptr<log::Logger> build_logger(const Logger_options& options)
{
  return build_logger(options, std::cerr);
}

std::unique_ptr<log::Logger> build_logger(bool development, Encoder_choice encoder, log::Sev level, bool sample,
                                          Time_format time_format, std::ostream& os)
{
  return build_logger(Logger_options{development, encoder, level, sample, time_format}, os);
}

std::unique_ptr<log::Logger> build_logger(bool development, Encoder_choice encoder, log::Sev level, bool sample,
                                          Time_format time_format)
{
  return build_logger(development, encoder, level, sample, time_format, std::cerr);
}

bool operator==(const Resolved_logger_config& val1, const Resolved_logger_config& val2)
{
  return (val1.m_encoder == val2.m_encoder) && (val1.m_level == val2.m_level)
         && (val1.m_sample == val2.m_sample) && (val1.m_time_format == val2.m_time_format);
}

bool operator!=(const Resolved_logger_config& val1, const Resolved_logger_config& val2)
{
  return !(val1 == val2);
}

std::ostream& operator<<(std::ostream& os, const Resolved_logger_config& val)
{
  return os << "encoder [" << val.m_encoder << "] level [" << val.m_level << "] "
               "sample [" << (val.m_sample ? "true" : "false") << "] time_format [" << val.m_time_format << ']';
}

} // namespace zflags::cfg
