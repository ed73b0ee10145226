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
#include "zflags/log/log_fwd.hpp"
#include <optional>

namespace zflags::cfg
{

// Types.

/**
 * The flag snapshot from which build_logger() builds a Logger: for each choice either the value given on the command
 * line or, where the choice is optional and was not given, empty (so that build_logger() applies its own default).
 * Typically obtained from Log_flags::options(), but may be filled out directly.
 */
struct Logger_options
{
  // Data.

  /// Development mode: forces console encoding, debug level and no sampling.
  bool m_development;

  /// Encoding; empty means json (unless development mode).
  std::optional<Encoder_choice> m_encoder;

  /// Minimum severity; empty means info (unless development mode).
  std::optional<log::Sev> m_level;

  /// Sampling; empty means on (unless development mode or a level more verbose than debug).
  std::optional<bool> m_sample;

  /// Time stamp format.
  Time_format m_time_format;
}; // struct Logger_options

/**
 * What build_logger() builds, after the development-mode overrides and defaults are applied to Logger_options.
 * See resolve_logger_config().
 */
struct Resolved_logger_config
{
  // Data.

  /// Encoding.
  Encoder_choice m_encoder;

  /// Minimum severity.
  log::Sev m_level;

  /// Whether records are sampled.
  bool m_sample;

  /// Time stamp format.
  Time_format m_time_format;
}; // struct Resolved_logger_config

} // namespace zflags::cfg
