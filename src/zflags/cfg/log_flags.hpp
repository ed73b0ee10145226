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
#include "zflags/cfg/logger_factory.hpp"
#include "zflags/cfg/option_value.hpp"
#include "zflags/log/log.hpp"
#include <boost/noncopyable.hpp>

namespace zflags::cfg
{

// Types.

/**
 * The `-zap-*` command-line flag group: owns one Option_value cell per flag, registers them into a Flag_set, and
 * snapshots them into a Logger_options after parsing.
 *
 * The flags:
 *   - `-zap-devel` (Bool_value): development mode.
 *   - `-zap-encoder` (Encoder_value): "json" or "console".
 *   - `-zap-level` (Level_value): "debug", "info", "error" or a positive integer; see resolve_level().
 *   - `-zap-sample` (Sample_value): sampling on or off.
 *   - `-zap-timeformat` (Time_format_value): "unix" or "iso8601".
 *
 * The cells are public, so that a caller can inspect or set them without going through a command line.  A cell
 * counts as given (for options()) if and only if it is_set().
 */
class Log_flags :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// Name of the development mode flag.
  static const util::String_view S_DEVEL_FLAG_NAME;

  /// Name of the encoder flag.
  static const util::String_view S_ENCODER_FLAG_NAME;

  /// Name of the level flag.
  static const util::String_view S_LEVEL_FLAG_NAME;

  /// Name of the sampling flag.
  static const util::String_view S_SAMPLE_FLAG_NAME;

  /// Name of the time format flag.
  static const util::String_view S_TIME_FORMAT_FLAG_NAME;

  // Constructors/destructor.

  /**
   * Constructs the cells, all unset.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging, by `*this` and the cells.
   * @param legacy_verbosity
   *        Knob to raise for high custom verbosity levels; see Level_value.  Null means none.  Must outlive `*this`.
   */
  explicit Log_flags(log::Logger* logger_ptr = 0,
                     log::Legacy_verbosity* legacy_verbosity = default_legacy_verbosity());

  // Methods.

  /**
   * Registers the five flags into the given set.
   *
   * @param flag_set
   *        Not null.  Must not outlive `*this`.
   * @param err_code
   *        See zflags::Error_code docs for error reporting semantics.  Errors as from Flag_set::add_flag(); on error
   *        some of the flags may have been registered.
   */
  void register_flags(Flag_set* flag_set, Error_code* err_code = 0);

  /**
   * Snapshot of the cells.
   *
   * @return See above.
   */
  Logger_options options() const;

  /**
   * The process-wide log::Legacy_verbosity: log::Process_legacy_verbosity::get_singleton().
   *
   * @return See above.
   */
  static log::Legacy_verbosity* default_legacy_verbosity();

  // Data.  (Public!)

  /// `-zap-devel`.
  Bool_value m_devel;

  /// `-zap-encoder`.
  Encoder_value m_encoder;

  /// `-zap-level`.
  Level_value m_level;

  /// `-zap-sample`.
  Sample_value m_sample;

  /// `-zap-timeformat`.
  Time_format_value m_time_format;
}; // class Log_flags

} // namespace zflags::cfg
