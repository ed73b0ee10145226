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

#include "zflags/log/log_fwd.hpp"
#include "zflags/util/util_fwd.hpp"
#include <iosfwd>
#include <memory>

/**
 * zflags module that turns command-line flags into a configured log::Logger.  The pieces, leaf first:
 *   - Option_value and its subclasses: one settable, stringable cell per flag, each validating its own text.
 *     Level_value (via resolve_level()) also carries the rule coupling high custom verbosity to the
 *     log::Legacy_verbosity knob.
 *   - Flag_set: a named-option registry that parses a command line (via boost.program_options) into the cells.
 *   - Log_flags: the "zap" flag group (`-zap-devel`, `-zap-encoder`, `-zap-level`, `-zap-sample`,
 *     `-zap-timeformat`); owns one cell per flag and snapshots them into a Logger_options.
 *   - build_encoder() and build_logger(): turn a Logger_options into a log::Encoder and a log::Logger, applying
 *     the development-mode overrides and defaults (see resolve_logger_config()).
 *
 * Typical use:
 *
 *   ~~~
 *   Flag_set flag_set(nullptr, "zap", Flag_set::On_error::S_EXIT);
 *   Log_flags log_flags;
 *   log_flags.register_flags(&flag_set);
 *   flag_set.parse(argc, argv); // Exits with usage message on bad flags.
 *   const auto logger = build_logger(log_flags.options());
 *   ~~~
 *
 * ### Thread safety ###
 * Flag parsing and logger construction are meant for the startup phase, on one thread; the objects of this module
 * are not safe for concurrent mutation.  The resulting log::Logger is safe for concurrent logging.
 */
namespace zflags::cfg
{
// Types.

// Find doc headers near the bodies of these compound types.

class Bool_value;
class Encoder_value;
class Flag_set;
class Level_value;
class Log_flags;
struct Level_resolution;
struct Logger_options;
class Option_value;
struct Resolved_logger_config;
class Sample_value;
class Time_format_value;

/// Output encoding choice.
enum class Encoder_choice
{
  /// log::Json_encoder with the production baseline.  Flag text: "json".
  S_JSON,
  /// log::Console_encoder with the development baseline.  Flag text: "console".
  S_CONSOLE
};

/// Time stamp rendering choice.
enum class Time_format
{
  /// Seconds since epoch (log::Encoder_config::Time_encoding::S_EPOCH).  Flag text: "unix".
  S_UNIX,
  /// ISO-8601 (log::Encoder_config::Time_encoding::S_ISO8601).  Flag text: "iso8601".
  S_ISO8601
};

// Free functions.

/**
 * Serializes an Encoder_choice as its flag text: "json" or "console".
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Encoder_choice val);

/**
 * Serializes a Time_format as its flag text: "unix" or "iso8601".
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Time_format val);

/**
 * Prints string representation of the given resolved configuration to the given `ostream`.
 *
 * @relatesalso Resolved_logger_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Resolved_logger_config& val);

/**
 * Returns `true` if and only if the two resolved configurations are equal in every member; hence build_logger()
 * would produce equivalent loggers from them.
 *
 * @relatesalso Resolved_logger_config
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Resolved_logger_config& val1, const Resolved_logger_config& val2);

/**
 * Negation of the similar `==`.
 *
 * @relatesalso Resolved_logger_config
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Resolved_logger_config& val1, const Resolved_logger_config& val2);

/**
 * Applies the development-mode overrides and the defaults to the given flag snapshot: the decisions
 * build_logger() acts on.
 *
 *   - If `options.m_development`: encoder console, level debug, sampling off, regardless of the other choices.
 *   - Otherwise: encoder as given or json; level as given or info; sampling as given or on, but off anyway
 *     if the level is more verbose than debug.
 *   - The time format is taken as given either way.
 *
 * @param options
 *        Flag snapshot.
 * @return See above.
 */
Resolved_logger_config resolve_logger_config(const Logger_options& options);

/**
 * Builds the output Encoder for the given choices: starting from log::Encoder_config::production() for json or
 * log::Encoder_config::development() for console, with the time encoding replaced by ISO-8601 if so chosen.
 * Never fails.
 *
 * @param encoder
 *        Encoder choice.
 * @param time_format
 *        Time format choice.
 * @return See above.  Not null.
 */
std::unique_ptr<log::Encoder> build_encoder(Encoder_choice encoder, Time_format time_format);

/**
 * Builds a Logger from the given flag snapshot: resolves it via resolve_logger_config(); builds the Encoder via
 * build_encoder(); constructs a log::Stream_logger writing to `os` at the resolved severity threshold; and wraps it
 * in a log::Sampling_logger (with default parameters) if and only if sampling resolved to on.
 *
 * @param options
 *        Flag snapshot, typically Log_flags::options().
 * @param os
 *        Destination of log records.  Must outlive the returned Logger.
 * @return See above.  Not null.
 */
std::unique_ptr<log::Logger> build_logger(const Logger_options& options, std::ostream& os);

/**
 * Identical to the other build_logger() overload taking Logger_options but writes to `std::cerr`.
 *
 * @param options
 *        See other overload.
 * @return See above.
 */
std::unique_ptr<log::Logger> build_logger(const Logger_options& options);

/**
 * Equivalent to the build_logger() overload taking Logger_options, given one in which every choice is explicitly
 * made.
 *
 * @param development
 *        Development mode.
 * @param encoder
 *        Encoder choice.
 * @param level
 *        Minimum severity.
 * @param sample
 *        Sampling choice.
 * @param time_format
 *        Time format choice.
 * @param os
 *        See other overload.
 * @return See above.
 */
std::unique_ptr<log::Logger> build_logger(bool development, Encoder_choice encoder, log::Sev level, bool sample,
                                          Time_format time_format, std::ostream& os);

/**
 * Identical to the other build_logger() overload taking explicit choices but writes to `std::cerr`.
 *
 * @param development
 *        See other overload.
 * @param encoder
 *        See other overload.
 * @param level
 *        See other overload.
 * @param sample
 *        See other overload.
 * @param time_format
 *        See other overload.
 * @return See above.
 */
std::unique_ptr<log::Logger> build_logger(bool development, Encoder_choice encoder, log::Sev level, bool sample,
                                          Time_format time_format);

} // namespace zflags::cfg
