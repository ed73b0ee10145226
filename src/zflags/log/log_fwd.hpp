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

#include "zflags/common.hpp"
#include <iosfwd>
#include <string>
#include <vector>

/**
 * zflags module providing the structured logging engine: severities, key/value fields, the Logger interface with its
 * `ZFLAGS_LOG_*()` call-site macros, the JSON and console Encoder implementations, loggers writing to an `ostream`
 * or to a memory buffer, a sampling decorator, and the interface to the legacy verbosity knob.
 *
 * ### Severities ###
 * Sev is a *signed* severity: more negative means more verbose.  The named values (from Sev::S_DEBUG = -1 up to
 * Sev::S_FATAL = 5) have names ("debug", "info", ...); any value below Sev::S_DEBUG is a "custom verbose" severity,
 * written `-N` for verbosity `N` (see verbose_sev()).  A Logger with threshold `T` logs a message of severity `S` if
 * and only if `S >= T`.
 *
 * Severities do not have side effects: logging at Sev::S_FATAL does not terminate the program.
 */
namespace zflags::log
{

// Types.

// Find doc headers near the bodies of these compound types.

class Buffer_logger;
class Config;
class Encoder;
struct Encoder_config;
class Field;
class Json_encoder;
class Console_encoder;
class Legacy_verbosity;
class Logger;
class Log_context;
struct Msg_metadata;
class Process_legacy_verbosity;
class Sampling_logger;
class Stream_logger;

/// Short-hand for a sequence of structured key/value fields, in the order they shall be output.
using Fields = std::vector<Field>;

/**
 * Message severity, signed: the lower the value, the more verbose.  Values below #S_DEBUG are legal; they are the
 * custom verbose severities (see verbose_sev()).  Values above #S_FATAL are not produced by zflags itself but are
 * output as custom values too.
 */
enum class Sev : int8_t
{
  /// Debug messages: voluminous, usually disabled in production.
  S_DEBUG = -1,
  /// The default minimum severity.
  S_INFO = 0,
  /// More important than info, but not needing individual human review.
  S_WARNING = 1,
  /// High-priority: something went wrong that a human should look at.
  S_ERROR = 2,
  /// Particularly important error; in a development setting it might be worth stopping the program for.
  S_DPANIC = 3,
  /// Very important error.
  S_PANIC = 4,
  /// The most severe value.
  S_FATAL = 5
}; // enum class Sev

// Free functions.

/**
 * Returns the custom verbose severity corresponding to verbosity `verbosity`, namely `Sev(-verbosity)`.
 * Thus `verbose_sev(1) == Sev::S_DEBUG`.  Behavior is undefined if `-verbosity` does not fit Sev's underlying type.
 *
 * @param verbosity
 *        Positive verbosity.
 * @return See above.
 */
constexpr Sev verbose_sev(unsigned int verbosity);

/**
 * Returns the lower-case name of the given severity, as output by production-style encoders: "debug", "info",
 * "warn", "error", "dpanic", "panic", "fatal"; or for any other value `V` "Level(V)", such as "Level(-5)".
 *
 * @param sev
 *        Severity.
 * @return See above.
 */
std::string sev_to_lower_str(Sev sev);

/**
 * Like sev_to_lower_str() but all-caps: "DEBUG", ..., "FATAL"; or "LEVEL(V)".
 *
 * @param sev
 *        Severity.
 * @return See above.
 */
std::string sev_to_capital_str(Sev sev);

/**
 * Serializes a Sev to a standard output stream: equivalent to `os << sev_to_lower_str(val)`.
 *
 * @relatesalso Sev
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Returns `true` if and only if `sev` is at least as verbose as `threshold` would let through: `sev >= threshold`.
 * For the avoidance of doubt this compares the signed values.
 *
 * @param sev
 *        Severity of a message.
 * @param threshold
 *        Most verbose severity to let through.
 * @return See above.
 */
constexpr bool sev_passes(Sev sev, Sev threshold);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Log_context
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

// Template implementations.

constexpr Sev verbose_sev(unsigned int verbosity)
{
  return static_cast<Sev>(-static_cast<int>(verbosity));
}

constexpr bool sev_passes(Sev sev, Sev threshold)
{
  return static_cast<int>(sev) >= static_cast<int>(threshold);
}

} // namespace zflags::log
