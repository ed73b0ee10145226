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
#include "zflags/util/util.hpp"
#include <boost/noncopyable.hpp>
#include <optional>
#include <string>

namespace zflags::cfg
{

// Types.

/**
 * A settable, stringable configuration cell holding the parsed value of one command-line flag.  Flag_set dispatches
 * on this interface: for each occurrence of a flag it calls set() with the text given for it, and it uses str(),
 * type_name() and is_bool_flag() for usage messages and for deciding whether the flag takes a value.
 *
 * Each subclass implements do_set() to validate and parse its own grammar.  The non-virtual set() wraps it with the
 * behavior common to all cells:
 *   - On failure the cell is left exactly as it was before the call, and the error is
 *     error::Code::S_INVALID_VALUE (reported per the zflags::Error_code convention).
 *   - On success is_set() becomes `true` and stays so; a later successful set() overwrites the value.
 *
 * ### Thread safety ###
 * Not safe for concurrent mutation; concurrent `const` access is safe.
 */
class Option_value :
  public util::Null_interface,
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Parses `text` and, if valid, stores the result.
   *
   * @param text
   *        Flag value as typed.
   * @param err_code
   *        See zflags::Error_code docs for error reporting semantics.  zflags::cfg::error::Code generated:
   *        error::Code::S_INVALID_VALUE.
   */
  void set(util::String_view text, Error_code* err_code = 0);

  /**
   * Whether set() has succeeded at least once.
   *
   * @return See above.
   */
  bool is_set() const;

  /**
   * Current value, as it would be given on the command line.
   *
   * @return See above.
   */
  virtual std::string str() const = 0;

  /**
   * Brief name of the value's type, for usage messages.
   *
   * @return See above.
   */
  virtual std::string type_name() const = 0;

  /**
   * Whether the flag may be given without a value (`-flag` alone meaning `-flag=true`).  Default: `false`.
   *
   * @return See above.
   */
  virtual bool is_bool_flag() const;

protected:
  // Constructors/destructor.

  /**
   * Constructs an unset cell.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging (null means do not log).
   */
  explicit Option_value(log::Logger* logger_ptr);

  // Methods.

  /**
   * Parses `text` and, if valid, stores the result; otherwise emits error::Code::S_INVALID_VALUE via
   * ZFLAGS_ERROR_EMIT_ERROR() and changes nothing.
   *
   * @param text
   *        See set().
   * @param err_code
   *        Not null.  Must be cleared on success.
   */
  virtual void do_set(util::String_view text, Error_code* err_code) = 0;

private:
  // Data.

  /// See is_set().
  bool m_is_set;
}; // class Option_value

/// Option_value for the output encoding: exactly "json" or "console".  Unset, str() is empty.
class Encoder_value :
  public Option_value
{
public:
  // Constructors/destructor.

  /**
   * Constructs an unset cell.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Encoder_value(log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * The value, or Encoder_choice::S_JSON if not is_set().
   *
   * @return See above.
   */
  Encoder_choice value() const;

  /**
   * Implements interface method.
   *
   * @return See above.
   */
  std::string str() const override;

  /**
   * Implements interface method: "encoder".
   *
   * @return See above.
   */
  std::string type_name() const override;

protected:
  // Methods.

  /**
   * Implements interface method.
   *
   * @param text
   *        See Option_value::do_set().
   * @param err_code
   *        See Option_value::do_set().
   */
  void do_set(util::String_view text, Error_code* err_code) override;

private:
  // Data.

  /// See value().
  std::optional<Encoder_choice> m_value;
}; // class Encoder_value

/**
 * Result of resolve_level(): the severity threshold and, if the requested verbosity is high enough, the verbosity
 * that the log::Legacy_verbosity knob should be raised to.
 */
struct Level_resolution
{
  // Data.

  /// Severity threshold.
  log::Sev m_sev;

  /// The custom verbosity `N` as typed; 0 for a named level.
  unsigned int m_verbosity;

  /// Non-empty if and only if #m_verbosity exceeds 3; then equals #m_verbosity.
  std::optional<unsigned int> m_legacy_verbosity;
};

/**
 * Option_value for the minimum severity: "debug", "info", "error" (any case), or a positive integer `N` meaning
 * the custom verbose severity `-N`.  The named levels never touch the log::Legacy_verbosity knob; `N` greater
 * than 3 sets it to `N` (see resolve_level()).  If setting the knob fails, set() fails, and the cell is unchanged.
 *
 * str() is the canonical flag text: "debug", "info", "error", or the decimal `N`.  Unset, value() is
 * log::Sev::S_INFO.  A value() threshold cannot be more verbose than the lowest log::Sev; str() still reports the
 * `N` that was set.
 */
class Level_value :
  public Option_value
{
public:
  // Constructors/destructor.

  /**
   * Constructs an unset cell.
   *
   * @param legacy_verbosity
   *        The knob raised by high custom verbosities; null means there is none.  Must outlive `*this`.
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Level_value(log::Legacy_verbosity* legacy_verbosity, log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * The value, or log::Sev::S_INFO if not is_set().
   *
   * @return See above.
   */
  log::Sev value() const;

  /**
   * Implements interface method.
   *
   * @return See above.
   */
  std::string str() const override;

  /**
   * Implements interface method: "level".
   *
   * @return See above.
   */
  std::string type_name() const override;

protected:
  // Methods.

  /**
   * Implements interface method.
   *
   * @param text
   *        See Option_value::do_set().
   * @param err_code
   *        See Option_value::do_set().
   */
  void do_set(util::String_view text, Error_code* err_code) override;

private:
  // Data.

  /// See ctor.
  log::Legacy_verbosity* const m_legacy_verbosity;

  /// See value().
  log::Sev m_value;

  /// Custom verbosity `N` last set; 0 if a named level (or nothing) was set.  See str().
  unsigned int m_verbosity;
}; // class Level_value

/// Option_value for the sampling switch: a boolean (see parse_bool()), usable as a bare flag.  Default `false`.
class Sample_value :
  public Option_value
{
public:
  // Constructors/destructor.

  /**
   * Constructs an unset cell.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Sample_value(log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * The value; `false` if not is_set().
   *
   * @return See above.
   */
  bool value() const;

  /**
   * Implements interface method: "true" or "false".
   *
   * @return See above.
   */
  std::string str() const override;

  /**
   * Implements interface method: "sample".
   *
   * @return See above.
   */
  std::string type_name() const override;

  /**
   * Implements interface method: `true`.
   *
   * @return See above.
   */
  bool is_bool_flag() const override;

protected:
  // Methods.

  /**
   * Implements interface method.
   *
   * @param text
   *        See Option_value::do_set().
   * @param err_code
   *        See Option_value::do_set().
   */
  void do_set(util::String_view text, Error_code* err_code) override;

private:
  // Data.

  /// See value().
  bool m_value;
}; // class Sample_value

/**
 * Option_value for the time stamp format: "unix" or "iso8601".  Text of length 0 or 1 is accepted and means "unix";
 * any other text fails.  Not a bool flag: a value is always required.
 */
class Time_format_value :
  public Option_value
{
public:
  // Constructors/destructor.

  /**
   * Constructs an unset cell.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Time_format_value(log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * The value; Time_format::S_UNIX if not is_set().
   *
   * @return See above.
   */
  Time_format value() const;

  /**
   * Implements interface method.
   *
   * @return See above.
   */
  std::string str() const override;

  /**
   * Implements interface method: "string".
   *
   * @return See above.
   */
  std::string type_name() const override;

protected:
  // Methods.

  /**
   * Implements interface method.
   *
   * @param text
   *        See Option_value::do_set().
   * @param err_code
   *        See Option_value::do_set().
   */
  void do_set(util::String_view text, Error_code* err_code) override;

private:
  // Data.

  /// See value().
  Time_format m_value;
}; // class Time_format_value

/// Plain boolean Option_value, usable as a bare flag.  Same grammar as Sample_value.
class Bool_value :
  public Option_value
{
public:
  // Constructors/destructor.

  /**
   * Constructs an unset cell.
   *
   * @param default_value
   *        value() until set.
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Bool_value(bool default_value = false, log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * The value.
   *
   * @return See above.
   */
  bool value() const;

  /**
   * Implements interface method: "true" or "false".
   *
   * @return See above.
   */
  std::string str() const override;

  /**
   * Implements interface method: "bool".
   *
   * @return See above.
   */
  std::string type_name() const override;

  /**
   * Implements interface method: `true`.
   *
   * @return See above.
   */
  bool is_bool_flag() const override;

protected:
  // Methods.

  /**
   * Implements interface method.
   *
   * @param text
   *        See Option_value::do_set().
   * @param err_code
   *        See Option_value::do_set().
   */
  void do_set(util::String_view text, Error_code* err_code) override;

private:
  // Data.

  /// See value().
  bool m_value;
}; // class Bool_value

// Free functions.

/**
 * Resolves the text of a level flag into a severity threshold and the implied legacy verbosity, without side effects.
 * The text is lower-cased; then "debug", "info" and "error" map to log::Sev::S_DEBUG, log::Sev::S_INFO and
 * log::Sev::S_ERROR.  Anything else must be a positive decimal integer `N` (an optional leading `+` is allowed)
 * fitting in `unsigned int`, mapping to `log::verbose_sev(N)`, or to the most verbose log::Sev if `-N` does not fit
 * in it (`N > 128`); and if `N > 3` Level_resolution::m_legacy_verbosity is `N`, regardless of that saturation.
 *
 * @param text
 *        Flag value as typed.
 * @param err_code
 *        See zflags::Error_code docs for error reporting semantics.  zflags::cfg::error::Code generated:
 *        error::Code::S_INVALID_VALUE.
 * @return See above.  Unspecified on error.
 */
Level_resolution resolve_level(util::String_view text, Error_code* err_code = 0);

/**
 * Parses a boolean literal: "1", "t", "T", "TRUE", "true", "True" are `true`; "0", "f", "F", "FALSE", "false",
 * "False" are `false`; anything else is an error.
 *
 * @param text
 *        Text to parse.
 * @param result
 *        Non-null; receives the value on success and is untouched otherwise.
 * @return `true` if and only if `text` is one of the above.
 */
bool parse_bool(util::String_view text, bool* result);

} // namespace zflags::cfg
