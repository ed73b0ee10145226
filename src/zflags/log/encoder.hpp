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

#include "zflags/log/log.hpp"
#include <string>

namespace zflags::log
{

// Types.

/**
 * The field layout and value renderings an Encoder applies to each log record.  An empty key means that element of
 * the record is omitted.  Start from production() or development(), then adjust.
 */
struct Encoder_config
{
  // Types.

  /// How the severity is rendered.
  enum class Level_encoding
  {
    /// sev_to_lower_str(): "info", "Level(-5)".
    S_LOWER,
    /// sev_to_capital_str(): "INFO", "LEVEL(-5)".
    S_CAPITAL
  };

  /// How the time stamp is rendered.
  enum class Time_encoding
  {
    /// Seconds since the POSIX epoch, with microsecond fraction: "1572345678.123456"; a number in JSON.
    S_EPOCH,
    /// ISO-8601 local time with milliseconds and UTC offset: "2019-10-29T10:41:18.123+0100"; a string in JSON.
    S_ISO8601
  };

  // Data.

  /// Key for the message.
  std::string m_message_key;

  /// Key for the severity.
  std::string m_level_key;

  /// Key for the time stamp.
  std::string m_time_key;

  /// Key for the call site, rendered as "file.cpp:line".
  std::string m_caller_key;

  /// See #Level_encoding.
  Level_encoding m_level_encoding;

  /// See #Time_encoding.
  Time_encoding m_time_encoding;

  /// Appended after each record.
  std::string m_line_ending;

  // Methods.

  /**
   * Returns the production baseline: keys "msg", "level", "ts", "caller"; lower-case levels; epoch time.
   *
   * @return See above.
   */
  static Encoder_config production();

  /**
   * Returns the development baseline: keys "M", "L", "T", "C"; capital levels; epoch time.
   *
   * @return See above.
   */
  static Encoder_config development();
}; // struct Encoder_config

/**
 * Turns one log record (metadata, message, structured fields) into one line of bytes, as configured by the
 * Encoder_config passed to the ctor.  Implementations: Json_encoder, Console_encoder.
 *
 * ### Thread safety ###
 * encode() is `const` and touches nothing but its arguments and `m_config`; it is safe to call concurrently.
 */
class Encoder :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Appends the encoded record, including Encoder_config::m_line_ending, to `*target`.
   *
   * @param metadata
   *        The record's metadata; its `m_fields`, if not null, follow the message.
   * @param msg
   *        The message.
   * @param target
   *        String to which to append.
   */
  virtual void encode(const Msg_metadata& metadata, util::String_view msg, std::string* target) const = 0;

  // Data.  (Public!)

  /// The configuration passed to ctor.
  const Encoder_config m_config;

protected:
  // Constructors/destructor.

  /**
   * Saves the config.
   *
   * @param config
   *        See #m_config.
   */
  explicit Encoder(const Encoder_config& config);

  // Methods.

  /**
   * Returns the severity rendered per #m_config.
   *
   * @param sev
   *        Severity.
   * @return See above.
   */
  std::string level_str(Sev sev) const;

  /**
   * Returns the time stamp rendered per #m_config, unquoted.
   *
   * @param time_stamp
   *        Time stamp.
   * @return See above.
   */
  std::string time_str(const Msg_metadata::Time_stamp& time_stamp) const;
}; // class Encoder

/**
 * Encoder that outputs each record as a single-line JSON object: severity, time, caller, message, then the fields
 * in order.  Example (production baseline):
 *
 *   ~~~
 *   {"level":"info","ts":1572345678.123456,"caller":"main.cpp:42","msg":"Started.","port":8080}
 *   ~~~
 */
class Json_encoder :
  public Encoder
{
public:
  // Constructors/destructor.

  /**
   * Constructs the encoder.
   *
   * @param config
   *        Configuration.
   */
  explicit Json_encoder(const Encoder_config& config);

  // Methods.

  /**
   * Implements interface method.
   *
   * @param metadata
   *        See Encoder::encode().
   * @param msg
   *        See Encoder::encode().
   * @param target
   *        See Encoder::encode().
   */
  void encode(const Msg_metadata& metadata, util::String_view msg, std::string* target) const override;
}; // class Json_encoder

/**
 * Encoder that outputs each record as tab-separated human-readable elements (time, severity, caller, message),
 * followed, if there are any fields, by a tab and the fields as a JSON object.  Example (development baseline):
 *
 *   ~~~
 *   1572345678.123456	INFO	main.cpp:42	Started.	{"port": 8080}
 *   ~~~
 *
 * The keys in Encoder_config matter only in that an empty key omits its element.
 */
class Console_encoder :
  public Encoder
{
public:
  // Constructors/destructor.

  /**
   * Constructs the encoder.
   *
   * @param config
   *        Configuration.
   */
  explicit Console_encoder(const Encoder_config& config);

  // Methods.

  /**
   * Implements interface method.
   *
   * @param metadata
   *        See Encoder::encode().
   * @param msg
   *        See Encoder::encode().
   * @param target
   *        See Encoder::encode().
   */
  void encode(const Msg_metadata& metadata, util::String_view msg, std::string* target) const override;
}; // class Console_encoder

// Free functions.

/**
 * Returns `true` if and only if the two configs are identical in every member.
 *
 * @relatesalso Encoder_config
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Encoder_config& val1, const Encoder_config& val2);

/**
 * Negation of the similar `==`.
 *
 * @relatesalso Encoder_config
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Encoder_config& val1, const Encoder_config& val2);

/**
 * Renders the time stamp as seconds since the POSIX epoch with a 6-digit microsecond fraction:
 * "1572345678.000042".
 *
 * @param time_stamp
 *        Time stamp.
 * @return See above.
 */
std::string epoch_time_str(const Msg_metadata::Time_stamp& time_stamp);

/**
 * Renders the time stamp in ISO-8601 format, in the local time zone, with milliseconds and UTC offset:
 * "2019-10-29T10:41:18.123+0100"; or with "Z" in place of a zero offset.
 *
 * @param time_stamp
 *        Time stamp.
 * @return See above.
 */
std::string iso8601_time_str(const Msg_metadata::Time_stamp& time_stamp);

/**
 * Appends `str` to `*target` as a JSON string literal, quotes included: `"` and `\` are backslash-escaped;
 * newline, carriage return and tab become `\n`, `\r`, `\t`; other control characters become `\u00XX`.
 * Other bytes (including UTF-8 sequences) are copied as-is.
 *
 * @param str
 *        String to quote.
 * @param target
 *        String to which to append.
 */
void append_json_str(util::String_view str, std::string* target);

/**
 * Appends the value of the given field to `*target` in JSON: strings quoted per append_json_str(); integers in
 * decimal; `bool`s as `true`/`false`; floating-point numbers in shortest round-trip form, except that NaN and
 * infinities (not representable in JSON) become the strings "NaN", "+Inf", "-Inf".
 *
 * @param value
 *        Value.
 * @param target
 *        String to which to append.
 */
void append_json_value(const Field::Value& value, std::string* target);

} // namespace zflags::log
