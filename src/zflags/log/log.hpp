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
#include "zflags/util/util.hpp"
#include <boost/noncopyable.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

// Macros.  These (conceptually) belong to the zflags::log namespace (hence the prefix for each macro).

/**
 * Logs a WARNING message into zflags::log::Logger `*(get_logger())`, if such logging is enabled by that
 * `Logger`.  Supplies context information to be potentially logged with message, like current time, source file/line
 * number, etc.  Use like this: `ZFLAGS_LOG_WARNING("Value is [" << val << "] which is too high.");`
 *
 * `get_logger()` must be an expression available at the call site (usually a method of log::Log_context, which the
 * caller derives from; or the local lambda made by ZFLAGS_LOG_SET_LOGGER()) returning `Logger*`, possibly null,
 * in which case nothing is logged.  `ARG_stream_fragment` is evaluated only if the message is actually logged.
 *
 * @param ARG_stream_fragment
 *        Same as in ZFLAGS_LOG_WITH_CHECKING().
 */
#define ZFLAGS_LOG_WARNING(ARG_stream_fragment) \
  ZFLAGS_LOG_WITH_CHECKING(::zflags::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Logs a FATAL message; otherwise identical to ZFLAGS_LOG_WARNING().  Note it does not terminate anything.
 *
 * @param ARG_stream_fragment
 *        Same as in ZFLAGS_LOG_WARNING().
 */
#define ZFLAGS_LOG_FATAL(ARG_stream_fragment) \
  ZFLAGS_LOG_WITH_CHECKING(::zflags::log::Sev::S_FATAL, ARG_stream_fragment)

/**
 * Logs an ERROR message; otherwise identical to ZFLAGS_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ZFLAGS_LOG_WARNING().
 */
#define ZFLAGS_LOG_ERROR(ARG_stream_fragment) \
  ZFLAGS_LOG_WITH_CHECKING(::zflags::log::Sev::S_ERROR, ARG_stream_fragment)

/**
 * Logs an INFO message; otherwise identical to ZFLAGS_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ZFLAGS_LOG_WARNING().
 */
#define ZFLAGS_LOG_INFO(ARG_stream_fragment) \
  ZFLAGS_LOG_WITH_CHECKING(::zflags::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Logs a DEBUG message; otherwise identical to ZFLAGS_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        Same as in ZFLAGS_LOG_WARNING().
 */
#define ZFLAGS_LOG_DEBUG(ARG_stream_fragment) \
  ZFLAGS_LOG_WITH_CHECKING(::zflags::log::Sev::S_DEBUG, ARG_stream_fragment)

/**
 * Logs a message at custom verbose severity `verbose_sev(ARG_verbosity)`; otherwise identical to
 * ZFLAGS_LOG_WARNING().  `ZFLAGS_LOG_V(1, ...)` is equivalent to `ZFLAGS_LOG_DEBUG(...)`.
 *
 * @param ARG_verbosity
 *        Positive `unsigned int` verbosity.
 * @param ARG_stream_fragment
 *        Same as in ZFLAGS_LOG_WARNING().
 */
#define ZFLAGS_LOG_V(ARG_verbosity, ARG_stream_fragment) \
  ZFLAGS_LOG_WITH_CHECKING(::zflags::log::verbose_sev(ARG_verbosity), ARG_stream_fragment)

/**
 * Logs a message of the given severity together with the given structured fields, which each Encoder outputs in its
 * own way after the message.  Otherwise identical to ZFLAGS_LOG_WARNING().  Use like this:
 * `ZFLAGS_LOG_WITH_FIELDS(Sev::S_INFO, "Connected.", make_field("host", host), make_field("port", port));`
 *
 * @param ARG_sev
 *        Severity (type log::Sev).
 * @param ARG_stream_fragment
 *        Same as in ZFLAGS_LOG_WARNING().
 * @param ...
 *        One or more log::Field expressions, in output order.  They are evaluated only if the message is logged.
 */
#define ZFLAGS_LOG_WITH_FIELDS(ARG_sev, ARG_stream_fragment, ...) \
  ZFLAGS_UTIL_SEMICOLON_SAFE \
  ( \
    ::zflags::log::Logger const * const ZFLAGS_LOG_W_FLDS_logger = get_logger(); \
    if (ZFLAGS_LOG_W_FLDS_logger && ZFLAGS_LOG_W_FLDS_logger->should_log(ARG_sev)) \
    { \
      const ::zflags::log::Fields ZFLAGS_LOG_W_FLDS_fields{ __VA_ARGS__ }; \
      ZFLAGS_LOG_DO_LOG(get_logger(), ARG_sev, &ZFLAGS_LOG_W_FLDS_fields, ARG_stream_fragment); \
    } \
  )

/**
 * Sets up the current scope so that ZFLAGS_LOG_*() can be used in it, logging to the given Logger.  For use
 * outside of classes derived from log::Log_context (for example in free functions and `main()`).
 *
 * @param ARG_logger_ptr
 *        `Logger*` (possibly null, meaning do not log), or something convertible to it.
 */
#define ZFLAGS_LOG_SET_LOGGER(ARG_logger_ptr) \
  [[maybe_unused]] \
    const auto get_logger \
      = [logger_ptr_copy = static_cast<::zflags::log::Logger*>(ARG_logger_ptr)] \
          () -> ::zflags::log::Logger* { return logger_ptr_copy; }

/**
 * Logs the given message to `get_logger()` if it is non-null and its Logger::should_log() says so; in which case
 * (only) `ARG_stream_fragment` is evaluated.
 *
 * @param ARG_sev
 *        Severity (type log::Sev).
 * @param ARG_stream_fragment
 *        Fragment of code as if writing to a standard `ostream`: everything between `os <<` and the semicolon.
 *        E.g.: `"Value is [" << val << "]."`.
 */
#define ZFLAGS_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  ZFLAGS_UTIL_SEMICOLON_SAFE \
  ( \
    ::zflags::log::Logger const * const ZFLAGS_LOG_W_CHK_logger = get_logger(); \
    if (ZFLAGS_LOG_W_CHK_logger && ZFLAGS_LOG_W_CHK_logger->should_log(ARG_sev)) \
    { \
      ZFLAGS_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Identical to ZFLAGS_LOG_WITH_CHECKING() but foregoes the filter (Logger::should_log()) check.  Use only when
 * the caller has already done that check.
 *
 * @param ARG_sev
 *        See ZFLAGS_LOG_WITH_CHECKING().
 * @param ARG_stream_fragment
 *        See ZFLAGS_LOG_WITH_CHECKING().
 */
#define ZFLAGS_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  ZFLAGS_LOG_DO_LOG(get_logger(), ARG_sev, nullptr, ARG_stream_fragment)

/**
 * Lowest-level logging API: builds the message and Msg_metadata and passes them to Logger::do_log().
 * Performs no filtering.
 *
 * @param ARG_logger_ptr
 *        `Logger*`; if null, nothing happens.
 * @param ARG_sev
 *        See ZFLAGS_LOG_WITH_CHECKING().
 * @param ARG_fields_ptr
 *        `const Fields*`; null means no fields.  The pointee must exist until the macro completes.
 * @param ARG_stream_fragment
 *        See ZFLAGS_LOG_WITH_CHECKING().
 */
#define ZFLAGS_LOG_DO_LOG(ARG_logger_ptr, ARG_sev, ARG_fields_ptr, ARG_stream_fragment) \
  ZFLAGS_UTIL_SEMICOLON_SAFE \
  ( \
    using ::zflags::log::Logger; \
    using ::zflags::log::Msg_metadata; \
    using ::zflags::util::String_view; \
    using ::zflags::util::get_last_path_segment; \
    Logger* const ZFLAGS_LOG_DO_LOG_logger = ARG_logger_ptr; \
    if (!ZFLAGS_LOG_DO_LOG_logger) \
    { \
      break; \
    } \
    /* else */ \
    /* Calendar clock: not steady, but convertible to a time with meaning to humans. */ \
    const auto ZFLAGS_LOG_DO_LOG_time_stamp = Msg_metadata::Clock::now(); \
    /* These are compile-time constants (get_last_path_segment() is constexpr). */ \
    constexpr String_view ZFLAGS_LOG_DO_LOG_full_file_str(__FILE__, sizeof(__FILE__) - 1); \
    constexpr String_view ZFLAGS_LOG_DO_LOG_file_str = get_last_path_segment(ZFLAGS_LOG_DO_LOG_full_file_str); \
    constexpr String_view ZFLAGS_LOG_DO_LOG_func_str(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
    ::std::string ZFLAGS_LOG_DO_LOG_msg; \
    ::zflags::util::ostream_op_to_string(&ZFLAGS_LOG_DO_LOG_msg, \
                                         ::zflags::log::Msg_fragment_writer([&](::std::ostream& os) \
                                                                             { os << ARG_stream_fragment; })); \
    /* () used to avoid nested-macro-comma trouble. */ \
    Msg_metadata ZFLAGS_LOG_DO_LOG_metadata \
      ({ ARG_sev, ZFLAGS_LOG_DO_LOG_file_str, __LINE__, ZFLAGS_LOG_DO_LOG_func_str, \
         ZFLAGS_LOG_DO_LOG_time_stamp, ARG_fields_ptr }); \
    ZFLAGS_LOG_DO_LOG_logger->do_log(&ZFLAGS_LOG_DO_LOG_metadata, String_view(ZFLAGS_LOG_DO_LOG_msg)); \
  ) /* ZFLAGS_UTIL_SEMICOLON_SAFE() */

namespace zflags::log
{
// Types.

/**
 * One structured key/value pair attached to a log message.  The value is a string, signed integer, floating-point
 * number, or `bool`; each Encoder renders it according to its type (e.g., JSON quotes only the string).
 *
 * Construct via make_field().
 */
class Field
{
public:
  // Types.

  /// The value types a Field can hold.
  using Value = std::variant<std::string, int64_t, double, bool>;

  // Constructors/destructor.

  /**
   * Constructs the field.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   */
  explicit Field(util::String_view key, Value value);

  // Methods.

  /**
   * Key.
   *
   * @return See above.
   */
  const std::string& key() const;

  /**
   * Value.
   *
   * @return See above.
   */
  const Value& value() const;

private:
  // Data.

  /// See key().
  std::string m_key;

  /// See value().
  Value m_value;
}; // class Field

/**
 * Simple data store containing all of the information generated at every logging call site by ZFLAGS_LOG_*(),
 * except the message itself, which is passed to Logger::do_log() separately.
 */
struct Msg_metadata
{
  // Types.

  /// The clock from which #m_called_when comes.
  using Clock = std::chrono::system_clock;

  /// Short-hand for a time stamp from #Clock.
  using Time_stamp = Clock::time_point;

  // Data.

  /// Severity of message.
  Sev m_msg_sev;

  /**
   * Pointer/length into static-storage string that would have come from built-in `__FILE__` macro, with the
   * directory portion removed.
   */
  util::String_view m_msg_src_file;

  /// Copy of integer that would have come from built-in `__LINE__` macro.
  unsigned int m_msg_src_line;

  /// Analogous to #m_msg_src_file but coming from `__FUNCTION__`, not `__FILE__`.
  util::String_view m_msg_src_function;

  /// Time stamp from as close as possible to entry into the log call site.
  Time_stamp m_called_when;

  /// Structured fields given at the call site; null if none.  Valid only during Logger::do_log().
  Fields const * m_fields;
}; // struct Msg_metadata

/**
 * Interface that the user should implement, passing the implementing Logger into logging classes (zflags's own
 * classes like cfg::Flag_set; and user's own logging classes) at construction (plus free/`static` logging
 * functions).  The class (or function) will then implicitly use that Logger in the logging call sites such as
 * `ZFLAGS_LOG_WARNING(message)` (via log::Log_context or ZFLAGS_LOG_SET_LOGGER()).
 *
 * There are only two methods: should_log(), a fast filter; and do_log(), which outputs the message.  The built-in
 * implementations are Stream_logger (console), Buffer_logger (memory, chiefly for tests), and the Sampling_logger
 * decorator; cfg::build_logger() assembles the appropriate combination.
 *
 * ### Thread safety ###
 * Implementations shall make should_log() and do_log() safe to call concurrently from any threads.
 */
class Logger :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Given attributes of a hypothetical message that would be logged, return `true` if that message should be logged
   * and `false` otherwise.  Logging call sites invoke this before even building the message.
   *
   * @param sev
   *        Severity of the message.
   * @return `true` if it should be logged; `false` if it should not.
   */
  virtual bool should_log(Sev sev) const = 0;

  /**
   * Given a message and its severity, logs that message and possibly some subset of the metadata, synchronously,
   * before returning.  A sampling implementation may also drop it.
   *
   * The caller shall have checked should_log() (the macros do); do_log() may assume it would have returned `true`.
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.  Not null.
   * @param msg
   *        The message.  Must be valid only until do_log() returns.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;
}; // class Logger

/**
 * Convenience class that simply stores a Logger pointer; intended as a super-class of any class that
 * wants to use `ZFLAGS_LOG_*()` in its methods: those macros call get_logger().  The stored pointer may be null,
 * in which case nothing is logged.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs Log_context by storing the given pointer to a Logger.
   *
   * @param logger
   *        Pointer to store.  Rationale for providing the null default: To facilitate subclass `= default` no-arg
   *        ctors.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Copy constructor that stores equal `Logger*`.
   *
   * @param src
   *        Source object.
   */
  explicit Log_context(const Log_context& src);

  /**
   * Move constructor that makes this equal to `src`, while the latter becomes as-if default-constructed.
   *
   * @param src
   *        Source object.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Assignment operator that behaves similarly to the copy constructor.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src);

  /**
   * Move assignment operator that behaves similarly to the move constructor.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Swaps Logger pointers with another object.
   *
   * @param other
   *        Other object.
   */
  void swap(Log_context& other);

  /**
   * Returns the stored Logger pointer, particularly as many `ZFLAGS_LOG_*()` macros expect.
   *
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * Replaces the stored Logger pointer.
   *
   * @param logger
   *        New pointer, possibly null.
   */
  void set_logger(Logger* logger);

private:
  // Data.

  /// The held Logger pointer.  Making the pointer itself non-`const` to allow `operator=()` to work.
  Logger* m_logger;
}; // class Log_context

/**
 * Internal-use helper that lets ZFLAGS_LOG_DO_LOG() hand a stream fragment to util::ostream_op_to_string() as a
 * single `ostream<<`-able object.
 */
class Msg_fragment_writer
{
public:
  // Types.

  /// Writes the fragment to the given stream.
  using Write_func = Function<void (std::ostream&)>;

  // Constructors/destructor.

  /**
   * Stores the writer.
   *
   * @param write_func
   *        Writes the fragment.
   */
  explicit Msg_fragment_writer(Write_func&& write_func);

  // Data.

  /// See ctor.
  Write_func m_write_func;
}; // class Msg_fragment_writer

// Free functions.

/**
 * Makes a string-valued Field.
 *
 * @param key
 *        Key.
 * @param val
 *        Value.
 * @return See above.
 */
Field make_field(util::String_view key, util::String_view val);

/**
 * Makes a string-valued Field.  (Without this, a string literal would choose the `bool` overload.)
 *
 * @param key
 *        Key.
 * @param val
 *        Value; not null.
 * @return See above.
 */
Field make_field(util::String_view key, const char* val);

/**
 * Makes a floating-point-valued Field.
 *
 * @param key
 *        Key.
 * @param val
 *        Value.
 * @return See above.
 */
Field make_field(util::String_view key, double val);

/**
 * Makes a `bool`-valued Field.
 *
 * @param key
 *        Key.
 * @param val
 *        Value.
 * @return See above.
 */
Field make_field(util::String_view key, bool val);

/**
 * Makes an integer-valued Field.  Unsigned values above the `int64_t` range wrap.
 *
 * @tparam Int
 *         An integral type other than `bool`.
 * @param key
 *        Key.
 * @param val
 *        Value.
 * @return See above.
 */
template<typename Int, std::enable_if_t<std::is_integral_v<Int> && (!std::is_same_v<Int, bool>), int> = 0>
Field make_field(util::String_view key, Int val);

/**
 * Writes the fragment held by `val` to `os`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Writer.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Msg_fragment_writer& val);

// Template implementations.

template<typename Int, std::enable_if_t<std::is_integral_v<Int> && (!std::is_same_v<Int, bool>), int>>
Field make_field(util::String_view key, Int val)
{
  return Field(key, Field::Value(std::in_place_type<int64_t>, static_cast<int64_t>(val)));
}

} // namespace zflags::log
