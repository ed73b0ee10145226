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
#include "zflags/log/config.hpp"
#include "zflags/log/encoder.hpp"
#include "zflags/util/string_ostream.hpp"
#include "zflags/util/util_fwd.hpp"
#include <memory>

namespace zflags::log
{

/**
 * An implementation of Logger that logs messages to an internal `std::string` buffer and provides read-only
 * access to this buffer (for example, if one wants to write out its contents when exiting program, or inspect
 * what was logged in a unit test).
 *
 * ### Thread safety ###
 * Simultaneous do_log() calls are safe.  buffer_str() is not safe against concurrent logging; buffer_str_copy()
 * is.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger to subsequently log to a newly constructed internal `std::string` buffer.
   *
   * @param most_verbose_sev
   *        Initial threshold; see Config::output_whether_should_log().
   * @param encoder
   *        Encoder for each record; or null to use a Console_encoder with the development baseline.
   */
  explicit Buffer_logger(Sev most_verbose_sev = Config::S_MOST_VERBOSE_SEV_DEFAULT,
                         std::unique_ptr<Encoder> encoder = nullptr);

  // Methods.

  /**
   * Implements interface method by returning `true` if the severity passes #m_config.
   *
   * @param sev
   *        Severity of the message.
   * @return See above.
   */
  bool should_log(Sev sev) const override;

  /**
   * Implements interface method by synchronously encoding the message onto the end of the buffer.  Needless to say,
   * memory use may become a concern depending on the verbosity of the logging.
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.
   * @param msg
   *        The message.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Read-only access to the buffer string containing the messages logged thus far.
   *
   * @warning Not thread-safe against concurrent do_log().  Take care to access the result only when you know no
   *          other thread is logging.
   *
   * @return Read-only reference.
   */
  const std::string& buffer_str() const;

  /**
   * Returns a copy of `buffer_str()` in thread-safe fashion.
   *
   * @return Newly created string.
   */
  const std::string buffer_str_copy() const;

  /// Empties the buffer.  Thread-safe.
  void buffer_clear();

  // Data.  (Public!)

  /// Filtering configuration; its verbosity may be changed concurrently with logging.
  Config m_config;

private:
  // Data.

  /// See ctor.
  const std::unique_ptr<Encoder> m_encoder;

  /// Like `ostringstream` but allows for fast access directly into its internal string buffer.
  util::String_ostream m_os;

  /// Mutex protecting against concurrent do_log(), buffer_str_copy() and buffer_clear().
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Buffer_logger

} // namespace zflags::log
