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
#include "zflags/util/util_fwd.hpp"
#include <iostream>
#include <memory>

namespace zflags::log
{

// Types.

/**
 * An implementation of Logger that encodes messages with the given Encoder and writes them to the given `ostream`
 * (by default `cerr`).  Protects against garbling due to simultaneous logging from multiple threads.
 *
 * Filtering is by a single minimum severity, held in the public #m_config, which may be changed at any time via
 * Config::configure_default_verbosity().
 *
 * ### Thread safety ###
 * Simultaneous do_log() calls for the same `*this` log serially to each other.
 *
 * ### Don't cross the `ostream`s! ###
 * If you pass `ostream` S into this ctor, then don't access S from any other code (including another
 * Stream_logger) while `*this` might be logging.  At best output would be garbled.  Built-in thread-safety
 * measures apply to multi-threaded uses of each given `*this`, not across different `*this`es.
 */
class Stream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs logger to subsequently log to the given standard `ostream`.
   *
   * @param most_verbose_sev
   *        Initial threshold; see Config::output_whether_should_log().
   * @param encoder
   *        Encoder for each record.  Not null.
   * @param os
   *        `ostream` to which to log messages.
   */
  explicit Stream_logger(Sev most_verbose_sev, std::unique_ptr<Encoder> encoder, std::ostream& os = std::cerr);

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
   * Implements interface method by synchronously encoding the message and writing it, in one piece, to the
   * `ostream`, then flushing it.
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.
   * @param msg
   *        The message.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * The encoder passed to ctor.
   *
   * @return See above.
   */
  const Encoder& encoder() const;

  // Data.  (Public!)

  /// Filtering configuration; its verbosity may be changed concurrently with logging.
  Config m_config;

private:
  // Data.

  /// See ctor.
  const std::unique_ptr<Encoder> m_encoder;

  /// See ctor.
  std::ostream& m_os;

  /// Buffer into which each record is encoded before writing; protected by #m_log_mutex.
  std::string m_record_buf;

  /// Mutex protecting against log messages being logged concurrently and thus being garbled.
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Stream_logger

} // namespace zflags::log
