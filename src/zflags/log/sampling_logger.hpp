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
#include "zflags/util/util_fwd.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace zflags::log
{

// Types.

/**
 * Logger decorator that bounds the volume of repetitive records: within each tick (time window) it passes the first
 * `first` records with a given (severity, message) pair to the wrapped Logger, then only every `thereafter`-th one,
 * dropping the rest.  The window starts at the first record of that pair and is measured using
 * Msg_metadata::m_called_when, not the time of the do_log() call.
 *
 * Records are counted in a fixed table of #S_N_COUNTERS counters, indexed by a hash of (severity, message); so
 * memory use does not grow with the number of distinct messages, but two different pairs landing on the same counter
 * share it.  Fields do not participate in the key.
 *
 * ### Thread safety ###
 * do_log() is safe to call concurrently; the counters are protected by an internal mutex, which is released before
 * forwarding to the wrapped Logger.
 */
class Sampling_logger :
  public Logger
{
public:
  // Types.

  /// Short-hand for the tick duration type.
  using Duration = Msg_metadata::Clock::duration;

  // Constants.

  /// Default tick: 1 second.
  static const Duration S_TICK_DEFAULT;

  /// Default number of records per tick passed through unconditionally.
  static const unsigned int S_FIRST_DEFAULT;

  /// Default sampling rate after the first #S_FIRST_DEFAULT: every this-many-th record passes.
  static const unsigned int S_THEREAFTER_DEFAULT;

  /// Size of the counter table.
  static const size_t S_N_COUNTERS;

  // Constructors/destructor.

  /**
   * Constructs the decorator.
   *
   * @param core
   *        Logger to which passed records are forwarded.  Not null.
   * @param tick
   *        Counting window per (severity, message).
   * @param first
   *        Records per window passed unconditionally.
   * @param thereafter
   *        After `first`, every `thereafter`-th record passes; 0 means none do.
   */
  explicit Sampling_logger(std::unique_ptr<Logger> core,
                           Duration tick = S_TICK_DEFAULT,
                           unsigned int first = S_FIRST_DEFAULT,
                           unsigned int thereafter = S_THEREAFTER_DEFAULT);

  // Methods.

  /**
   * Implements interface method by forwarding to the wrapped Logger.
   *
   * @param sev
   *        Severity of the message.
   * @return See above.
   */
  bool should_log(Sev sev) const override;

  /**
   * Implements interface method by counting the record and forwarding it to the wrapped Logger, or dropping it,
   * as explained in the class doc header.
   *
   * @param metadata
   *        All information to potentially log in addition to `msg`.
   * @param msg
   *        The message.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * The wrapped Logger.
   *
   * @return See above.
   */
  Logger* core() const;

  /**
   * Number of records dropped thus far.
   *
   * @return See above.
   */
  uint64_t dropped_count() const;

  /**
   * Number of counters held; always #S_N_COUNTERS.
   *
   * @return See above.
   */
  size_t counter_count() const;

private:
  // Types.

  /// Per-key counting state.
  struct Counter
  {
    /// The current window ends at this time; a record at or after it starts a new window.
    Msg_metadata::Time_stamp m_reset_after;
    /// Records seen in the current window, including the present one.
    uint64_t m_count;
  };

  // Data.

  /// See ctor.
  const std::unique_ptr<Logger> m_core;

  /// See ctor.
  const Duration m_tick;

  /// See ctor.
  const unsigned int m_first;

  /// See ctor.
  const unsigned int m_thereafter;

  /// Counting state, #S_N_COUNTERS of them, indexed by hash of (severity, message).  Protected by #m_mutex.
  std::vector<Counter> m_counters;

  /// See dropped_count().  Protected by #m_mutex.
  uint64_t m_dropped_count;

  /// Protects the counting state.
  mutable util::Mutex_non_recursive m_mutex;
}; // class Sampling_logger

} // namespace zflags::log
