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
#include <boost/noncopyable.hpp>
#include <atomic>

namespace zflags::log
{

// Types.

/**
 * Controls the filtering behavior of the zflags-provided Logger implementations: a single minimum severity (the
 * "default verbosity"), below which messages are not logged.  Logger::should_log() of Stream_logger and
 * Buffer_logger simply forwards to output_whether_should_log().
 *
 * ### Thread safety ###
 * configure_default_verbosity() may be called concurrently with output_whether_should_log() (hence with any
 * logging through a Logger using `*this`); the change is seen by subsequent log calls "soon."
 */
class Config :
  private boost::noncopyable
{
public:
  // Constants.

  /// Recommended default verbosity.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a conceptually default Config object with the given default verbosity.
   *
   * @param most_verbose_sev_default
   *        Initial value for the threshold; see output_whether_should_log().
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  // Methods.

  /**
   * Returns `true` if and only if a message of severity `sev` should be logged: `sev` is at least as severe as
   * the configured default verbosity.  Thread-safe against configure_default_verbosity().
   *
   * @param sev
   *        Severity of the message.
   * @return See above.
   */
  bool output_whether_should_log(Sev sev) const;

  /**
   * Sets the default verbosity to the given value, to be used by subsequent output_whether_should_log() calls.
   *
   * @param most_verbose_sev_default
   *        The new threshold.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default);

  /**
   * Returns the current default verbosity.
   *
   * @return See above.
   */
  Sev default_verbosity() const;

private:
  // Data.

  /**
   * Most verbose (lowest) severity for which output_whether_should_log() returns `true`.  Atomic, as
   * configure_default_verbosity() may be called while other threads log.  There is no need for ordering
   * guarantees versus other memory, so accesses are `relaxed`.
   */
  std::atomic<Sev> m_verbosity_default;
}; // class Config

} // namespace zflags::log
