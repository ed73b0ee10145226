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
#include <atomic>

namespace zflags::log
{

// Types.

/**
 * Interface to a secondary, legacy logging facility's single verbosity knob (in the style of `glog`'s `-v`): an
 * unsigned level where higher means more verbose.  cfg::Level_value keeps it in sync when a custom high verbosity is
 * requested on the command line.  Implementations: Process_legacy_verbosity; tests supply their own.
 */
class Legacy_verbosity :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Sets the verbosity.
   *
   * @param verbosity
   *        New verbosity.
   * @param err_code
   *        See zflags::Error_code docs for error reporting semantics.  Errors are implementation-specific.
   */
  virtual void set_verbosity(unsigned int verbosity, Error_code* err_code = 0) = 0;

  /**
   * Returns the current verbosity.
   *
   * @return See above.
   */
  virtual unsigned int verbosity() const = 0;
}; // class Legacy_verbosity

/**
 * The process-wide Legacy_verbosity: an atomic value starting at 0, accessed via get_singleton().  Like the `-v`
 * flag it models, the value is a signed 32-bit quantity, so values above `INT32_MAX` are rejected with
 * `boost::system::errc::invalid_argument`.
 */
class Process_legacy_verbosity :
  public Legacy_verbosity
{
public:
  // Constants.

  /// The highest accepted verbosity.
  static const unsigned int S_MAX_VERBOSITY;

  // Methods.

  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Process_legacy_verbosity& get_singleton();

  /**
   * Implements interface method.  Thread-safe.
   *
   * @param verbosity
   *        New verbosity.
   * @param err_code
   *        See Legacy_verbosity::set_verbosity().
   */
  void set_verbosity(unsigned int verbosity, Error_code* err_code = 0) override;

  /**
   * Implements interface method.  Thread-safe.
   *
   * @return See above.
   */
  unsigned int verbosity() const override;

private:
  // Constructors/destructor.

  /// Boring constructor.
  explicit Process_legacy_verbosity();

  // Data.

  /// See verbosity().
  std::atomic<unsigned int> m_verbosity;
}; // class Process_legacy_verbosity

} // namespace zflags::log
