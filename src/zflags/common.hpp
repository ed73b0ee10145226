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

#include <boost/system/error_code.hpp>
#include <functional>

/**
 * @mainpage
 *
 * zflags is a small library that turns a handful of command-line flags (`-zap-devel`, `-zap-encoder`,
 * `-zap-level`, `-zap-sample`, `-zap-timeformat`) into a ready-to-use structured Logger.  It is split into
 * the following modules, each in its own namespace under ::zflags:
 *   - zflags::log: the logging engine itself: severities, structured fields, the Logger interface and its
 *     `ZFLAGS_LOG_*()` call-site macros, JSON/console encoders, stream/buffer loggers, and a sampling decorator.
 *   - zflags::cfg: per-flag option cells, the named-option registry (Flag_set) that parses the command line into
 *     them, and the factory that resolves their state into a log::Logger.
 *   - zflags::error: boost.system-based error reporting conventions shared by the above.
 *   - zflags::util: miscellaneous helpers (string building, source-location macros, mutex aliases).
 */

/* We build in C++17 mode ourselves, and the headers use C++17 features (inline variables, `std::optional`, etc.),
 * so insist on it for anyone `#include`ing us. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any zflags/ API headers, use C++17 compile mode or later."
#endif

// Macros.  These (conceptually) belong to the `zflags` namespace (hence the prefix for each macro).

#ifdef __linux__
#  define ZFLAGS_OS_LINUX
#elif defined(__APPLE__)
#  define ZFLAGS_OS_MAC
#elif defined(_WIN32) || defined(_WIN64)
#  define ZFLAGS_OS_WIN
#endif

/**
 * Catch-all namespace for zflags.  Items directly in this namespace are very general and used throughout;
 * everything else lives in a module sub-namespace.
 */
namespace zflags
{
// Types.

/// Signed byte.  The underlying type of log::Sev.
using int8_t = signed char;

/**
 * Short-hand for a boost.system error code (which basically encapsulates an integer/`enum` error code and a
 * pointer through which to obtain a statically stored message string); this is how zflags modules report errors
 * to the user; and we humbly recommend all C++ code use the same techniques.
 *
 * The convention, used throughout zflags, is the following.  An API that can fail takes a last argument
 * `Error_code* err_code = 0`.  If the caller passes a non-null pointer, then on error `*err_code` is set to a truthy
 * value, and the API returns normally; on success `*err_code` is made falsy.  If the caller passes null (the
 * default), then on error a zflags::error::Runtime_error is thrown (it carries the #Error_code as well as a context
 * string), and on success nothing special happens.  See ZFLAGS_ERROR_EXEC_AND_THROW_ON_ERROR() for how an API
 * implements both behaviors with one body.
 */
using Error_code = boost::system::error_code;

/**
 * Short-hand for a polymorphic function object.  Same as `std::function` (whose API it inherits entirely), plus
 * `empty()` which `boost::function` users tend to expect.
 *
 * @tparam Signature
 *         Function signature, as for `std::function`.
 */
template<typename Signature>
class Function;

/// See the primary template.  This specialization is the only one.
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  // Types.

  /// Short-hand for the base.  We add no data of our own in this subclass, just a handful of APIs.
  using Function_base = std::function<Result (Args...)>;

  // Ctors/destructor.

  /// Inherit all the constructors from #Function_base.  Add none of our own.
  using Function_base::Function_base;

  // Methods.

  /**
   * Returns `!bool(*this)`; i.e., `true` if and only if `*this` has no target.
   *
   * @return See above.
   */
  bool empty() const noexcept;
}; // class Function<Result (Args...)>

// Template implementations.

template<typename Result, typename... Args>
bool Function<Result (Args...)>::empty() const noexcept
{
  return !*this;
}

} // namespace zflags
