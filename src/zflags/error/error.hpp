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

#include "zflags/error/error_fwd.hpp"
#include "zflags/log/log.hpp"
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace zflags::error
{
// Types.

/**
 * An `std::runtime_error` (which is an `std::exception`) that stores an #Error_code.  Any zflags API that takes
 * an `Error_code* err_code = 0` argument throws this when `err_code` is null and an error occurs.
 *
 * It is a boost.system `system_error`, so code() yields the #Error_code, while what() yields a message that
 * includes the code's value, category and message, plus the context string supplied at construction.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs Runtime_error.
   *
   * @param err_code_or_success
   *        The #Error_code describing the error if available; or the success value (`Error_code()`)
   *        if an error code is unavailable or inapplicable to this error.
   *        In the latter case what() will omit anything to do with error codes and feature only `context`.
   * @param context
   *        String describing the context, i.e., where/in what circumstances the error occurred.
   *        ZFLAGS_UTIL_WHERE_AM_I_STR() may be helpful.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Constructs Runtime_error, when one only has a context string and no applicable error code.
   * Equivalent to `Runtime_error(Error_code(), context)`.
   *
   * @param context
   *        See the other ctor.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * Returns a message describing the exception: `context` only, if no/success #Error_code was given to ctor;
   * else the code's numeric value, category name, message, and `context`.
   *
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /**
   * Copy of `context` from ctor if `!err_code_or_success`; or unused otherwise.
   *
   * boost.system `system_error::what()` always mixes in the (possibly success) code; so when there is no code we
   * keep `context` here, and what() returns it alone.  When there is a code, `context` is passed up to the
   * superclass instead, and the superclass what() does the right thing.  Either way `context` is copied once.
   */
  const std::string m_context_if_no_code;
}; // class Runtime_error

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    // Caller can assume non-null err_code from now on and just do its thing.
    return false;
  }

  Error_code our_err_code;
  *ret = func(&our_err_code);

  if (our_err_code)
  {
    /* Pass through the caller's context; the present location would tell the log/exception reader nothing
     * about where the error actually occurred. */
    throw Runtime_error(our_err_code, context);
  }

  return true;
} // exec_and_throw_on_error()

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  // See exec_and_throw_on_error().  This is just a simplified version where func() returns void.

  if (err_code)
  {
    return false;
  }

  Error_code our_err_code;
  func(&our_err_code);

  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }

  return true;
} // exec_void_and_throw_on_error()

} // namespace zflags::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val` and logs a warning about the error using ZFLAGS_LOG_WARNING().
 * An `err_code` variable of type that is pointer to zflags::Error_code must be declared at the point where the
 * macro is invoked; and `get_logger()` must be available (e.g., via log::Log_context or ZFLAGS_LOG_SET_LOGGER()).
 *
 * @param ARG_val
 *        Value convertible to zflags::Error_code.  Reminder: `Error_code` is trivially/implicitly convertible from
 *        any error code `enum` registered with boost.system, such as zflags::cfg::error::Code.
 */
#define ZFLAGS_ERROR_EMIT_ERROR(ARG_val) \
  ZFLAGS_UTIL_SEMICOLON_SAFE \
  ( \
    ::zflags::Error_code ZFLAGS_ERROR_EMIT_ERR_val(ARG_val); \
    ZFLAGS_LOG_WARNING("Error code emitted: [" << ZFLAGS_ERROR_EMIT_ERR_val << "] " \
                       "[" << ZFLAGS_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = ZFLAGS_ERROR_EMIT_ERR_val; \
  )

/**
 * Logs a warning about the given error code using ZFLAGS_LOG_WARNING(), without emitting it anywhere.
 *
 * @param ARG_val
 *        See ZFLAGS_ERROR_EMIT_ERROR().
 */
#define ZFLAGS_ERROR_LOG_ERROR(ARG_val) \
  ZFLAGS_UTIL_SEMICOLON_SAFE \
  ( \
    ::zflags::Error_code ZFLAGS_ERROR_LOG_ERR_val(ARG_val); \
    ZFLAGS_LOG_WARNING("Error occurred: [" << ZFLAGS_ERROR_LOG_ERR_val << "] " \
                       "[" << ZFLAGS_ERROR_LOG_ERR_val.message() << "]."); \
  )

/**
 * Narrow-use macro that implements the error code/exception semantics expected of public zflags APIs, namely those
 * explained in zflags::Error_code doc header.  Usage:
 *
 *   ~~~
 *   T f(AT1 arg1, const AT2& arg2, Error_code* err_code = 0)
 *   {
 *     ZFLAGS_ERROR_EXEC_AND_THROW_ON_ERROR(T, f, arg1, arg2, _1);
 *     // ^-- Calls ourselves and returns (or throws) if err_code is null.  Past this line err_code is not null.
 *
 *     // ...Bulk of f() goes here; set *err_code freely....
 *   }
 *   ~~~
 *
 * @see exec_void_and_throw_on_error() which you can use directly when `ARG_ret_type` would be `void`.
 *
 * @param ARG_ret_type
 *        The return type of the invoking function.  It cannot be a reference type or `void`.
 * @param ARG_function_name
 *        The name of the invoking function, as if calling it recursively.
 * @param ...
 *        The invoking function's arg list, as if calling it recursively, but with the `err_code` arg replaced by
 *        the special identifier `_1`.
 */
#define ZFLAGS_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  ZFLAGS_UTIL_SEMICOLON_SAFE \
  ( \
    /* Result of the operation if it ran; whether it ran is the return value below. */ \
    ARG_ret_type result; \
    if (::zflags::error::exec_and_throw_on_error \
          ([&](::zflags::Error_code* _1) -> ARG_ret_type \
             { return ARG_function_name(__VA_ARGS__); }, \
           &result, err_code, ZFLAGS_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      /* It ran and did not throw. */ \
      return result; \
    } \
    /* else: err_code is non-null; macro invoker proceeds with its body. */ \
  )
