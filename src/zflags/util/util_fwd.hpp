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

#include "zflags/common.hpp"
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <string>
#include <string_view>

/**
 * Grab-bag of utilities used by the other zflags modules: string building via `ostream<<`,
 * source-location macros, and short-hands for mutex types.
 *
 * util_fwd.hpp is separate from util.hpp so that headers needing only the short-hands (most of them) need not
 * pull in boost.iostreams and friends.
 */
namespace zflags::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class String_ostream;

/**
 * Commonly used `char`-based string view.  Functions that take a string argument they do not store should take
 * one of these by value.
 */
using String_view = std::string_view;

/// Short-hand for non-reentrant, exclusive mutex.  ("Reentrant" is a.k.a. "recursive.")
using Mutex_non_recursive = boost::mutex;

/**
 * Short-hand for an RAII lock guard of any mutex type: `Lock_guard<decltype(m_mutex)> lock(m_mutex);`.
 *
 * @tparam Mutex
 *         Mutex type, e.g., #Mutex_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Writes to the specified string, as if the given arguments were each passed, via `<<` in sequence,
 * to an `ostringstream`, and then the result were appended to the aforementioned string variable.
 *
 * @tparam ...T
 *         Each type `T` is such that `os << t`, with types `T const & t` and `ostream& os`, builds and writes `t` to
 *         `os`, returning lvalue `os`.
 * @param target_str
 *        Pointer to the string to which to append.
 * @param ostream_args
 *        One or more arguments, such as `"Hello: [", some_int, "]."`, as if for `os << ...`.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Equivalent to ostream_op_to_string() but returns a new `string` by value instead of writing to the caller's
 * `string`.
 *
 * @tparam ...T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return Resulting `std::string`.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * Returns the substring of `full_path` following the right-most directory separator; or `full_path` itself if
 * there is none.  `constexpr` so that `__FILE__`-based call sites compute it at compile time.
 *
 * @param full_path
 *        Full file path, such as from `__FILE__`.
 * @return See above.
 */
constexpr String_view get_last_path_segment(String_view full_path);

/**
 * Helper for ZFLAGS_UTIL_WHERE_AM_I_STR(): builds "file:function(line)".
 *
 * @param file
 *        File name.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

// Template implementations.

constexpr String_view get_last_path_segment(String_view full_path)
{
#ifdef ZFLAGS_OS_WIN
  constexpr char SEP = '\\';
#else
  constexpr char SEP = '/';
#endif
  const auto sep_pos = full_path.rfind(SEP);
  return (sep_pos == String_view::npos) ? full_path : full_path.substr(sep_pos + 1);
}

} // namespace zflags::util

// Macros.

/**
 * Expands to an `std::string` like "file.cpp:some_func(332)", the source location of the macro invocation, with
 * the directory portion of the file path removed.
 */
#define ZFLAGS_UTIL_WHERE_AM_I_STR() \
  ::zflags::util::get_where_am_i_str(::zflags::util::get_last_path_segment \
                                       (::zflags::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                     ::zflags::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                     __LINE__)

/**
 * Expands to a string *literal* like "/full/path/file.cpp:some_func(332)"; fully compile-time, hence suitable in
 * paths that must not add any computation, such as ZFLAGS_ERROR_EXEC_AND_THROW_ON_ERROR().  Unlike
 * ZFLAGS_UTIL_WHERE_AM_I_STR() it cannot strip the directory from `__FILE__`.
 *
 * @param ARG_function
 *        Identifier of the function, as written in source (it is stringized).
 */
#define ZFLAGS_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" ZFLAGS_UTIL_WHERE_AM_I_LITERAL_LINE(__LINE__) ")"

/// Helper for ZFLAGS_UTIL_WHERE_AM_I_LITERAL().
#define ZFLAGS_UTIL_WHERE_AM_I_LITERAL_LINE(ARG_line) ZFLAGS_UTIL_WHERE_AM_I_LITERAL_LINE_STR(ARG_line)
/// Helper for ZFLAGS_UTIL_WHERE_AM_I_LITERAL_LINE().
#define ZFLAGS_UTIL_WHERE_AM_I_LITERAL_LINE_STR(ARG_line) #ARG_line

/**
 * Place the body of a function-like macro in this, and the macro can be invoked like a statement, ending with `;`,
 * safely in every context (including an `if` lacking braces).  `break` inside exits the macro body.
 *
 * @param ...
 *        The intended macro body.
 */
#define ZFLAGS_UTIL_SEMICOLON_SAFE(...) \
  do \
  { \
    __VA_ARGS__ \
  } \
  while (false)
