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

/**
 * Namespace containing the zflags::cfg module's extension of boost.system error conventions, so that its APIs can
 * return codes/messages from within its own new set of error codes/messages.  The cells of cfg::Option_value report
 * only Code::S_INVALID_VALUE; the rest are reported by cfg::Flag_set while parsing a command line.
 *
 * @see zflags::Error_code for the reporting semantics of APIs taking an `Error_code* err_code` argument.
 */
namespace zflags::cfg::error
{

// Types.

/// All possible errors returned (via zflags::Error_code arguments) by zflags::cfg functions/methods.
enum class Code
{
  /// Value given for an option is not valid for that option.
  S_INVALID_VALUE = 1,
  /// Command line contains a flag that has not been registered.
  S_UNKNOWN_FLAG,
  /// Command line is malformed (for example a flag that requires a value is missing one).
  S_FLAG_SYNTAX,
  /// Command line requested the usage message (`-h` or `-help`).
  S_HELP_REQUESTED,
  /// Attempted to register a flag under a name that is already registered.
  S_FLAG_REDEFINED
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a matching #Error_code.
 *
 * @param err_code
 *        Code to convert.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

} // namespace zflags::cfg::error

/// We may add some ADL-based overloads into this namespace outside `zflags`.
namespace boost::system
{

// Types.

/**
 * Specialization that registers zflags::cfg::error::Code with boost.system, making its values implicitly
 * convertible to zflags::Error_code.
 */
template<>
struct is_error_code_enum<::zflags::cfg::error::Code>
{
  /// Means `Code` `enum` values can be used for zflags::Error_code.
  static const bool value = true;
};

} // namespace boost::system
