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

#include "zflags/util/util_fwd.hpp"
#include "zflags/common.hpp"

/**
 * Error-reporting conventions shared by all zflags modules: the Runtime_error exception, and the helpers
 * implementing the "null #Error_code pointer means throw" convention described in zflags::Error_code doc header.
 */
namespace zflags::error
{
// Types.

// Find doc headers near the bodies of these compound types.

class Runtime_error;

// Free functions.

/**
 * Helper for ZFLAGS_ERROR_EXEC_AND_THROW_ON_ERROR() macro; used directly in rare cases (such as a reference
 * return type).  If `err_code` is non-null returns `false` without executing anything; the caller shall then
 * perform its regular body, setting `*err_code` as needed.  Otherwise it runs `func(&e_c)`, stores the result in
 * `*ret`, and throws Runtime_error if `e_c` came out truthy; else returns `true`, and the caller shall return `*ret`.
 *
 * @tparam Func
 *         Functor type compatible with signature `Ret F(Error_code*)`.
 * @tparam Ret
 *         Return type of the wrapped operation.
 * @param func
 *        The wrapped operation, typically the caller itself with `err_code` replaced by the functor's argument.
 * @param ret
 *        Where the result of `func()` goes, if it was executed.
 * @param err_code
 *        The caller's `err_code` argument.
 * @param context
 *        Context string for the Runtime_error, if thrown.
 * @return `true` if and only if `func()` executed and did not throw.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context);

/**
 * Equivalent of exec_and_throw_on_error() for operations returning `void`.
 *
 * @tparam Func
 *         Functor type compatible with signature `void F(Error_code*)`.
 * @param func
 *        See exec_and_throw_on_error().
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return See exec_and_throw_on_error().
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace zflags::error
