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

/* Include fmt (with its chrono support) through this header only.  Some gcc versions emit false
 * `-Wstringop-overflow` warnings from fmt's inlined code; they are silenced here, for fmt's headers alone.
 *
 * @todo Drop the pragmas once the supported gcc versions no longer warn: https://github.com/fmtlib/fmt/issues/3334 */

#if defined(__GNUC__) && !defined(__clang__)
#  define ZFLAGS_GCC_COMPILER
#endif

#ifdef ZFLAGS_GCC_COMPILER
#  pragma GCC diagnostic push
#  pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ZFLAGS_GCC_COMPILER
#  pragma GCC diagnostic pop
#  undef ZFLAGS_GCC_COMPILER
#endif
