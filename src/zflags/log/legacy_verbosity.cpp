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
#include "zflags/log/legacy_verbosity.hpp"
#include "zflags/error/error.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <limits>

namespace zflags::log
{

// Static initializations.

const unsigned int Process_legacy_verbosity::S_MAX_VERBOSITY = std::numeric_limits<int32_t>::max();

// Implementations.

Process_legacy_verbosity::Process_legacy_verbosity() :
  m_verbosity(0)
{
  // Nothing else.
}

Process_legacy_verbosity& Process_legacy_verbosity::get_singleton() // Static.
{
  static Process_legacy_verbosity s_singleton;
  return s_singleton;
}

void Process_legacy_verbosity::set_verbosity(unsigned int verbosity, Error_code* err_code) // Virtual.
{
  if (error::exec_void_and_throw_on_error([&](Error_code* actual_err_code)
                                            { set_verbosity(verbosity, actual_err_code); },
                                          err_code, ZFLAGS_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else

  if (verbosity > S_MAX_VERBOSITY)
  {
    *err_code = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
    return;
  }
  // else

  err_code->clear();
  m_verbosity.store(verbosity, std::memory_order_relaxed);
}

unsigned int Process_legacy_verbosity::verbosity() const // Virtual.
{
  return m_verbosity.load(std::memory_order_relaxed);
}

} // namespace zflags::log
