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
#include "zflags/log/config.hpp"

namespace zflags::log
{

// Static initializations.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_verbosity_default(most_verbose_sev_default)
{
  // Nothing else.
}

bool Config::output_whether_should_log(Sev sev) const
{
  return sev_passes(sev, m_verbosity_default.load(std::memory_order_relaxed));
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default)
{
  m_verbosity_default.store(most_verbose_sev_default, std::memory_order_relaxed);
}

Sev Config::default_verbosity() const
{
  return m_verbosity_default.load(std::memory_order_relaxed);
}

} // namespace zflags::log
