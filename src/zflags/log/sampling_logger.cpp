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
#include "zflags/log/sampling_logger.hpp"
#include <boost/container_hash/hash.hpp>
#include <cassert>

namespace zflags::log
{

// Static initializations.

const Sampling_logger::Duration Sampling_logger::S_TICK_DEFAULT = std::chrono::seconds(1);
const unsigned int Sampling_logger::S_FIRST_DEFAULT = 100;
const unsigned int Sampling_logger::S_THEREAFTER_DEFAULT = 100;
const size_t Sampling_logger::S_N_COUNTERS = 4096;

// Implementations.

Sampling_logger::Sampling_logger(std::unique_ptr<Logger> core,
                                 Duration tick, unsigned int first, unsigned int thereafter) :
  m_core(std::move(core)),
  m_tick(tick),
  m_first(first),
  m_thereafter(thereafter),
  m_counters(S_N_COUNTERS),
  m_dropped_count(0)
{
  assert(m_core);
}

bool Sampling_logger::should_log(Sev sev) const // Virtual.
{
  return m_core->should_log(sev);
}

void Sampling_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  assert(metadata);

  size_t key = boost::hash_range(msg.begin(), msg.end());
  boost::hash_combine(key, static_cast<int>(metadata->m_msg_sev));

  {
    util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

    // An unused counter is (epoch, 0), so it starts a window right away.
    auto& counter = m_counters[key % S_N_COUNTERS];
    if (metadata->m_called_when >= counter.m_reset_after)
    {
      counter.m_count = 1;
      counter.m_reset_after = metadata->m_called_when + m_tick;
    }
    else
    {
      ++counter.m_count;
    }

    const auto n = counter.m_count;
    if ((n > m_first) && ((m_thereafter == 0) || (((n - m_first) % m_thereafter) != 0)))
    {
      ++m_dropped_count;
      return;
    }
  } // Unlock: the wrapped Logger has its own protection.

  m_core->do_log(metadata, msg);
} // Sampling_logger::do_log()

Logger* Sampling_logger::core() const
{
  return m_core.get();
}

uint64_t Sampling_logger::dropped_count() const
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_dropped_count;
}

size_t Sampling_logger::counter_count() const
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_counters.size();
}

} // namespace zflags::log
