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
#include "zflags/log/buffer_logger.hpp"
#include <ostream>

namespace zflags::log
{

// Implementations.

Buffer_logger::Buffer_logger(Sev most_verbose_sev, std::unique_ptr<Encoder> encoder) :
  m_config(most_verbose_sev),
  m_encoder(encoder ? std::move(encoder)
                    : std::unique_ptr<Encoder>(new Console_encoder(Encoder_config::development())))
{
  // Nothing else.
}

bool Buffer_logger::should_log(Sev sev) const // Virtual.
{
  return m_config.output_whether_should_log(sev);
}

void Buffer_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  using std::flush;

  std::string record;
  m_encoder->encode(*metadata, msg, &record);

  // Prevent simultaneous logging, reading-by-copy.
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);
  m_os.os() << record << flush;
}

const std::string& Buffer_logger::buffer_str() const
{
  return m_os.str(); // (Mutex lock wouldn't help here, even if we used it, as this returns [basically] a pointer.)
}

const std::string Buffer_logger::buffer_str_copy() const
{
  // Prevent simultaneous logging, reading.
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);

  return buffer_str(); // Copy occurs here; then mutex is unlocked.
}

void Buffer_logger::buffer_clear()
{
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);
  m_os.str_clear();
}

} // namespace zflags::log
