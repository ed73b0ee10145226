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
#include "zflags/log/stream_logger.hpp"
#include <cassert>

namespace zflags::log
{

// Implementations.

Stream_logger::Stream_logger(Sev most_verbose_sev, std::unique_ptr<Encoder> encoder, std::ostream& os) :
  m_config(most_verbose_sev),
  m_encoder(std::move(encoder)),
  m_os(os)
{
  assert(m_encoder);
}

bool Stream_logger::should_log(Sev sev) const // Virtual.
{
  return m_config.output_whether_should_log(sev);
}

void Stream_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  assert(metadata);

  /* Encode and write under one lock, reusing m_record_buf.  Encoding outside the lock into a local string would
   * shorten the critical section at the cost of an allocation per record; console logging is not that hot. */
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);

  m_record_buf.clear();
  m_encoder->encode(*metadata, msg, &m_record_buf);
  m_os.write(m_record_buf.data(), m_record_buf.size());
  m_os.flush();
}

const Encoder& Stream_logger::encoder() const
{
  return *m_encoder;
}

} // namespace zflags::log
