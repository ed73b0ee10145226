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
#include "zflags/log/encoder.hpp"
#include "zflags/util/fmt.hpp"
#include <chrono>
#include <cmath>
#include <ctime>

namespace zflags::log
{

namespace
{

/**
 * Appends `"key":` (or, if `spaced`, `"key": `) to `*target`, preceded by a comma (comma-space) unless `*first`.
 * Clears `*first`.
 *
 * @param key
 *        Key.
 * @param spaced
 *        Whether to add spaces after separators.
 * @param first
 *        In/out: whether this is the first key in the object.
 * @param target
 *        String to which to append.
 */
void append_json_key(util::String_view key, bool spaced, bool* first, std::string* target)
{
  if (*first)
  {
    *first = false;
  }
  else
  {
    target->append(spaced ? ", " : ",");
  }
  append_json_str(key, target);
  target->append(spaced ? ": " : ":");
}

/**
 * Appends the given fields to `*target` as JSON keys and values, continuing an object whose state is `*first`.
 *
 * @param fields
 *        Fields, in output order.
 * @param spaced
 *        See append_json_key().
 * @param first
 *        See append_json_key().
 * @param target
 *        String to which to append.
 */
void append_json_fields(const Fields& fields, bool spaced, bool* first, std::string* target)
{
  for (const auto& field : fields)
  {
    append_json_key(field.key(), spaced, first, target);
    append_json_value(field.value(), target);
  }
}

/**
 * Returns "file.cpp:line" for the call site in the given metadata.
 *
 * @param metadata
 *        Metadata.
 * @return See above.
 */
std::string caller_str(const Msg_metadata& metadata)
{
  return fmt::format("{}:{}", metadata.m_msg_src_file, metadata.m_msg_src_line);
}

} // Anonymous namespace

// Implementations.

Encoder_config Encoder_config::production() // Static.
{
  return Encoder_config{ "msg", "level", "ts", "caller",
                         Level_encoding::S_LOWER, Time_encoding::S_EPOCH, "\n" };
}

Encoder_config Encoder_config::development() // Static.
{
  return Encoder_config{ "M", "L", "T", "C",
                         Level_encoding::S_CAPITAL, Time_encoding::S_EPOCH, "\n" };
}

bool operator==(const Encoder_config& val1, const Encoder_config& val2)
{
  return (val1.m_message_key == val2.m_message_key)
         && (val1.m_level_key == val2.m_level_key)
         && (val1.m_time_key == val2.m_time_key)
         && (val1.m_caller_key == val2.m_caller_key)
         && (val1.m_level_encoding == val2.m_level_encoding)
         && (val1.m_time_encoding == val2.m_time_encoding)
         && (val1.m_line_ending == val2.m_line_ending);
}

bool operator!=(const Encoder_config& val1, const Encoder_config& val2)
{
  return !(val1 == val2);
}

Encoder::Encoder(const Encoder_config& config) :
  m_config(config)
{
  // Nothing else.
}

std::string Encoder::level_str(Sev sev) const
{
  return (m_config.m_level_encoding == Encoder_config::Level_encoding::S_CAPITAL)
           ? sev_to_capital_str(sev)
           : sev_to_lower_str(sev);
}

std::string Encoder::time_str(const Msg_metadata::Time_stamp& time_stamp) const
{
  return (m_config.m_time_encoding == Encoder_config::Time_encoding::S_ISO8601)
           ? iso8601_time_str(time_stamp)
           : epoch_time_str(time_stamp);
}

Json_encoder::Json_encoder(const Encoder_config& config) :
  Encoder(config)
{
  // Nothing else.
}

void Json_encoder::encode(const Msg_metadata& metadata, util::String_view msg, std::string* target) const // Virtual.
{
  bool first = true;

  target->push_back('{');

  if (!m_config.m_level_key.empty())
  {
    append_json_key(m_config.m_level_key, false, &first, target);
    append_json_str(level_str(metadata.m_msg_sev), target);
  }
  if (!m_config.m_time_key.empty())
  {
    append_json_key(m_config.m_time_key, false, &first, target);
    // Epoch time is a JSON number; any other rendering is a string.
    if (m_config.m_time_encoding == Encoder_config::Time_encoding::S_EPOCH)
    {
      target->append(epoch_time_str(metadata.m_called_when));
    }
    else
    {
      append_json_str(time_str(metadata.m_called_when), target);
    }
  }
  if (!m_config.m_caller_key.empty())
  {
    append_json_key(m_config.m_caller_key, false, &first, target);
    append_json_str(caller_str(metadata), target);
  }
  if (!m_config.m_message_key.empty())
  {
    append_json_key(m_config.m_message_key, false, &first, target);
    append_json_str(msg, target);
  }
  if (metadata.m_fields)
  {
    append_json_fields(*metadata.m_fields, false, &first, target);
  }

  target->push_back('}');
  target->append(m_config.m_line_ending);
} // Json_encoder::encode()

Console_encoder::Console_encoder(const Encoder_config& config) :
  Encoder(config)
{
  // Nothing else.
}

void Console_encoder::encode(const Msg_metadata& metadata, util::String_view msg, std::string* target) const // Virtual.
{
  constexpr char SEP = '\t';

  // Elements are tab-separated; an omitted element (empty key) leaves no empty column behind.
  bool first = true;
  const auto add_element = [&](util::String_view element)
  {
    if (first)
    {
      first = false;
    }
    else
    {
      target->push_back(SEP);
    }
    target->append(element);
  };

  if (!m_config.m_time_key.empty())
  {
    add_element(time_str(metadata.m_called_when));
  }
  if (!m_config.m_level_key.empty())
  {
    add_element(level_str(metadata.m_msg_sev));
  }
  if (!m_config.m_caller_key.empty())
  {
    add_element(caller_str(metadata));
  }
  if (!m_config.m_message_key.empty())
  {
    add_element(msg);
  }

  if (metadata.m_fields && (!metadata.m_fields->empty()))
  {
    std::string fields_str("{");
    bool first_field = true;
    append_json_fields(*metadata.m_fields, true, &first_field, &fields_str);
    fields_str.push_back('}');
    add_element(fields_str);
  }

  target->append(m_config.m_line_ending);
} // Console_encoder::encode()

std::string epoch_time_str(const Msg_metadata::Time_stamp& time_stamp)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;

  const auto usec_since_epoch = duration_cast<microseconds>(time_stamp.time_since_epoch()).count();
  const microseconds::rep sec = usec_since_epoch / 1000000;
  const microseconds::rep usec = usec_since_epoch % 1000000;

  // sec.usec, padded with zeroes up to 6 digits.
  return fmt::format("{}.{:06}", sec, usec);
}

std::string iso8601_time_str(const Msg_metadata::Time_stamp& time_stamp)
{
  using Clock = Msg_metadata::Clock;
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;

  /* localtime() has 1-second resolution, so splice in the milliseconds ourselves.  It also gives us the UTC offset
   * (tm_gmtoff) with which to decide between "Z" and "+hhmm". */
  const std::tm local_tm = fmt::localtime(Clock::to_time_t(time_stamp));
  const auto msec = duration_cast<milliseconds>(time_stamp.time_since_epoch()).count() % 1000;

  auto str = fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}", local_tm, msec);
  if (local_tm.tm_gmtoff == 0)
  {
    str.push_back('Z');
  }
  else
  {
    str += fmt::format("{:%z}", local_tm);
  }
  return str;
} // iso8601_time_str()

void append_json_str(util::String_view str, std::string* target)
{
  target->push_back('"');
  for (const char c : str)
  {
    switch (c)
    {
    case '"':
      target->append("\\\"");
      break;
    case '\\':
      target->append("\\\\");
      break;
    case '\n':
      target->append("\\n");
      break;
    case '\r':
      target->append("\\r");
      break;
    case '\t':
      target->append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
      {
        target->append(fmt::format("\\u{:04x}", static_cast<unsigned int>(c)));
      }
      else
      {
        target->push_back(c);
      }
    }
  }
  target->push_back('"');
} // append_json_str()

void append_json_value(const Field::Value& value, std::string* target)
{
  struct Visitor
  {
    std::string* const m_target;

    void operator()(const std::string& val) const
    {
      append_json_str(val, m_target);
    }
    void operator()(int64_t val) const
    {
      m_target->append(fmt::format("{}", val));
    }
    void operator()(double val) const
    {
      if (std::isnan(val))
      {
        m_target->append("\"NaN\"");
      }
      else if (std::isinf(val))
      {
        m_target->append((val > 0) ? "\"+Inf\"" : "\"-Inf\"");
      }
      else
      {
        m_target->append(fmt::format("{}", val));
      }
    }
    void operator()(bool val) const
    {
      m_target->append(val ? "true" : "false");
    }
  }; // struct Visitor

  std::visit(Visitor{ target }, value);
} // append_json_value()

} // namespace zflags::log
