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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace zflags::util
{

/**
 * Similar to `ostringstream` but allows fast read-only access directly into the `std::string` being written;
 * and some limited write access to that string.  Also it can take over an existing `std::string`.
 *
 * Encoders and loggers use it to serialize a record into a string that is then written in one piece.
 *
 * @warning Don't forget to `flush` `os()` before reading str(); output may otherwise still sit in the stream
 *          buffer.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Wraps either the given `std::string` or a new internally allocated one.  The string is *not* cleared.
   *
   * @param target_str
   *        Pointer to the string to which to append; or null to use an internally owned one.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * Access to the mutable stream, writing to which (with a `flush` at the end) appends to the string.
   *
   * @return See above.
   */
  std::ostream& os();

  /**
   * Read-only access to the target string.
   *
   * @return See above.
   */
  const std::string& str() const;

  /// Clears the target string.
  void str_clear();

private:
  // Types.

  /// Short-hand for an `ostream` writing to which will append to an std::string it is adapting.
  using String_appender_ostream = boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>>;

  // Data.

  /// If the user chose not to pass in a string, this is where we keep it; otherwise unused.
  std::string m_own_target_str;

  /// Pointer to the target string.
  std::string* m_target;

  /// Inserter into #m_target.
  boost::iostreams::back_insert_device<std::string> m_target_inserter;

  /// Appender `ostream` into #m_target by way of #m_target_inserter.
  String_appender_ostream m_target_appender_ostream;
}; // class String_ostream

} // namespace zflags::util
