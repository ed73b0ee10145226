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
#include "zflags/util/string_ostream.hpp"

namespace zflags::util
{

// Types.

/**
 * An empty interface, consisting of nothing but a default `virtual` destructor, intended as a boiler-plate-reducing
 * base for any other (presumably `virtual`-method-having) class that would otherwise require a default `virtual`
 * destructor.  Publicly derive interface classes from it.
 */
class Null_interface
{
public:
  // Destructor.

  /**
   * Boring `virtual` destructor.  It is pure so that Null_interface itself cannot be instantiated; subclasses still
   * get a compiler-generated one.
   */
  virtual ~Null_interface() = 0;
};

// Free functions.

/**
 * Helper of ostream_op_to_string() (induction base).
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param os
 *        Stream.
 * @param only_ostream_arg
 *        Argument to write.
 */
template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg);

/**
 * Helper of ostream_op_to_string() (induction step).
 *
 * @tparam T1
 *         See ostream_op_to_string().
 * @tparam ...T_rest
 *         See ostream_op_to_string().
 * @param os
 *        Stream.
 * @param ostream_arg1
 *        First argument to write.
 * @param remaining_ostream_args
 *        The rest.
 */
template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args);

// Template implementations.

template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg)
{
  // Induction base.
  *os << only_ostream_arg;
}

template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args)
{
  // Induction step.
  *os << ostream_arg1;
  feed_args_to_ostream(os, remaining_ostream_args...);
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  using std::flush;

  /* Pushes characters directly onto an `std::string`, instead of doing so into an `ostringstream` and then getting it
   * by copy via `ostringstream::str()`. */
  String_ostream os(target_str);
  feed_args_to_ostream(&(os.os()), ostream_args...);
  os.os() << flush;
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  using std::string;

  string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

} // namespace zflags::util
