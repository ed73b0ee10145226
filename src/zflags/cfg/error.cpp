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
#include "zflags/cfg/error.hpp"
#include <cassert>
#include <string>

namespace zflags::cfg::error
{

// Types.

/**
 * The boost.system category for errors returned by the zflags::cfg module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something like `ec.message()` is invoked.
 *
 * This class's declaration is not available outside this translation unit; its logic is accessed indirectly through
 * standard boost.system machinery (`Error_code::category().name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements superclass API: returns a `static` string representing this `error_category`.
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements superclass API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, an error::Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "zflags_cfg";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_VALUE:
    return "Value given for an option is not valid for that option.";
  case Code::S_UNKNOWN_FLAG:
    return "Command line contains a flag that has not been registered.";
  case Code::S_FLAG_SYNTAX:
    return "Command line is malformed.";
  case Code::S_HELP_REQUESTED:
    return "Command line requested the usage message.";
  case Code::S_FLAG_REDEFINED:
    return "Attempted to register a flag under a name that is already registered.";
  }
  assert(false);
  return "";
} // Category::message()

} // namespace zflags::cfg::error
