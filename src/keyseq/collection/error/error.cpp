/* keyseq
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
#include "keyseq/collection/error/error.hpp"
#include <cassert>

namespace keyseq::collection::error
{

// Types.

/**
 * The boost.system category for errors returned by the keyseq::collection module.  Analogous to
 * `boost::asio::error::get_ssl_category()`.  The singleton S_CATEGORY is the only instance.
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
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging keyseq::Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description
   * of that error (similar in spirit to `std::strerror()`).  This is the "engine" that allows `ec.message()`
   * to work, where `ec` is a keyseq::Error_code with a keyseq::collection::error::Code value.
   *
   * @param val
   *        Error code of a category member error.
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors/destructor.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for keyseq::collection::error-created error_codes.  This is
   * what glues the integer value to the name/message() strings. */
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "keyseq_collection";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT TEXT IN error.hpp.

  switch (static_cast<Code>(val))
  {
  case Code::S_KEY_MISMATCH:
    return "Explicit key does not match the item's own key; a deduplicating collection requires them to be equal.";
  case Code::S_NULL_ITEM:
    return "Null item handle supplied where an item is required.";
  case Code::S_UNNAMED_ITEM:
    return "Item has an empty key; a deduplicating collection cannot index it.";
  case Code::S_KEY_NOT_FOUND:
    return "No item is indexed under the given key.";
  case Code::S_ITEM_NOT_FOUND:
    return "The given item is not a member of the collection.";
  case Code::S_POSITION_OUT_OF_RANGE:
    return "Position is not less than the collection size.";
  case Code::S_MEMBERSHIP_REQUIRES_KEY:
    return "Membership test requires a string key; use contains_column() to test item membership.";
  case Code::S_COLLECTION_IMMUTABLE:
    return "Collection is immutable; mutating operations are not supported.";
  }
  assert(false);
  return "";
} // Category::message()

} // namespace keyseq::collection::error
