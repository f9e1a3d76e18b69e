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
#pragma once

#include "keyseq/common.hpp"
#include <boost/system/error_code.hpp>

/**
 * Namespace containing the keyseq::collection module's extension of `boost.system` error conventions, so that
 * the collection API can return codes/messages from within its own new set of error codes/messages.
 * The recipe is the usual one: `enum` `Code`, a `make_error_code()` for ADL, and a
 * `boost::system::is_error_code_enum<>` specialization.
 *
 * The codes are emitted (via the trailing `Error_code*` argument, or as a keyseq::error::Runtime_error when that
 * argument is null) by Column_collection, Dedupe_column_collection, and Immutable_column_collection.
 */
namespace keyseq::collection::error
{

// Types.

/**
 * All possible errors returned (via keyseq::Error_code arguments) by keyseq::collection functions/methods.
 * These values are convertible to keyseq::Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that keyseq::Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message().  This
 * description must be identical to the description in the `///` comment below, or at least as close as possible.
 *
 * If you add a value, add it to the end.  If you deprecate a value, do not delete it; mark it deprecated here
 * and remove it from Category::message().
 */
enum class Code
{
  /// Explicit key does not match the item's own key; a deduplicating collection requires them to be equal.
  S_KEY_MISMATCH = 1,
  /// Null item handle supplied where an item is required.
  S_NULL_ITEM,
  /// Item has an empty key; a deduplicating collection cannot index it.
  S_UNNAMED_ITEM,
  /// No item is indexed under the given key.
  S_KEY_NOT_FOUND,
  /// The given item is not a member of the collection.
  S_ITEM_NOT_FOUND,
  /// Position is not less than the collection size.
  S_POSITION_OUT_OF_RANGE,
  /// Membership test requires a string key; use contains_column() to test item membership.
  S_MEMBERSHIP_REQUIRES_KEY,
  /// Collection is immutable; mutating operations are not supported.
  S_COLLECTION_IMMUTABLE
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight keyseq::Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template
 * implementation work.  Or, slightly more in English, it glues the (completely general) keyseq::Error_code
 * to the (keyseq::collection-specific) error code set `Code`, so that one can implicitly covert from the latter to
 * the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding keyseq::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace keyseq::collection::error

/// We may add some ADL-based overloads into this namespace outside `keyseq`.
namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system accepts `enum` `Code` as convertible to `Error_code`.  The
 * non-specialized version sets `value` to false, so that arbitrary `enum`s can't just be used as `Error_code`s.
 */
template<>
struct is_error_code_enum<::keyseq::collection::error::Code>
{
  /// Means `Code` `enum` values can be used for keyseq::Error_code.
  static const bool value = true;
};

} // namespace boost::system
