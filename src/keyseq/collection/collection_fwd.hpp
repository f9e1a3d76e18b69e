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
#include "keyseq/util/string_view.hpp"
#include <boost/shared_ptr.hpp>
#include <ostream>

/**
 * Ordered, key-addressable, deduplicating collections of items (canonically Column objects, the columns of some
 * table-like structure), plus the read-only view that aliases a collection's storage.
 *
 * Three structures make up the state of every collection, each held via `boost::shared_ptr`:
 *   - Entry_sequence: the ordered (key, item) pairs; the ground truth.
 *   - Key_index: key to item, and position to item.
 *   - Active_set: the items (by identity) currently present.
 *
 * Column_collection keeps every entry ever added (duplicate keys included) while its key index favors the first
 * occurrence of a key.  Dedupe_column_collection keeps at most one entry per key.  Immutable_column_collection, made
 * by `as_immutable()` on either, shares the very same three structures with its source, so later mutation of the
 * source shows through the view.  All three serialize via boost.serialization; saving a collection and its view
 * into the same archive and loading them back restores that sharing.
 *
 * An `Item` type usable in these templates must provide `const std::string& key() const` and
 * `const std::string& name() const`, and be default-constructible by boost.serialization (if serialized).
 */
namespace keyseq::collection
{

// Types.

// Find doc headers near the bodies of these compound types.

class Column;

template<typename Item>
struct Entry_sequence;
template<typename Item>
struct Key_index;
template<typename Item>
struct Active_set;

template<typename Item>
class Column_collection_base;
template<typename Item>
class Column_collection;
template<typename Item>
class Dedupe_column_collection;
template<typename Item>
class Immutable_column_collection;

/// Short-hand for ref-counted pointer to a Column; the item handle type of the stock collections.
using Column_ptr = boost::shared_ptr<Column>;

/// Lenient collection of Column items.
using Columns = Column_collection<Column>;
/// Deduplicating collection of Column items.
using Dedupe_columns = Dedupe_column_collection<Column>;
/// Read-only view of Column items.
using Immutable_columns = Immutable_column_collection<Column>;

// Free functions.

/**
 * Prints string representation of the given Column to the given `ostream`.
 *
 * @relatesalso Column
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Column& val);

/**
 * Returns `lhs.compare(rhs)`; i.e., whether the two collections hold the same keys mapped to the identical items,
 * position for position.  The two may be of different variants.
 *
 * @relatesalso Column_collection_base
 *
 * @param lhs
 *        Object to compare.
 * @param rhs
 *        Object to compare.
 * @return See above.
 */
template<typename Item>
bool operator==(const Column_collection_base<Item>& lhs, const Column_collection_base<Item>& rhs);

/**
 * Negation of the similar `==` operator.
 *
 * @relatesalso Column_collection_base
 *
 * @param lhs
 *        Object to compare.
 * @param rhs
 *        Object to compare.
 * @return See above.
 */
template<typename Item>
bool operator!=(const Column_collection_base<Item>& lhs, const Column_collection_base<Item>& rhs);

/**
 * Prints string representation of the given collection, e.g., `Dedupe_column_collection[id, name, street]`, to the
 * given `ostream`.
 *
 * @relatesalso Column_collection_base
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Item>
std::ostream& operator<<(std::ostream& os, const Column_collection_base<Item>& val);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Column_collection
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Item>
void swap(Column_collection<Item>& val1, Column_collection<Item>& val2);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Dedupe_column_collection
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Item>
void swap(Dedupe_column_collection<Item>& val1, Dedupe_column_collection<Item>& val2);

} // namespace keyseq::collection
