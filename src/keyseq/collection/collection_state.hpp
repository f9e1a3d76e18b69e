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

#include "keyseq/collection/collection_fwd.hpp"
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <boost/serialization/access.hpp>
#include <boost/serialization/library_version_type.hpp> // Must precede boost_unordered_*.hpp in Boost 1.74.
#include <boost/serialization/boost_unordered_map.hpp>
#include <boost/serialization/boost_unordered_set.hpp>
#include <boost/serialization/shared_ptr.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/utility.hpp>
#include <boost/serialization/vector.hpp>
#include <string>
#include <utility>
#include <vector>

namespace keyseq::collection
{

// Types.

/**
 * The ordered (key, item) pairs of a collection: its ground truth.  Key_index and Active_set are derived from it.
 * In Column_collection the same key, and even the same item, may appear more than once; in Dedupe_column_collection
 * each key appears at most once.
 *
 * Held by each collection via `boost::shared_ptr`, and shared with every Immutable_column_collection made from it.
 * Hence the data member is public, but only the collection templates touch it in non-`const` fashion.
 *
 * @tparam Item
 *         See namespace keyseq::collection doc header.
 */
template<typename Item>
struct Entry_sequence
{
  // Types.

  /// Ref-counted item handle; identity is the address of the pointee.
  using Item_ptr = boost::shared_ptr<Item>;

  /// One (key, item) pair.
  using Entry = std::pair<std::string, Item_ptr>;

  /// The entries, in order.
  using Entry_vec = std::vector<Entry>;

  // Methods.

  /**
   * boost.serialization hook.
   *
   * @tparam Archive
   *         Archive type.
   * @param ar
   *        Archive.
   * @param version
   *        Ignored.
   */
  template<typename Archive>
  void serialize(Archive& ar, const unsigned int version);

  // Data.

  /// The entries, in order.
  Entry_vec m_entries;
}; // struct Entry_sequence

/**
 * Lookup structure derived from an Entry_sequence: key to item, and position to item.  For a given key the indexed
 * item is the item of the *first* entry with that key; in a deduplicating collection that is the only such entry.
 * `m_by_position[i]` is always the item of entry `i`; and `m_first_position_by_key[k]` is the position of that first
 * entry, so `m_by_position[m_first_position_by_key[k]] == m_by_key[k]`.
 *
 * @tparam Item
 *         See namespace keyseq::collection doc header.
 */
template<typename Item>
struct Key_index
{
  // Types.

  /// Short-hand for item handle.
  using Item_ptr = boost::shared_ptr<Item>;

  // Methods.

  /**
   * boost.serialization hook.
   *
   * @tparam Archive
   *         Archive type.
   * @param ar
   *        Archive.
   * @param version
   *        Ignored.
   */
  template<typename Archive>
  void serialize(Archive& ar, const unsigned int version);

  // Data.

  /// Key to first-seen item with that key.
  boost::unordered_map<std::string, Item_ptr> m_by_key;

  /// Position to item at that position.
  std::vector<Item_ptr> m_by_position;

  /// Key to position of the first entry with that key.
  boost::unordered_map<std::string, size_t> m_first_position_by_key;
}; // struct Key_index

/**
 * The items (by identity) currently present in a collection: every item of the Entry_sequence.  An item replaced or
 * removed from a deduplicating collection leaves this set.
 *
 * @tparam Item
 *         See namespace keyseq::collection doc header.
 */
template<typename Item>
struct Active_set
{
  // Types.

  /// Short-hand for item handle.  `boost::hash` of it hashes the pointee address.
  using Item_ptr = boost::shared_ptr<Item>;

  // Methods.

  /**
   * boost.serialization hook.
   *
   * @tparam Archive
   *         Archive type.
   * @param ar
   *        Archive.
   * @param version
   *        Ignored.
   */
  template<typename Archive>
  void serialize(Archive& ar, const unsigned int version);

  // Data.

  /// The set.
  boost::unordered_set<Item_ptr> m_items;
}; // struct Active_set

// Template implementations.

template<typename Item>
template<typename Archive>
void Entry_sequence<Item>::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & m_entries;
}

template<typename Item>
template<typename Archive>
void Key_index<Item>::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & m_by_key;
  ar & m_by_position;
  ar & m_first_position_by_key;
}

template<typename Item>
template<typename Archive>
void Active_set<Item>::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & m_items;
}

} // namespace keyseq::collection
