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

#include "keyseq/collection/collection_state.hpp"
#include "keyseq/collection/error/error.hpp"
#include "keyseq/error/error.hpp"
#include "keyseq/log/log.hpp"
#include <boost/iterator/iterator_facade.hpp>
#include <boost/make_shared.hpp>
#include <boost/serialization/access.hpp>

namespace keyseq::collection
{

// Types.

/**
 * The read side shared by all collections: the three structures (Entry_sequence, Key_index, Active_set), each held by
 * `boost::shared_ptr`, and every non-mutating operation on them.  Column_collection, Dedupe_column_collection, and
 * Immutable_column_collection derive from this; it cannot be instantiated by itself.
 *
 * ### Keys versus positions ###
 * size(), at() by position, items(), keys(), entries(), and iteration all reflect the full Entry_sequence, one
 * element per entry.  at() by key, get(), and contains() by key consult the Key_index, which maps a key to the item
 * of the first entry under that key.  In a Column_collection these can disagree (the same key twice, or the same item
 * twice); that is intentional.
 *
 * ### Iteration ###
 * begin() snapshots the items at that moment; the Const_iterator shares ownership of the snapshot.  Therefore a
 * collection may be mutated (e.g., Dedupe_column_collection::remove()) while iterating over it; the loop sees each
 * element of the snapshot exactly once.
 *
 * ### Thread safety ###
 * None beyond that of a plain value type.  Note that a view shares state with its source, so a view and its source
 * are one object for this purpose.
 *
 * @tparam Item
 *         See namespace keyseq::collection doc header.
 */
template<typename Item>
class Column_collection_base :
  public log::Log_context
{
public:
  // Types.

  /// Item handle.  Two handles are the same item if and only if they point to the same object.
  using Item_ptr = boost::shared_ptr<Item>;

  /// A (key, item) pair.
  using Entry = typename Entry_sequence<Item>::Entry;

  /// Ordered (key, item) pairs, as accepted by collection constructors and returned by entries().
  using Entry_list = typename Entry_sequence<Item>::Entry_vec;

  /// Ordered items.
  using Item_list = std::vector<Item_ptr>;

  /// Ordered keys.
  using Key_list = std::vector<std::string>;

  class Const_iterator;

  /// For container compliance.
  using const_iterator = Const_iterator;

  /// For container compliance.
  using value_type = Item_ptr;

  /// For container compliance.
  using size_type = std::size_t;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Column_collection_base();

  // Methods.

  /**
   * Number of entries.
   * @return See above.
   */
  size_type size() const;

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns the item indexed under the given key: in a Column_collection the item of the first entry with that key.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_KEY_NOT_FOUND.
   * @return The item; null on error.
   */
  Item_ptr at(const std::string& key, Error_code* err_code = 0) const;

  /**
   * Returns the item of the entry at the given position.
   *
   * @param position
   *        0-based position.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_POSITION_OUT_OF_RANGE (`position >= size()`).
   * @return The item; null on error.
   */
  Item_ptr at(size_type position, Error_code* err_code = 0) const;

  /**
   * Like at() by key, but returns `default_item` instead of failing when nothing is indexed under the key.
   *
   * @param key
   *        Key.
   * @param default_item
   *        Value to return if `!contains(key)`.
   * @return See above.
   */
  Item_ptr get(const std::string& key, const Item_ptr& default_item = Item_ptr()) const;

  /**
   * Whether anything is indexed under the given key.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  bool contains(const std::string& key) const;

  /**
   * Always fails: membership is by key.  To test whether an item is present, use contains_column().
   *
   * @param item
   *        Ignored.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_MEMBERSHIP_REQUIRES_KEY (always).
   * @return `false`.
   */
  bool contains(const Item_ptr& item, Error_code* err_code = 0) const;

  /**
   * Whether the given item (by identity) is present.  Constant time.
   *
   * @param item
   *        Item.
   * @return See above.
   */
  bool contains_column(const Item_ptr& item) const;

  /**
   * The key of each entry, in order; duplicates included.
   * @return See above.
   */
  Key_list keys() const;

  /**
   * The item of each entry, in order; duplicates included.
   * @return See above.
   */
  Item_list items() const;

  /**
   * Copy of the entries, in order.
   * @return See above.
   */
  Entry_list entries() const;

  /**
   * Returns `true` if and only if `other` has the same number of entries as `*this`, and at each position the two
   * entries have equal keys and identical items.  `other` may be of a different variant.
   *
   * @param other
   *        Object to compare.
   * @return See above.
   */
  bool compare(const Column_collection_base& other) const;

  /**
   * Returns `true` if and only if `*this` and `other` hold the very same three structures: e.g., `other` is a view
   * made by `as_immutable()` on `*this`, or vice versa, or both are views of one collection.
   *
   * @param other
   *        Object to check.
   * @return See above.
   */
  bool shares_state_with(const Column_collection_base& other) const;

  /**
   * Read-only access to the Entry_sequence.
   * @return See above.
   */
  const Entry_sequence<Item>& entry_sequence() const;

  /**
   * Read-only access to the Key_index.
   * @return See above.
   */
  const Key_index<Item>& key_index() const;

  /**
   * Read-only access to the Active_set.
   * @return See above.
   */
  const Active_set<Item>& active_set() const;

  /**
   * Returns iterator to the first item of a snapshot of items() taken now.
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns past-the-end iterator, equal to any iterator past the end of any snapshot.
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Short name of the concrete class, as printed by `operator<<`.
   * @return See above.
   */
  virtual util::String_view type_name() const = 0;

  /* A deserialized collection has no Logger (it is not serialized); this lets the user give it one.  Also for
   * redirecting a live collection's logging. */
  using log::Log_context::set_logger;

protected:
  // Constructors.

  /**
   * Constructs with fresh, empty structures.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   */
  explicit Column_collection_base(log::Logger* logger_ptr);

  /**
   * Constructs with structures that *are* those of `state_src`: not a copy.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param state_src
   *        Collection whose structures to share.
   */
  explicit Column_collection_base(log::Logger* logger_ptr, const Column_collection_base& state_src);

  /**
   * Copy constructor: constructs with fresh structures holding copies of the contents of `src`'s structures; the
   * items themselves are not copied.  Same Logger.
   *
   * @param src
   *        Source object.
   */
  Column_collection_base(const Column_collection_base& src);

  // Methods.

  /**
   * Swaps the structures (and Log_context) of `*this` and `other`.
   *
   * @param other
   *        Object.
   */
  void swap_state(Column_collection_base& other);

  /**
   * Appends an entry, updating all three structures: the key is indexed only if not yet indexed.  No checks.
   *
   * @param key
   *        Key.
   * @param item
   *        Item.
   */
  void append_entry(const std::string& key, const Item_ptr& item);

  /**
   * Rebuilds the Key_index and Active_set from the Entry_sequence in place (the structures themselves stay the same
   * objects, so views stay in sync).
   */
  void reindex();

  /**
   * Mutable access to the entries.  The caller must restore consistency (e.g., reindex()).
   * @return See above.
   */
  Entry_list& mutable_entries();

  /**
   * Mutable access to the Key_index.
   * @return See above.
   */
  Key_index<Item>& mutable_key_index();

  /**
   * Mutable access to the Active_set.
   * @return See above.
   */
  Active_set<Item>& mutable_active_set();

private:
  // Friends.

  /// Friend of Column_collection_base: For access to serialize().
  friend class boost::serialization::access;

  // Methods.

  /// Not assignable through the base.
  Column_collection_base& operator=(const Column_collection_base&) = delete;

  /**
   * boost.serialization hook: saves or loads the three `shared_ptr`s.  When loading, the existing structures are
   * replaced by the loaded ones; if a view of the same structures was saved into the same archive, the loaded view
   * shares the loaded structures.
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

  /// The ground truth.  Never null.
  boost::shared_ptr<Entry_sequence<Item>> m_entries;

  /// Derived from #m_entries.  Never null.
  boost::shared_ptr<Key_index<Item>> m_index;

  /// Derived from #m_entries.  Never null.
  boost::shared_ptr<Active_set<Item>> m_active;
}; // class Column_collection_base

/**
 * Forward iterator over a snapshot of Column_collection_base::items(), yielding `const Item_ptr&`.  A
 * default-constructed iterator is the past-the-end iterator for every snapshot.
 *
 * @tparam Item
 *         See Column_collection_base.
 */
template<typename Item>
class Column_collection_base<Item>::Const_iterator :
  public boost::iterator_facade<Const_iterator, const Item_ptr, boost::forward_traversal_tag>
{
public:
  // Constructors/destructor.

  /// Constructs past-the-end iterator.
  Const_iterator();

  /**
   * Constructs iterator to the first element of the given snapshot.
   *
   * @param snapshot
   *        The items to iterate over.  Must not be null.
   */
  explicit Const_iterator(boost::shared_ptr<const Item_list> snapshot);

private:
  // Friends.

  /// Friend of Const_iterator: For access to the `boost::iterator_facade` primitives.
  friend class boost::iterator_core_access;

  // Methods.

  /**
   * `iterator_facade` primitive: current element.
   * @return See above.
   */
  const Item_ptr& dereference() const;

  /// `iterator_facade` primitive: advance.
  void increment();

  /**
   * `iterator_facade` primitive: equality.
   *
   * @param other
   *        Object to compare.
   * @return See above.
   */
  bool equal(const Const_iterator& other) const;

  /**
   * Whether past-the-end.
   * @return See above.
   */
  bool at_end() const;

  // Data.

  /// The snapshot; null if default-constructed.
  boost::shared_ptr<const Item_list> m_snapshot;

  /// Index into `*m_snapshot`.
  size_type m_idx;
}; // class Column_collection_base::Const_iterator

// Template implementations.

template<typename Item>
Column_collection_base<Item>::Column_collection_base(log::Logger* logger_ptr) :
  log::Log_context(logger_ptr, Keyseq_log_component::S_COLLECTION),
  m_entries(boost::make_shared<Entry_sequence<Item>>()),
  m_index(boost::make_shared<Key_index<Item>>()),
  m_active(boost::make_shared<Active_set<Item>>())
{
  // Nothing else.
}

template<typename Item>
Column_collection_base<Item>::Column_collection_base(log::Logger* logger_ptr,
                                                     const Column_collection_base& state_src) :
  log::Log_context(logger_ptr, Keyseq_log_component::S_COLLECTION),
  m_entries(state_src.m_entries),
  m_index(state_src.m_index),
  m_active(state_src.m_active)
{
  // Nothing else.
}

template<typename Item>
Column_collection_base<Item>::Column_collection_base(const Column_collection_base& src) :
  log::Log_context(src),
  m_entries(boost::make_shared<Entry_sequence<Item>>(*src.m_entries)),
  m_index(boost::make_shared<Key_index<Item>>(*src.m_index)),
  m_active(boost::make_shared<Active_set<Item>>(*src.m_active))
{
  // Nothing else.
}

template<typename Item>
Column_collection_base<Item>::~Column_collection_base() = default;

template<typename Item>
typename Column_collection_base<Item>::size_type Column_collection_base<Item>::size() const
{
  return m_entries->m_entries.size();
}

template<typename Item>
bool Column_collection_base<Item>::empty() const
{
  return m_entries->m_entries.empty();
}

template<typename Item>
typename Column_collection_base<Item>::Item_ptr
  Column_collection_base<Item>::at(const std::string& key, Error_code* err_code) const
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(Item_ptr, at, key, _1);
  // If got here, err_code is non-null.

  const auto& by_key = m_index->m_by_key;
  const auto it = by_key.find(key);
  if (it == by_key.end())
  {
    KEYSEQ_LOG_TRACE("Collection [" << *this << "]: nothing under key [" << key << "].");
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_KEY_NOT_FOUND);
    return Item_ptr();
  }
  // else

  err_code->clear();
  return it->second;
} // Column_collection_base::at()

template<typename Item>
typename Column_collection_base<Item>::Item_ptr
  Column_collection_base<Item>::at(size_type position, Error_code* err_code) const
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(Item_ptr, at, position, _1);
  // If got here, err_code is non-null.

  const auto& by_position = m_index->m_by_position;
  if (position >= by_position.size())
  {
    KEYSEQ_LOG_TRACE("Collection [" << *this << "]: position [" << position << "] is past the "
                     "last position [" << by_position.size() << " - 1].");
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_POSITION_OUT_OF_RANGE);
    return Item_ptr();
  }
  // else

  err_code->clear();
  return by_position[position];
} // Column_collection_base::at()

template<typename Item>
typename Column_collection_base<Item>::Item_ptr
  Column_collection_base<Item>::get(const std::string& key, const Item_ptr& default_item) const
{
  const auto& by_key = m_index->m_by_key;
  const auto it = by_key.find(key);
  return (it == by_key.end()) ? default_item : it->second;
}

template<typename Item>
bool Column_collection_base<Item>::contains(const std::string& key) const
{
  return m_index->m_by_key.count(key) != 0;
}

template<typename Item>
bool Column_collection_base<Item>::contains(const Item_ptr& item, Error_code* err_code) const
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, contains, item, _1);
  // If got here, err_code is non-null.

  KEYSEQ_LOG_TRACE("Collection [" << *this << "]: asked for membership of item [" << item.get() << "] instead of a "
                   "key; contains_column() would be the right call.");
  KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_MEMBERSHIP_REQUIRES_KEY);
  return false;
}

template<typename Item>
bool Column_collection_base<Item>::contains_column(const Item_ptr& item) const
{
  return m_active->m_items.count(item) != 0;
}

template<typename Item>
typename Column_collection_base<Item>::Key_list Column_collection_base<Item>::keys() const
{
  Key_list keys;
  keys.reserve(size());
  for (const auto& entry : m_entries->m_entries)
  {
    keys.push_back(entry.first);
  }
  return keys;
}

template<typename Item>
typename Column_collection_base<Item>::Item_list Column_collection_base<Item>::items() const
{
  return m_index->m_by_position;
}

template<typename Item>
typename Column_collection_base<Item>::Entry_list Column_collection_base<Item>::entries() const
{
  return m_entries->m_entries;
}

template<typename Item>
bool Column_collection_base<Item>::compare(const Column_collection_base& other) const
{
  const auto& ours = m_entries->m_entries;
  const auto& theirs = other.m_entries->m_entries;

  if (ours.size() != theirs.size())
  {
    return false;
  }
  // else

  for (size_type idx = 0; idx != ours.size(); ++idx)
  {
    // Items by identity: shared_ptr == compares the pointers.
    if ((ours[idx].first != theirs[idx].first) || (ours[idx].second != theirs[idx].second))
    {
      return false;
    }
  }
  return true;
} // Column_collection_base::compare()

template<typename Item>
bool Column_collection_base<Item>::shares_state_with(const Column_collection_base& other) const
{
  return (m_entries == other.m_entries) && (m_index == other.m_index) && (m_active == other.m_active);
}

template<typename Item>
const Entry_sequence<Item>& Column_collection_base<Item>::entry_sequence() const
{
  return *m_entries;
}

template<typename Item>
const Key_index<Item>& Column_collection_base<Item>::key_index() const
{
  return *m_index;
}

template<typename Item>
const Active_set<Item>& Column_collection_base<Item>::active_set() const
{
  return *m_active;
}

template<typename Item>
typename Column_collection_base<Item>::Const_iterator Column_collection_base<Item>::begin() const
{
  if (empty())
  {
    return end();
  }
  // else
  const boost::shared_ptr<const Item_list> snapshot = boost::make_shared<Item_list>(m_index->m_by_position);
  return Const_iterator(snapshot);
}

template<typename Item>
typename Column_collection_base<Item>::Const_iterator Column_collection_base<Item>::end() const
{
  return Const_iterator();
}

template<typename Item>
void Column_collection_base<Item>::swap_state(Column_collection_base& other)
{
  using std::swap;

  log::Log_context::swap(other);
  swap(m_entries, other.m_entries);
  swap(m_index, other.m_index);
  swap(m_active, other.m_active);
}

template<typename Item>
void Column_collection_base<Item>::append_entry(const std::string& key, const Item_ptr& item)
{
  m_entries->m_entries.emplace_back(key, item);
  // Both no-ops if key already indexed: first one wins.
  m_index->m_by_key.emplace(key, item);
  m_index->m_first_position_by_key.emplace(key, m_index->m_by_position.size());
  m_index->m_by_position.push_back(item);
  m_active->m_items.insert(item);
}

template<typename Item>
void Column_collection_base<Item>::reindex()
{
  auto& by_key = m_index->m_by_key;
  auto& by_position = m_index->m_by_position;
  auto& first_position_by_key = m_index->m_first_position_by_key;
  auto& active = m_active->m_items;

  by_key.clear();
  by_position.clear();
  first_position_by_key.clear();
  active.clear();

  by_position.reserve(m_entries->m_entries.size());
  for (const auto& entry : m_entries->m_entries)
  {
    by_key.emplace(entry.first, entry.second);
    first_position_by_key.emplace(entry.first, by_position.size());
    by_position.push_back(entry.second);
    active.insert(entry.second);
  }
}

template<typename Item>
typename Column_collection_base<Item>::Entry_list& Column_collection_base<Item>::mutable_entries()
{
  return m_entries->m_entries;
}

template<typename Item>
Key_index<Item>& Column_collection_base<Item>::mutable_key_index()
{
  return *m_index;
}

template<typename Item>
Active_set<Item>& Column_collection_base<Item>::mutable_active_set()
{
  return *m_active;
}

template<typename Item>
template<typename Archive>
void Column_collection_base<Item>::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & m_entries;
  ar & m_index;
  ar & m_active;
}

template<typename Item>
Column_collection_base<Item>::Const_iterator::Const_iterator() :
  m_idx(0)
{
  // Nothing else.
}

template<typename Item>
Column_collection_base<Item>::Const_iterator::Const_iterator(boost::shared_ptr<const Item_list> snapshot) :
  m_snapshot(std::move(snapshot)),
  m_idx(0)
{
  // Nothing else.
}

template<typename Item>
const typename Column_collection_base<Item>::Item_ptr& Column_collection_base<Item>::Const_iterator::dereference() const
{
  return (*m_snapshot)[m_idx];
}

template<typename Item>
void Column_collection_base<Item>::Const_iterator::increment()
{
  ++m_idx;
}

template<typename Item>
bool Column_collection_base<Item>::Const_iterator::at_end() const
{
  return (!m_snapshot) || (m_idx == m_snapshot->size());
}

template<typename Item>
bool Column_collection_base<Item>::Const_iterator::equal(const Const_iterator& other) const
{
  const bool this_at_end = at_end();
  if (this_at_end || other.at_end())
  {
    return this_at_end == other.at_end();
  }
  // else
  return (m_snapshot == other.m_snapshot) && (m_idx == other.m_idx);
}

template<typename Item>
bool operator==(const Column_collection_base<Item>& lhs, const Column_collection_base<Item>& rhs)
{
  return lhs.compare(rhs);
}

template<typename Item>
bool operator!=(const Column_collection_base<Item>& lhs, const Column_collection_base<Item>& rhs)
{
  return !(lhs == rhs);
}

template<typename Item>
std::ostream& operator<<(std::ostream& os, const Column_collection_base<Item>& val)
{
  os << val.type_name() << '[';
  bool first = true;
  for (const auto& entry : val.entry_sequence().m_entries)
  {
    if (!first)
    {
      os << ", ";
    }
    first = false;
    os << entry.first;
  }
  return os << ']';
}

} // namespace keyseq::collection
