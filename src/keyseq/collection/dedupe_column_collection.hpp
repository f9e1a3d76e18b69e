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

#include "keyseq/collection/immutable_column_collection.hpp"
#include <boost/serialization/base_object.hpp>
#include <algorithm>
#include <cassert>

namespace keyseq::collection
{

// Types.

/**
 * Deduplicating ordered collection of items: at most one entry per key, always the item's own key.  Adding an item
 * whose key is already present puts it in the place of the item there (same position); adding the very item already
 * present does nothing.  Items leave via remove() and replace().
 *
 * ### replace() ###
 * replace() is for an item whose key, or whose name, collides with entries already present.  It takes out (1) the
 * entry under the item's key, and (2) the entry under the item's name, if that is a different entry; then puts the
 * item where the earlier of the two was, or at the end if neither existed.  Hence the collection may shrink by one.
 * Calling it twice with the same item is the same as calling it once.
 *
 * ### Error safety ###
 * Every operation, including the batch ones (constructor, extend(), populate_separate_keys()), checks all of its
 * arguments before changing anything; on error nothing has changed.
 *
 * Other than the above, see Column_collection, whose remarks on views, copying, and swapping apply equally.
 *
 * @tparam Item
 *         See namespace keyseq::collection doc header.
 */
template<typename Item>
class Dedupe_column_collection :
  public Column_collection_base<Item>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Column_collection_base<Item>;

  /// Short-hand for item handle.
  using Item_ptr = typename Base::Item_ptr;

  /// Short-hand for a (key, item) pair.
  using Entry = typename Base::Entry;

  /// Short-hand for ordered entries.
  using Entry_list = typename Base::Entry_list;

  /// Short-hand for ordered items.
  using Item_list = typename Base::Item_list;

  /// Short-hand for sizes and positions.
  using size_type = typename Base::size_type;

  // Constructors/destructor.

  /**
   * Constructs collection holding the given entries, as if by add() of each (key, item) in order; so a later entry
   * with the key of an earlier one takes the earlier one's position.  On error the collection is left empty.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param entries
   *        Initial (key, item) pairs.  Each key must equal the item's own key.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_NULL_ITEM, error::Code::S_KEY_MISMATCH, error::Code::S_UNNAMED_ITEM.
   */
  explicit Dedupe_column_collection(log::Logger* logger_ptr = 0, const Entry_list& entries = Entry_list(),
                                    Error_code* err_code = 0);

  /**
   * Copy constructor: the result has its own structures, with the same entries as `src`'s.
   *
   * @param src
   *        Source object.
   */
  Dedupe_column_collection(const Dedupe_column_collection& src);

  // Methods.

  /**
   * Copy assignment; see Column_collection::operator=().
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Dedupe_column_collection& operator=(const Dedupe_column_collection& src);

  /**
   * Swaps the structures (and Logger) of `*this` and `other`.
   *
   * @param other
   *        Object.
   */
  void swap(Dedupe_column_collection& other);

  /**
   * Adds the item under its own key: appended if the key is new; else in place of the item under that key; else, if
   * it is that item, nothing happens.
   *
   * @param item
   *        Item.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_NULL_ITEM, error::Code::S_UNNAMED_ITEM.
   * @return `true` if the collection changed; `false` if not (including on error).
   */
  bool add(const Item_ptr& item, Error_code* err_code = 0);

  /**
   * Same as the other add(), after checking that the given key is the item's own key.
   *
   * @param item
   *        Item.
   * @param key
   *        Must equal `item->key()`.
   * @param err_code
   *        See other add().  Additional error::Code generated: error::Code::S_KEY_MISMATCH.
   * @return See other add().
   */
  bool add(const Item_ptr& item, const std::string& key, Error_code* err_code = 0);

  /**
   * add() of each item, in order.  If two of them share a key, the later one ends up at the position the earlier
   * one took.
   *
   * @param items
   *        Items.
   * @param err_code
   *        See add().
   * @return `true` if the collection changed; `false` if not (including on error).
   */
  bool extend(const Item_list& items, Error_code* err_code = 0);

  /**
   * Puts the item in place of the entry under its key and of the entry under its name; see class doc header.
   *
   * @param item
   *        Item.
   * @param err_code
   *        See add().
   * @return `true` on success; `false` on error.
   */
  bool replace(const Item_ptr& item, Error_code* err_code = 0);

  /**
   * Takes out the entry holding the given item.  Later entries each move up one position.
   *
   * @param item
   *        Item.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_NULL_ITEM, error::Code::S_ITEM_NOT_FOUND.
   * @return `true` on success; `false` on error.
   */
  bool remove(const Item_ptr& item, Error_code* err_code = 0);

  /**
   * Bulk population from (key, item) pairs.  Each entry that collides with nothing present (neither the item's key
   * nor, for an item whose name differs from its key, the item's name is present) is appended, in order; after that
   * each remaining entry is applied by replace(), in order.
   *
   * @param entries
   *        (key, item) pairs.  Each key must equal the item's own key.
   * @param err_code
   *        See add(key).
   * @return `true` if anything was appended or any replace() changed the entries; `false` if not (including on
   *         error), as when every entry is already in place.
   */
  bool populate_separate_keys(const Entry_list& entries, Error_code* err_code = 0);

  /**
   * Returns a read-only view sharing this collection's structures.
   * @return See above.
   */
  Immutable_column_collection<Item> as_immutable() const;

  /**
   * Implements Column_collection_base API.
   * @return See above.
   */
  util::String_view type_name() const override;

  using Base::get_logger;
  using Base::get_log_component;

private:
  // Friends.

  /// Friend of Dedupe_column_collection: For access to serialize().
  friend class boost::serialization::access;

  // Methods.

  /**
   * Checks that the item can be held: non-null; non-empty key; and if `explicit_key` is not null, equal to it.
   *
   * @param item
   *        Item.
   * @param explicit_key
   *        Key supplied alongside the item, or null if none.
   * @param err_code
   *        Non-null; set to success or the error.
   * @return `!*err_code`.
   */
  bool check_item(const Item_ptr& item, const std::string* explicit_key, Error_code* err_code) const;

  /**
   * check_item() of each (key, item).
   *
   * @param entries
   *        Entries.
   * @param err_code
   *        Non-null; set to success or the error.
   * @return `!*err_code`.
   */
  bool check_entries(const Entry_list& entries, Error_code* err_code) const;

  /**
   * add() after check_item() has passed.
   *
   * @param item
   *        Item.
   * @return See add().
   */
  bool add_checked(const Item_ptr& item);

  /**
   * replace() after check_item() has passed.
   *
   * @param item
   *        Item.
   * @return `true` if the entries changed; `false` if the item was already alone in its place.
   */
  bool replace_checked(const Item_ptr& item);

  /**
   * boost.serialization hook: delegates to the base.
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
}; // class Dedupe_column_collection

// Template implementations.

template<typename Item>
Dedupe_column_collection<Item>::Dedupe_column_collection(log::Logger* logger_ptr, const Entry_list& entries,
                                                         Error_code* err_code) :
  Base(logger_ptr)
{
  using keyseq::error::Runtime_error;

  Error_code our_err_code; // Prepare this if they passed in no Error_code, so we can throw exception.
  err_code || (err_code = &our_err_code);

  if (check_entries(entries, err_code))
  {
    for (const auto& entry : entries)
    {
      add_checked(entry.second);
    }
    KEYSEQ_LOG_DEBUG("Created [" << *this << "] [" << this << "] with [" << this->size() << "] entries "
                     "from [" << entries.size() << "] given.");
  }
  else
  {
    KEYSEQ_LOG_WARNING("Cannot populate [" << type_name() << "] [" << this << "] due to above error; "
                       "it stays empty.");
  }

  if (our_err_code) // Throw exception if there is an error, and they passed in no Error_code.
  {
    throw Runtime_error{our_err_code, KEYSEQ_UTIL_WHERE_AM_I_STR()};
  }
} // Dedupe_column_collection::Dedupe_column_collection()

template<typename Item>
Dedupe_column_collection<Item>::Dedupe_column_collection(const Dedupe_column_collection& src) :
  Base(src)
{
  KEYSEQ_LOG_DEBUG("Copied [" << src << "] [" << &src << "] into [" << this << "].");
}

template<typename Item>
Dedupe_column_collection<Item>& Dedupe_column_collection<Item>::operator=(const Dedupe_column_collection& src)
{
  if (this != &src)
  {
    Dedupe_column_collection(src).swap(*this);
  }
  return *this;
}

template<typename Item>
void Dedupe_column_collection<Item>::swap(Dedupe_column_collection& other)
{
  this->swap_state(other);
}

template<typename Item>
bool Dedupe_column_collection<Item>::add(const Item_ptr& item, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, item, _1);
  // If got here, err_code is non-null.

  if (!check_item(item, 0, err_code))
  {
    return false;
  }
  // else
  return add_checked(item);
}

template<typename Item>
bool Dedupe_column_collection<Item>::add(const Item_ptr& item, const std::string& key, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, item, key, _1);
  // If got here, err_code is non-null.

  if (!check_item(item, &key, err_code))
  {
    return false;
  }
  // else
  return add_checked(item);
}

template<typename Item>
bool Dedupe_column_collection<Item>::extend(const Item_list& items, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, extend, items, _1);
  // If got here, err_code is non-null.

  for (const auto& item : items)
  {
    if (!check_item(item, 0, err_code))
    {
      return false;
    }
  }

  bool changed = false;
  for (const auto& item : items)
  {
    // Do not short-circuit: every add_checked() must run.
    changed = add_checked(item) || changed;
  }
  return changed;
} // Dedupe_column_collection::extend()

template<typename Item>
bool Dedupe_column_collection<Item>::replace(const Item_ptr& item, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, replace, item, _1);
  // If got here, err_code is non-null.

  if (!check_item(item, 0, err_code))
  {
    return false;
  }
  // else

  replace_checked(item);
  return true;
}

template<typename Item>
bool Dedupe_column_collection<Item>::remove(const Item_ptr& item, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, remove, item, _1);
  // If got here, err_code is non-null.

  if (!item)
  {
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_NULL_ITEM);
    return false;
  }
  // else
  if (!this->contains_column(item))
  {
    KEYSEQ_LOG_TRACE("Collection [" << *this << "]: item [" << item->name() << "] [" << item.get() << "] "
                     "is not a member.");
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_ITEM_NOT_FOUND);
    return false;
  }
  // else

  auto& entries = this->mutable_entries();
  const auto removed_it = std::find_if(entries.begin(), entries.end(),
                                       [&](const Entry& entry) -> bool { return entry.second == item; });
  assert(removed_it != entries.end());
  const size_type removed_pos = removed_it - entries.begin();
  entries.erase(removed_it);

  // Every later position shifts; so rebuild the derived structures (in place: views must keep seeing them).
  this->reindex();

  KEYSEQ_LOG_TRACE("Collection [" << this << "]: removed item [" << item->name() << "] [" << item.get() << "] "
                   "from position [" << removed_pos << "]; size now [" << this->size() << "].");

  err_code->clear();
  return true;
} // Dedupe_column_collection::remove()

template<typename Item>
bool Dedupe_column_collection<Item>::populate_separate_keys(const Entry_list& entries, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, populate_separate_keys, entries, _1);
  // If got here, err_code is non-null.

  if (!check_entries(entries, err_code))
  {
    return false;
  }
  // else

  /* Each entry is checked against what is present by then, including entries appended earlier in this loop;
   * the colliding ones wait until all the others are in. */
  bool changed = false;
  Item_list deferred;
  for (const auto& entry : entries)
  {
    const auto& item = entry.second;
    if ((this->contains(item->name()) && (item->key() != item->name())) || this->contains(item->key()))
    {
      deferred.push_back(item);
    }
    else
    {
      this->append_entry(entry.first, item);
      changed = true;
    }
  }

  for (const auto& item : deferred)
  {
    changed = replace_checked(item) || changed;
  }

  KEYSEQ_LOG_TRACE("Collection [" << this << "]: populated from [" << entries.size() << "] entries, of which "
                   "[" << deferred.size() << "] by replacement; size now [" << this->size() << "].");
  return changed;
} // Dedupe_column_collection::populate_separate_keys()

template<typename Item>
Immutable_column_collection<Item> Dedupe_column_collection<Item>::as_immutable() const
{
  return Immutable_column_collection<Item>(get_logger(), *this);
}

template<typename Item>
util::String_view Dedupe_column_collection<Item>::type_name() const // Virtual.
{
  return "Dedupe_column_collection";
}

template<typename Item>
bool Dedupe_column_collection<Item>::check_item(const Item_ptr& item, const std::string* explicit_key,
                                                Error_code* err_code) const
{
  if (!item)
  {
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_NULL_ITEM);
    return false;
  }
  // else
  if (explicit_key && (*explicit_key != item->key()))
  {
    KEYSEQ_LOG_TRACE("Item [" << item->name() << "] has key [" << item->key() << "] but was given under "
                     "key [" << *explicit_key << "].");
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_KEY_MISMATCH);
    return false;
  }
  // else
  if (item->key().empty())
  {
    KEYSEQ_LOG_TRACE("Item [" << item->name() << "] [" << item.get() << "] has empty key.");
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_UNNAMED_ITEM);
    return false;
  }
  // else

  err_code->clear();
  return true;
} // Dedupe_column_collection::check_item()

template<typename Item>
bool Dedupe_column_collection<Item>::check_entries(const Entry_list& entries, Error_code* err_code) const
{
  for (const auto& entry : entries)
  {
    if (!check_item(entry.second, &entry.first, err_code))
    {
      return false;
    }
  }

  err_code->clear();
  return true;
}

template<typename Item>
bool Dedupe_column_collection<Item>::add_checked(const Item_ptr& item)
{
  const auto& key = item->key();
  auto& index = this->mutable_key_index();

  const auto key_it = index.m_by_key.find(key);
  if (key_it == index.m_by_key.end())
  {
    this->append_entry(key, item);
    KEYSEQ_LOG_TRACE("Collection [" << this << "]: appended item [" << item->name() << "] [" << item.get() << "] "
                     "under key [" << key << "] at position [" << (this->size() - 1) << "].");
    return true;
  }
  // else

  const Item_ptr old_item = key_it->second;
  if (old_item == item)
  {
    KEYSEQ_LOG_TRACE("Collection [" << this << "]: item [" << item->name() << "] [" << item.get() << "] "
                     "already present; nothing to do.");
    return false;
  }
  // else

  // Put it in the old item's place.  At most one entry per key, so the indexed position is the one.
  const size_type pos = index.m_first_position_by_key.at(key);

  this->mutable_entries()[pos].second = item;
  index.m_by_position[pos] = item;
  key_it->second = item;

  auto& active = this->mutable_active_set().m_items;
  active.erase(old_item);
  active.insert(item);

  KEYSEQ_LOG_TRACE("Collection [" << this << "]: item [" << item->name() << "] [" << item.get() << "] "
                   "took the place of item [" << old_item.get() << "] under key [" << key << "] at "
                   "position [" << pos << "].");
  return true;
} // Dedupe_column_collection::add_checked()

template<typename Item>
bool Dedupe_column_collection<Item>::replace_checked(const Item_ptr& item)
{
  // The two probes: by key; and by name, which counts only if it finds a different entry.
  const Item_ptr key_match = this->get(item->key());
  Item_ptr name_match = this->get(item->name());
  if (name_match == key_match)
  {
    name_match.reset();
  }

  auto& entries = this->mutable_entries();
  Entry_list kept;
  kept.reserve(entries.size() + 1);

  bool matched = false;
  size_type insert_pos = 0;
  for (const auto& entry : entries)
  {
    // Entries never hold null; so a null match matches nothing.
    if ((entry.second == key_match) || (entry.second == name_match))
    {
      if (!matched)
      {
        matched = true;
        insert_pos = kept.size();
      }
      continue;
    }
    // else
    kept.push_back(entry);
  }
  if (!matched)
  {
    insert_pos = kept.size();
  }

  kept.insert(kept.begin() + insert_pos, Entry(item->key(), item));
  if (kept == entries)
  {
    KEYSEQ_LOG_TRACE("Collection [" << this << "]: item [" << item->name() << "] [" << item.get() << "] already "
                     "in place at position [" << insert_pos << "]; nothing to do.");
    return false;
  }
  // else

  entries.swap(kept);
  this->reindex();

  KEYSEQ_LOG_TRACE("Collection [" << this << "]: item [" << item->name() << "] [" << item.get() << "] placed at "
                   "position [" << insert_pos << "], replacing by key [" << key_match.get() << "] and by "
                   "name [" << name_match.get() << "]; size now [" << this->size() << "].");
  return true;
} // Dedupe_column_collection::replace_checked()

template<typename Item>
template<typename Archive>
void Dedupe_column_collection<Item>::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & boost::serialization::base_object<Base>(*this);
}

template<typename Item>
void swap(Dedupe_column_collection<Item>& val1, Dedupe_column_collection<Item>& val2)
{
  val1.swap(val2);
}

} // namespace keyseq::collection
