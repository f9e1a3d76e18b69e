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

namespace keyseq::collection
{

// Types.

/**
 * Lenient ordered collection of items: add() and extend() only append, never deduplicate.  The same key may appear
 * in several entries, and so may the same item; the key lookups (at() by key, get(), contains()) yield the item of
 * the *first* entry with the key, while size(), at() by position, keys(), items(), and iteration include every entry.
 * An explicit key given to add() or in the constructor's entries may differ from the item's own key.
 *
 * as_immutable() returns an Immutable_column_collection sharing this collection's structures.  Copying a
 * Column_collection, on the other hand, copies the structures: the copy and its views are independent of the
 * original and its views.
 *
 * @tparam Item
 *         See namespace keyseq::collection doc header.
 */
template<typename Item>
class Column_collection :
  public Column_collection_base<Item>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Column_collection_base<Item>;

  /// Short-hand for item handle.
  using Item_ptr = typename Base::Item_ptr;

  /// Short-hand for ordered entries.
  using Entry_list = typename Base::Entry_list;

  /// Short-hand for ordered items.
  using Item_list = typename Base::Item_list;

  // Constructors/destructor.

  /**
   * Constructs collection holding the given entries, in order, as if by add() of each (key, item).  If any item is
   * null, the collection is left empty.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param entries
   *        Initial (key, item) pairs.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_NULL_ITEM.
   */
  explicit Column_collection(log::Logger* logger_ptr = 0, const Entry_list& entries = Entry_list(),
                             Error_code* err_code = 0);

  /**
   * Copy constructor: the result has its own structures, with the same entries as `src`'s.
   *
   * @param src
   *        Source object.
   */
  Column_collection(const Column_collection& src);

  // Methods.

  /**
   * Copy assignment: `*this` gets its own copy of `src`'s structures.  Views of `*this` made before the assignment
   * continue to view the structures `*this` had before it.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Column_collection& operator=(const Column_collection& src);

  /**
   * Swaps the structures (and Logger) of `*this` and `other`.  Views follow the structures.
   *
   * @param other
   *        Object.
   */
  void swap(Column_collection& other);

  /**
   * Appends an entry for the item under its own key.
   *
   * @param item
   *        Item.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_NULL_ITEM.
   * @return `true` on success; `false` on error.
   */
  bool add(const Item_ptr& item, Error_code* err_code = 0);

  /**
   * Appends an entry for the item under the given key, which need not equal the item's own key.  The key is indexed
   * to `item` only if no earlier entry has the same key.
   *
   * @param item
   *        Item.
   * @param key
   *        Key.
   * @param err_code
   *        See other add().
   * @return See other add().
   */
  bool add(const Item_ptr& item, const std::string& key, Error_code* err_code = 0);

  /**
   * Appends an entry for each item under its own key, in order.  If any item is null, nothing is appended.
   *
   * @param items
   *        Items.
   * @param err_code
   *        See add().
   * @return `true` on success; `false` on error.
   */
  bool extend(const Item_list& items, Error_code* err_code = 0);

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

  /// Friend of Column_collection: For access to serialize().
  friend class boost::serialization::access;

  // Methods.

  /**
   * Checks that no item is null.
   *
   * @param entries
   *        Entries to check.
   * @param err_code
   *        Non-null; set to success or error::Code::S_NULL_ITEM.
   * @return `!*err_code`.
   */
  bool check_items(const Entry_list& entries, Error_code* err_code) const;

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
}; // class Column_collection

// Template implementations.

template<typename Item>
Column_collection<Item>::Column_collection(log::Logger* logger_ptr, const Entry_list& entries, Error_code* err_code) :
  Base(logger_ptr)
{
  using keyseq::error::Runtime_error;

  Error_code our_err_code; // Prepare this if they passed in no Error_code, so we can throw exception.
  err_code || (err_code = &our_err_code);

  if (check_items(entries, err_code))
  {
    for (const auto& entry : entries)
    {
      this->append_entry(entry.first, entry.second);
    }
    KEYSEQ_LOG_DEBUG("Created [" << *this << "] [" << this << "] with [" << this->size() << "] entries.");
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
} // Column_collection::Column_collection()

template<typename Item>
Column_collection<Item>::Column_collection(const Column_collection& src) :
  Base(src)
{
  KEYSEQ_LOG_DEBUG("Copied [" << src << "] [" << &src << "] into [" << this << "].");
}

template<typename Item>
Column_collection<Item>& Column_collection<Item>::operator=(const Column_collection& src)
{
  if (this != &src)
  {
    Column_collection(src).swap(*this);
  }
  return *this;
}

template<typename Item>
void Column_collection<Item>::swap(Column_collection& other)
{
  this->swap_state(other);
}

template<typename Item>
bool Column_collection<Item>::add(const Item_ptr& item, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, item, _1);
  // If got here, err_code is non-null.

  if (!item)
  {
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_NULL_ITEM);
    return false;
  }
  // else
  return add(item, item->key(), err_code);
}

template<typename Item>
bool Column_collection<Item>::add(const Item_ptr& item, const std::string& key, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, item, key, _1);
  // If got here, err_code is non-null.

  if (!item)
  {
    KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_NULL_ITEM);
    return false;
  }
  // else

  this->append_entry(key, item);
  KEYSEQ_LOG_TRACE("Collection [" << this << "]: appended item [" << item->name() << "] [" << item.get() << "] "
                   "under key [" << key << "] at position [" << (this->size() - 1) << "].");

  err_code->clear();
  return true;
} // Column_collection::add()

template<typename Item>
bool Column_collection<Item>::extend(const Item_list& items, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, extend, items, _1);
  // If got here, err_code is non-null.

  for (const auto& item : items)
  {
    if (!item)
    {
      KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_NULL_ITEM);
      return false;
    }
  }

  for (const auto& item : items)
  {
    this->append_entry(item->key(), item);
  }
  KEYSEQ_LOG_TRACE("Collection [" << this << "]: appended [" << items.size() << "] items; "
                   "size now [" << this->size() << "].");

  err_code->clear();
  return true;
} // Column_collection::extend()

template<typename Item>
Immutable_column_collection<Item> Column_collection<Item>::as_immutable() const
{
  return Immutable_column_collection<Item>(get_logger(), *this);
}

template<typename Item>
util::String_view Column_collection<Item>::type_name() const // Virtual.
{
  return "Column_collection";
}

template<typename Item>
bool Column_collection<Item>::check_items(const Entry_list& entries, Error_code* err_code) const
{
  for (const auto& entry : entries)
  {
    if (!entry.second)
    {
      KEYSEQ_LOG_TRACE("Entry under key [" << entry.first << "] has a null item.");
      KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_NULL_ITEM);
      return false;
    }
  }

  err_code->clear();
  return true;
}

template<typename Item>
template<typename Archive>
void Column_collection<Item>::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & boost::serialization::base_object<Base>(*this);
}

template<typename Item>
void swap(Column_collection<Item>& val1, Column_collection<Item>& val2)
{
  val1.swap(val2);
}

} // namespace keyseq::collection
