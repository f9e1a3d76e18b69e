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

#include "keyseq/collection/column_collection_base.hpp"
#include <boost/serialization/base_object.hpp>

namespace keyseq::collection
{

// Types.

/**
 * Read-only view of a collection: shares, and does not copy, the Entry_sequence, Key_index, and Active_set of the
 * collection it was made from (via `as_immutable()` on that collection, or via the explicit constructor).  Every
 * read operation of Column_collection_base works on those shared structures; so a later mutation of the source is
 * visible here at once.  Every mutating operation of the mutable collections exists here too and fails with
 * error::Code::S_COLLECTION_IMMUTABLE, without effect.
 *
 * Copying a view yields another view of the same structures.  The structures live as long as any collection or view
 * holding them.
 *
 * ### Serialization ###
 * A view serializes its three structure pointers like any collection.  If the source collection (or another view
 * of it) is saved into the same boost.serialization archive, then after loading both from that archive they share
 * one set of (loaded) structures again, and mutating the loaded source shows through the loaded view.  A view
 * saved alone loads as a view of structures no mutable collection holds.
 *
 * @tparam Item
 *         See namespace keyseq::collection doc header.
 */
template<typename Item>
class Immutable_column_collection :
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
   * Constructs a view of fresh empty structures.  Chiefly useful as a target for loading from an archive.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Immutable_column_collection(log::Logger* logger_ptr = 0);

  /**
   * Constructs a view of the structures of `source`, which may be a mutable collection or another view.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param source
   *        Collection to view.
   */
  explicit Immutable_column_collection(log::Logger* logger_ptr, const Base& source);

  /**
   * Constructs another view of the structures `src` views.
   *
   * @param src
   *        Source object.
   */
  Immutable_column_collection(const Immutable_column_collection& src);

  // Methods.

  /**
   * Makes `*this` a view of the structures `src` views.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Immutable_column_collection& operator=(const Immutable_column_collection& src);

  /**
   * Fails.
   *
   * @param item
   *        Ignored.
   * @param err_code
   *        See keyseq::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_COLLECTION_IMMUTABLE (always).
   * @return `false`.
   */
  bool add(const Item_ptr& item, Error_code* err_code = 0);

  /**
   * Fails.
   *
   * @param item
   *        Ignored.
   * @param key
   *        Ignored.
   * @param err_code
   *        See other add().
   * @return `false`.
   */
  bool add(const Item_ptr& item, const std::string& key, Error_code* err_code = 0);

  /**
   * Fails.
   *
   * @param items
   *        Ignored.
   * @param err_code
   *        See add().
   * @return `false`.
   */
  bool extend(const Item_list& items, Error_code* err_code = 0);

  /**
   * Fails.
   *
   * @param item
   *        Ignored.
   * @param err_code
   *        See add().
   * @return `false`.
   */
  bool replace(const Item_ptr& item, Error_code* err_code = 0);

  /**
   * Fails.
   *
   * @param item
   *        Ignored.
   * @param err_code
   *        See add().
   * @return `false`.
   */
  bool remove(const Item_ptr& item, Error_code* err_code = 0);

  /**
   * Fails.
   *
   * @param entries
   *        Ignored.
   * @param err_code
   *        See add().
   * @return `false`.
   */
  bool populate_separate_keys(const Entry_list& entries, Error_code* err_code = 0);

  /**
   * Returns another view of the same structures.
   * @return See above.
   */
  Immutable_column_collection as_immutable() const;

  /**
   * Implements Column_collection_base API.
   * @return See above.
   */
  util::String_view type_name() const override;

  using Base::get_logger;
  using Base::get_log_component;

private:
  // Friends.

  /// Friend of Immutable_column_collection: For access to serialize().
  friend class boost::serialization::access;

  // Methods.

  /**
   * Emits error::Code::S_COLLECTION_IMMUTABLE on behalf of a mutating operation.
   *
   * @param op_name
   *        Name of the refused operation, for logging.
   * @param err_code
   *        Non-null.
   * @return `false`.
   */
  bool refuse_mutation(util::String_view op_name, Error_code* err_code) const;

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
}; // class Immutable_column_collection

// Template implementations.

template<typename Item>
Immutable_column_collection<Item>::Immutable_column_collection(log::Logger* logger_ptr) :
  Base(logger_ptr)
{
  // Nothing else.
}

template<typename Item>
Immutable_column_collection<Item>::Immutable_column_collection(log::Logger* logger_ptr, const Base& source) :
  Base(logger_ptr, source)
{
  KEYSEQ_LOG_DEBUG("Made immutable view [" << this << "] of [" << source.type_name() << "] "
                   "[" << &source << "] with [" << this->size() << "] entries.");
}

template<typename Item>
Immutable_column_collection<Item>::Immutable_column_collection(const Immutable_column_collection& src) :
  Base(src.get_logger(), src)
{
  // Nothing else.
}

template<typename Item>
Immutable_column_collection<Item>& Immutable_column_collection<Item>::operator=(const Immutable_column_collection& src)
{
  if (this != &src)
  {
    Immutable_column_collection other(src);
    this->swap_state(other);
  }
  return *this;
}

template<typename Item>
bool Immutable_column_collection<Item>::add(const Item_ptr& item, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, item, _1);
  return refuse_mutation("add", err_code);
}

template<typename Item>
bool Immutable_column_collection<Item>::add(const Item_ptr& item, const std::string& key, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, item, key, _1);
  return refuse_mutation("add", err_code);
}

template<typename Item>
bool Immutable_column_collection<Item>::extend(const Item_list& items, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, extend, items, _1);
  return refuse_mutation("extend", err_code);
}

template<typename Item>
bool Immutable_column_collection<Item>::replace(const Item_ptr& item, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, replace, item, _1);
  return refuse_mutation("replace", err_code);
}

template<typename Item>
bool Immutable_column_collection<Item>::remove(const Item_ptr& item, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, remove, item, _1);
  return refuse_mutation("remove", err_code);
}

template<typename Item>
bool Immutable_column_collection<Item>::populate_separate_keys(const Entry_list& entries, Error_code* err_code)
{
  KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(bool, populate_separate_keys, entries, _1);
  return refuse_mutation("populate_separate_keys", err_code);
}

template<typename Item>
Immutable_column_collection<Item> Immutable_column_collection<Item>::as_immutable() const
{
  return Immutable_column_collection(get_logger(), *this);
}

template<typename Item>
util::String_view Immutable_column_collection<Item>::type_name() const // Virtual.
{
  return "Immutable_column_collection";
}

template<typename Item>
bool Immutable_column_collection<Item>::refuse_mutation(util::String_view op_name, Error_code* err_code) const
{
  KEYSEQ_LOG_TRACE("View [" << *this << "]: refusing [" << op_name << "()].");
  KEYSEQ_ERROR_EMIT_ERROR(error::Code::S_COLLECTION_IMMUTABLE);
  return false;
}

template<typename Item>
template<typename Archive>
void Immutable_column_collection<Item>::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & boost::serialization::base_object<Base>(*this);
}

} // namespace keyseq::collection
