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
#include <boost/serialization/access.hpp>
#include <boost/serialization/string.hpp>
#include <string>

namespace keyseq::collection
{

// Types.

/**
 * The stock item type held by the keyseq::collection templates: a named column of some table-like structure.
 * A Column has a *name* (how it is displayed) and a *key* (the identifier under which a collection indexes it).
 * The key equals the name unless set otherwise, at construction or later via set_key().
 *
 * Collections hold Column objects via #Column_ptr and treat two handles as the same item if and only if they point
 * to the same Column; two distinct Column objects with equal names and keys are different items.  Changing the key of
 * a Column already inside a collection does not re-index it; take it out (Dedupe_column_collection::remove()) first.
 *
 * ### Thread safety ###
 * Same as any plain value type.
 */
class Column
{
public:
  // Constructors/destructor.

  /**
   * Constructs a column whose key equals its name.
   *
   * @param name
   *        The name (and key).
   */
  explicit Column(util::String_view name);

  /**
   * Constructs a column with a key distinct from its name.
   *
   * @param name
   *        The name.
   * @param key
   *        The key.
   */
  explicit Column(util::String_view name, util::String_view key);

  // Methods.

  /**
   * The display name.
   * @return See above.
   */
  const std::string& name() const;

  /**
   * The key under which collections index this column by default.
   * @return See above.
   */
  const std::string& key() const;

  /**
   * Sets key().
   * @param key
   *        New key.
   */
  void set_key(util::String_view key);

private:
  // Friends.

  /// Friend of Column: For access to the default ctor and serialize().
  friend class boost::serialization::access;

  // Constructors.

  /// Constructs a column with empty name and key; boost.serialization uses this before loading.
  Column();

  // Methods.

  /**
   * boost.serialization hook: saves or loads name and key.
   *
   * @tparam Archive
   *         boost.serialization archive type.
   * @param ar
   *        Archive.
   * @param version
   *        Ignored.
   */
  template<typename Archive>
  void serialize(Archive& ar, const unsigned int version);

  // Data.

  /// See name().
  std::string m_name;
  /// See key().
  std::string m_key;
}; // class Column

// Template implementations.

template<typename Archive>
void Column::serialize(Archive& ar, [[maybe_unused]] const unsigned int version)
{
  ar & m_name;
  ar & m_key;
}

} // namespace keyseq::collection
