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
#include "keyseq/collection/column.hpp"

namespace keyseq::collection
{

// Implementations.

Column::Column() = default;

Column::Column(util::String_view name) :
  m_name(name),
  m_key(name)
{
  // Nothing else.
}

Column::Column(util::String_view name, util::String_view key) :
  m_name(name),
  m_key(key)
{
  // Nothing else.
}

const std::string& Column::name() const
{
  return m_name;
}

const std::string& Column::key() const
{
  return m_key;
}

void Column::set_key(util::String_view key)
{
  m_key = key;
}

std::ostream& operator<<(std::ostream& os, const Column& val)
{
  os << "Column[" << val.name();
  if (val.key() != val.name())
  {
    os << " key=" << val.key();
  }
  return os << ']';
}

} // namespace keyseq::collection
