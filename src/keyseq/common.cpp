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
#include "keyseq/common.hpp"

namespace keyseq
{

std::ostream& operator<<(std::ostream& os, Keyseq_log_component val)
{
  switch (val)
  {
    case Keyseq_log_component::S_LOG: return os << "LOG";
    case Keyseq_log_component::S_ERROR: return os << "ERROR";
    case Keyseq_log_component::S_COLLECTION: return os << "COLLECTION";
    case Keyseq_log_component::S_END_SENTINEL: break;
  }
  return os << '?';
}

} // namespace keyseq
