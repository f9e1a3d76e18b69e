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

#include <string>
#include <string_view>

namespace keyseq::util
{

// Types.

/**
 * Short-hand for the standard non-owning string view.  Used throughout keyseq wherever a function merely reads
 * a string supplied by the caller (log call-site metadata, error contexts, collection keys passed in for lookup).
 *
 * A `String_view` never outlives the memory it points to by any act of keyseq: anything retained beyond the call
 * (e.g., a key stored in a collection) is copied into an `std::string` first.
 */
using String_view = std::string_view;

} // namespace keyseq::util
