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
#include "keyseq/util/util.hpp"

namespace keyseq::util
{

Null_interface::~Null_interface() = default;

String_appender::String_appender(std::string* target_str) :
  boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>>
    (boost::iostreams::back_inserter(*target_str))
{
  // Nothing else.
}

std::string where_am_i_str(String_view file, String_view function, unsigned int line)
{
  return ostream_op_string(file, ':', function, '(', line, ')');
}

} // namespace keyseq::util
