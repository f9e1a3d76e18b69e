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
#include "keyseq/error/error.hpp"
#include "keyseq/util/util.hpp"

namespace keyseq::error
{

Runtime_error::Runtime_error(const Error_code& err_code_or_success, util::String_view context) :
  boost::system::system_error(err_code_or_success, std::string(context)),
  m_what(err_code_or_success
           ? util::ostream_op_string(context, ": ", err_code_or_success.message(), " [", err_code_or_success, ']')
           : std::string(context))
{
  // Nothing else.
}

Runtime_error::Runtime_error(util::String_view context) :
  Runtime_error(Error_code(), context)
{
  // Nothing else.
}

const char* Runtime_error::what() const noexcept // Virtual.
{
  return m_what.c_str();
}

} // namespace keyseq::error
