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

#include "keyseq/util/util_fwd.hpp"
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/stream.hpp>

namespace keyseq::util
{

// Types.

/// Base for interfaces: a `virtual` destructor and nothing else.
class Null_interface
{
public:
  /// Boring `virtual` destructor.
  virtual ~Null_interface() = 0;
};

/**
 * `ostream` that appends what is written to it onto a given `std::string`, without an intermediate buffer copy
 * as with `ostringstream::str()`.  The string must outlive `*this`.  Written characters may sit in the stream
 * buffer until `flush`.
 */
class String_appender :
  public boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>>
{
public:
  /**
   * Constructs the stream.
   *
   * @param target_str
   *        String to append to; not null.
   */
  explicit String_appender(std::string* target_str);
}; // class String_appender

// Template/constexpr implementations.

template<typename ...T>
void feed_args_to_ostream([[maybe_unused]] std::ostream* os, T const &... ostream_args)
{
  // Fold over `,`; for an empty pack, a no-op.
  ((*os << ostream_args), ...);
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  String_appender os(target_str);
  feed_args_to_ostream(&os, ostream_args...);
  os.flush();
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  std::string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

constexpr String_view file_basename(String_view path)
{
  const auto sep_pos = path.rfind('/');
  return (sep_pos == String_view::npos) ? path : path.substr(sep_pos + 1);
}

} // namespace keyseq::util
