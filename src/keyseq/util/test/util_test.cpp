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


#include "keyseq/util/util.hpp"
#include <gtest/gtest.h>
#include <iomanip>

namespace keyseq::util::test
{

namespace
{
using std::string;
} // Anonymous namespace

TEST(Util_ostream_op, Interface)
{
  EXPECT_EQ(ostream_op_string("abc", 1, '-', 2.5), "abc1-2.5");
  EXPECT_EQ(ostream_op_string(), "");

  string target = "prefix:";
  ostream_op_to_string(&target, std::setw(3), 7, ':', "x");
  EXPECT_EQ(target, "prefix:  7:x"); // Appends.
  ostream_op_to_string(&target);
  EXPECT_EQ(target, "prefix:  7:x");

  std::ostringstream os;
  feed_args_to_ostream(&os);
  feed_args_to_ostream(&os, 'a', String_view("bc"), 4u);
  EXPECT_EQ(os.str(), "abc4");
} // TEST(Util_ostream_op, Interface)

TEST(Util_where_am_i, Interface)
{
  static_assert(file_basename("/a/b/c.cpp") == String_view("c.cpp"), "Compile-time path parsing broken.");
  EXPECT_EQ(file_basename("c.cpp"), String_view("c.cpp"));
  EXPECT_EQ(file_basename("/a/b/"), String_view(""));
  EXPECT_EQ(file_basename(""), String_view(""));

  EXPECT_EQ(where_am_i_str("file.cpp", "func", 42), "file.cpp:func(42)");

  const string here = KEYSEQ_UTIL_WHERE_AM_I_STR();
  EXPECT_EQ(here.find("util_test.cpp:"), size_t(0)) << here;
  EXPECT_EQ(here.find('/'), string::npos) << here;

  const string literal = KEYSEQ_UTIL_WHERE_AM_I_LITERAL(func);
  EXPECT_EQ(literal.find(__FILE__), size_t(0)) << literal;
  EXPECT_NE(literal.find(":func("), string::npos) << literal;
} // TEST(Util_where_am_i, Interface)

TEST(Util_string_appender, Interface)
{
  string target = "pre-";
  {
    String_appender os(&target);
    os << "post" << 1;
    os.flush();
    EXPECT_EQ(target, "pre-post1");
    os << '!';
  }
  EXPECT_EQ(target, "pre-post1!"); // Flushed at destruction.
} // TEST(Util_string_appender, Interface)

} // namespace keyseq::util::test
