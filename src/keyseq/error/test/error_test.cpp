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


#include "keyseq/error/error.hpp"
#include "keyseq/collection/error/error.hpp"
#include "keyseq/log/buffer_logger.hpp"
#include "keyseq/log/config.hpp"
#include <gtest/gtest.h>

namespace keyseq::error::test
{

namespace
{
using std::string;
using Collection_code = keyseq::collection::error::Code;

/* Follows the keyseq error-reporting convention: trailing Error_code* arg; null => throw.
 * It logs, since the emitting macro logs. */
class Halver :
  public log::Log_context
{
public:
  explicit Halver(log::Logger* logger_ptr) :
    log::Log_context(logger_ptr, Keyseq_log_component::S_ERROR)
  {
  }

  int halve(int val, Error_code* err_code = 0) const
  {
    KEYSEQ_ERROR_EXEC_AND_THROW_ON_ERROR(int, halve, val, _1);
    // If got here, err_code is non-null.

    if ((val % 2) != 0)
    {
      KEYSEQ_ERROR_EMIT_ERROR(Collection_code::S_POSITION_OUT_OF_RANGE);
      return -1;
    }
    // else
    err_code->clear();
    return val / 2;
  }
}; // class Halver

} // Anonymous namespace

TEST(Runtime_error, Interface)
{
  const Error_code code = Collection_code::S_KEY_NOT_FOUND;

  const Runtime_error exc1{code, "some_func(12)"};
  EXPECT_EQ(exc1.code(), code);
  EXPECT_EQ(string(exc1.what()), "some_func(12): " + code.message() + " [keyseq_collection:4]");

  // No code: what() is precisely the context.
  const Runtime_error exc2{"just context"};
  EXPECT_FALSE(exc2.code());
  EXPECT_EQ(string(exc2.what()), "just context");

  const Runtime_error exc3{Error_code(), "also just context"};
  EXPECT_EQ(string(exc3.what()), "also just context");
} // TEST(Runtime_error, Interface)

TEST(Error_exec_and_throw_on_error, Interface)
{
  log::Config cfg;
  log::Buffer_logger logger{&cfg};
  const Halver halver{&logger};

  // Null err_code: result returned; or exception thrown.
  EXPECT_EQ(halver.halve(10), 5);
  try
  {
    halver.halve(3);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Collection_code::S_POSITION_OUT_OF_RANGE);
    EXPECT_NE(string(exc.what()).find("halve"), string::npos); // Context names the function.
  }

  // Non-null err_code: set; nothing thrown.
  Error_code err_code = Collection_code::S_NULL_ITEM; // Must be overwritten on success.
  EXPECT_EQ(halver.halve(8, &err_code), 4);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(halver.halve(7, &err_code), -1);
  EXPECT_EQ(err_code, Collection_code::S_POSITION_OUT_OF_RANGE);

  // Each emitted error was logged as a warning.
  EXPECT_NE(logger.buffer_str_copy().find("Error code emitted"), string::npos);
} // TEST(Error_exec_and_throw_on_error, Interface)

TEST(Error_collection_category, Interface)
{
  const Error_code code = Collection_code::S_COLLECTION_IMMUTABLE;
  EXPECT_TRUE(code);
  EXPECT_EQ(string(code.category().name()), "keyseq_collection");
  EXPECT_EQ(code.message(), "Collection is immutable; mutating operations are not supported.");
  EXPECT_EQ(code.value(), 8);
  EXPECT_NE(Error_code(Collection_code::S_KEY_MISMATCH), Error_code(Collection_code::S_NULL_ITEM));
} // TEST(Error_collection_category, Interface)

} // namespace keyseq::error::test
