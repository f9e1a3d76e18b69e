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


#include "keyseq/test/test_common_util.hpp"
#include "keyseq/util/util.hpp"
#include <gtest/gtest.h>
#include <regex>

namespace keyseq::test
{

std::string get_test_suite_name()
{
  return ::testing::UnitTest::GetInstance()->current_test_info()->test_suite_name();
}

bool check_output(const std::string& output, const std::vector<std::string>& regex_matches)
{
  for (const auto& regex_match : regex_matches)
  {
    if (!std::regex_search(output, std::regex(regex_match)))
    {
      return false;
    }
  }
  return true;
}

bool check_output(const std::function<void()>& func, std::ostream& os, const std::string& regex_match, bool echo)
{
  return check_output(collect_output(func, os, echo), { regex_match });
}

std::string collect_output(const std::function<void()>& func, std::ostream& os, bool echo)
{
  std::string captured;
  {
    util::String_appender capture_os(&captured);
    std::streambuf* const orig_buf = os.rdbuf(capture_os.rdbuf());
    func();
    os.flush();
    os.rdbuf(orig_buf);
  } // capture_os flushes into `captured` here.

  if (echo)
  {
    os << captured << std::flush;
  }
  return captured;
}

} // namespace keyseq::test
