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


#include "keyseq/log/log.hpp"
#include "keyseq/log/buffer_logger.hpp"
#include "keyseq/log/config.hpp"
#include "keyseq/log/simple_ostream_logger.hpp"
#include "keyseq/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace keyseq::log::test
{

namespace
{
using std::string;
using keyseq::test::check_output;

/// Some `enum` other than Keyseq_log_component.
enum class Other_component : Component::enum_raw_t { S_X };

void expect_same_component(const Component& c1, const Component& c2)
{
  ASSERT_EQ(c1.empty(), c2.empty());
  if (!c1.empty())
  {
    EXPECT_EQ(c1.payload_type(), c2.payload_type());
    EXPECT_EQ(c1.payload_enum_raw_value(), c2.payload_enum_raw_value());
  }
}
} // Anonymous namespace

TEST(Log_component, Interface)
{
  const Component none;
  EXPECT_TRUE(none.empty());
  EXPECT_FALSE(none.holds<Keyseq_log_component>());

  const Component coll{Keyseq_log_component::S_COLLECTION};
  EXPECT_FALSE(coll.empty());
  EXPECT_TRUE(coll.holds<Keyseq_log_component>());
  EXPECT_FALSE(coll.holds<Other_component>());
  EXPECT_EQ(coll.payload<Keyseq_log_component>(), Keyseq_log_component::S_COLLECTION);

  // Same number, different enum.
  const Component other{Other_component::S_X};
  const Component log_comp{Keyseq_log_component::S_LOG};
  EXPECT_EQ(other.payload_enum_raw_value(), log_comp.payload_enum_raw_value());
  EXPECT_NE(other.payload_type(), log_comp.payload_type());
} // TEST(Log_component, Interface)

TEST(Log_context, Interface)
{
  using std::swap;

  Config cfg;
  Buffer_logger logger1{&cfg};
  Buffer_logger logger2{&cfg};
  const Component comp1{Keyseq_log_component::S_ERROR};
  const Component comp2{Keyseq_log_component::S_COLLECTION};

  Log_context ctx1;
  expect_same_component(ctx1.get_log_component(), Component());
  EXPECT_EQ(ctx1.get_logger(), nullptr);
  ctx1 = Log_context{&logger1, Keyseq_log_component::S_ERROR};
  expect_same_component(ctx1.get_log_component(), comp1);
  EXPECT_EQ(ctx1.get_logger(), &logger1);

  Log_context ctx2{&logger2, Keyseq_log_component::S_COLLECTION};
  swap(ctx1, ctx2);
  expect_same_component(ctx1.get_log_component(), comp2);
  EXPECT_EQ(ctx1.get_logger(), &logger2);
  expect_same_component(ctx2.get_log_component(), comp1);
  EXPECT_EQ(ctx2.get_logger(), &logger1);

  ctx1 = ctx2;
  expect_same_component(ctx1.get_log_component(), comp1);
  EXPECT_EQ(ctx1.get_logger(), &logger1);
  EXPECT_EQ(ctx2.get_logger(), &logger1);

  // Moved-from is as if default-constructed.
  Log_context ctx3{std::move(ctx1)};
  EXPECT_EQ(ctx3.get_logger(), &logger1);
  EXPECT_EQ(ctx1.get_logger(), nullptr);
  EXPECT_TRUE(ctx1.get_log_component().empty());

  ctx1 = std::move(ctx3);
  EXPECT_EQ(ctx1.get_logger(), &logger1);
  expect_same_component(ctx1.get_log_component(), comp1);
  EXPECT_EQ(ctx3.get_logger(), nullptr);
  EXPECT_TRUE(ctx3.get_log_component().empty());
} // TEST(Log_context, Interface)

TEST(Log_config, Verbosity)
{
  Config cfg{Sev::S_INFO};

  const Component coll{Keyseq_log_component::S_COLLECTION};
  const Component err{Keyseq_log_component::S_ERROR};
  const Component other{Other_component::S_X};

  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_INFO, coll));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DEBUG, coll));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DEBUG, Component{}));

  cfg.configure_component_verbosity(Sev::S_TRACE, Keyseq_log_component::S_COLLECTION);
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_TRACE, coll));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DATA, coll));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_TRACE, err));

  // Quieter than the default works too.
  cfg.configure_component_verbosity(Sev::S_WARNING, Keyseq_log_component::S_ERROR);
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_INFO, err));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_WARNING, err));

  // Not a keyseq component: default applies.
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_INFO, other));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DEBUG, other));

  cfg.configure_default_verbosity(Sev::S_DEBUG, false);
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_INFO, err));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_DEBUG, Component{Keyseq_log_component::S_LOG}));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_TRACE, coll));

  cfg.configure_default_verbosity(Sev::S_NONE, true);
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_WARNING, err));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_FATAL, coll));
} // TEST(Log_config, Verbosity)

TEST(Log_buffer_logger, Format)
{
  Config cfg{Sev::S_INFO};
  cfg.m_use_human_friendly_time_stamps = false;
  Buffer_logger logger{&cfg};

  {
    KEYSEQ_LOG_SET_CONTEXT(&logger, Keyseq_log_component::S_COLLECTION);
    KEYSEQ_LOG_WARNING("Value is [" << 42 << "], " << "key [" << string("k") << "].");
    KEYSEQ_LOG_DEBUG("Filtered out.");
  }

  const string out = logger.buffer_str_copy();
  EXPECT_TRUE(check_output(out, { "^[0-9]+\\.[0-9]{6} \\[warn\\]: T",
                                  ": KEYSEQ-COLLECTION: log_test\\.cpp:",
                                  "\\): Value is \\[42\\], key \\[k\\]\\.\n$" })) << out;
  EXPECT_EQ(out.find("Filtered"), string::npos);

  // Nickname replaces the thread ID; then goes back.
  Logger::this_thread_set_logged_nickname("tester", &logger);
  {
    KEYSEQ_LOG_SET_CONTEXT(&logger, Keyseq_log_component::S_ERROR);
    KEYSEQ_LOG_INFO("Nicknamed.");
  }
  Logger::this_thread_set_logged_nickname();
  EXPECT_TRUE(check_output(logger.buffer_str_copy(),
                           { "\\[info\\]: Ttester: KEYSEQ-LOG: [^\n]*now logs as \\[tester\\]\\.",
                             "\\[info\\]: Ttester: KEYSEQ-ERROR: [^\n]*Nicknamed\\." }));

  // Not a keyseq component: no component name; the rest is there.
  {
    KEYSEQ_LOG_SET_CONTEXT(&logger, Other_component::S_X);
    KEYSEQ_LOG_ERROR("No component name.");
  }
  EXPECT_TRUE(check_output(logger.buffer_str_copy(),
                           { "\\[eror\\]: T[^:]+: log_test\\.cpp:[^\n]*No component name\\." }));

  {
    KEYSEQ_LOG_SET_CONTEXT(static_cast<Logger*>(0), Keyseq_log_component::S_LOG);
    KEYSEQ_LOG_FATAL("Goes nowhere.");
    KEYSEQ_LOG_WITHOUT_CHECKING(Sev::S_FATAL, "Goes nowhere either.");
  }
  EXPECT_EQ(logger.buffer_str_copy().find("Goes nowhere"), string::npos);

  // Unfiltered; so even DATA gets through.
  {
    KEYSEQ_LOG_SET_CONTEXT(&logger, Keyseq_log_component::S_LOG);
    KEYSEQ_LOG_WITHOUT_CHECKING(Sev::S_DATA, "Forced.");
  }
  EXPECT_TRUE(check_output(logger.buffer_str_copy(), { "\\[data\\]: [^\n]*Forced\\." }));
} // TEST(Log_buffer_logger, Format)

TEST(Log_buffer_logger, Human_friendly_time_stamp)
{
  Config cfg{Sev::S_INFO};
  Buffer_logger logger{&cfg};

  KEYSEQ_LOG_SET_CONTEXT(&logger, Keyseq_log_component::S_LOG);
  KEYSEQ_LOG_INFO("Dated.");

  const auto out = logger.buffer_str_copy();
  EXPECT_TRUE(check_output(out, { "^[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}\\.[0-9]{6} "
                                  "[+-][0-9]{4} \\[info\\]: " })) << out;
} // TEST(Log_buffer_logger, Human_friendly_time_stamp)

TEST(Log_simple_ostream_logger, Streams)
{
  Config cfg{Sev::S_INFO};
  std::ostringstream os_out;
  std::ostringstream os_err;
  Simple_ostream_logger logger{&cfg, os_out, os_err};

  KEYSEQ_LOG_SET_CONTEXT(&logger, Keyseq_log_component::S_LOG);
  KEYSEQ_LOG_INFO("To out.");
  KEYSEQ_LOG_WARNING("To err.");

  EXPECT_NE(os_out.str().find("To out."), string::npos);
  EXPECT_EQ(os_out.str().find("To err."), string::npos);
  EXPECT_NE(os_err.str().find("To err."), string::npos);
  EXPECT_EQ(os_err.str().find("To out."), string::npos);

  // One stream for both.
  std::ostringstream os_both;
  Simple_ostream_logger logger2{&cfg, os_both, os_both};
  {
    KEYSEQ_LOG_SET_CONTEXT(&logger2, Keyseq_log_component::S_LOG);
    KEYSEQ_LOG_INFO("First.");
    KEYSEQ_LOG_ERROR("Second.");
  }
  EXPECT_TRUE(check_output(os_both.str(), { "First\\.\n.*Second\\.\n$" })) << os_both.str();
} // TEST(Log_simple_ostream_logger, Streams)

TEST(Log_simple_ostream_logger, Console)
{
  Config cfg{Sev::S_INFO};
  Simple_ostream_logger logger{&cfg};

  KEYSEQ_LOG_SET_CONTEXT(&logger, Keyseq_log_component::S_LOG);
  const auto suite = keyseq::test::get_test_suite_name();
  EXPECT_EQ(suite, "Log_simple_ostream_logger");

  const auto out = keyseq::test::collect_output([&]() { KEYSEQ_LOG_INFO("Suite [" << suite << "]."); },
                                                std::cout, false);
  EXPECT_NE(out.find("Suite [Log_simple_ostream_logger]."), string::npos) << out;
  EXPECT_NE(out.find("KEYSEQ-LOG"), string::npos) << out;

  EXPECT_TRUE(keyseq::test::check_output([&]() { KEYSEQ_LOG_WARNING("Trouble."); },
                                         std::cerr, "\\[warn\\]: T.*: KEYSEQ-LOG: .*Trouble\\.", false));
  EXPECT_FALSE(keyseq::test::check_output([&]() { KEYSEQ_LOG_DEBUG("Too verbose."); },
                                          std::cout, "Too verbose", false));
} // TEST(Log_simple_ostream_logger, Console)

TEST(Log_sev, Stream)
{
  std::ostringstream os;
  os << Sev::S_WARNING << ' ' << Sev::S_DATA << ' ' << Sev::S_END_SENTINEL;
  EXPECT_EQ(os.str(), "WARNING DATA ?");

  const auto parse = [](const string& str) -> Sev
  {
    std::istringstream is(str);
    Sev sev = Sev::S_FATAL;
    is >> sev;
    return sev;
  };

  EXPECT_EQ(parse("debug"), Sev::S_DEBUG);
  EXPECT_EQ(parse("WARNING"), Sev::S_WARNING);
  EXPECT_EQ(parse("Trace"), Sev::S_TRACE);
  EXPECT_EQ(parse("4"), Sev::S_INFO);
  EXPECT_EQ(parse("8"), Sev::S_NONE); // S_END_SENTINEL is not a severity.
  EXPECT_EQ(parse("warn"), Sev::S_NONE);
  EXPECT_EQ(parse(""), Sev::S_NONE);

  EXPECT_EQ(util::ostream_op_string(Keyseq_log_component::S_COLLECTION), "COLLECTION");
} // TEST(Log_sev, Stream)

} // namespace keyseq::log::test
