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


#include "keyseq/collection/column_collection.hpp"
#include "keyseq/collection/dedupe_column_collection.hpp"
#include "keyseq/collection/test/collection_test_util.hpp"
#include "keyseq/log/buffer_logger.hpp"
#include "keyseq/log/config.hpp"
#include "keyseq/test/test_logger.hpp"
#include "keyseq/util/util.hpp"
#include <gtest/gtest.h>

namespace keyseq::collection::test
{

namespace
{
using std::string;
using std::vector;
using keyseq::test::Test_logger;
using Runtime_error = keyseq::error::Runtime_error;
using Code = error::Code;
using Items = vector<Column_ptr>;
using Keys = vector<string>;
} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", KEYSEQ_UTIL_WHERE_AM_I_STR(), "].")

/* The behaviors below are shared by both mutable variants; so each test runs its checks on a specimen of each
 * type.  Dedupe-specific behavior is in dedupe_column_collection_test.cpp. */

TEST(Column_collection_common, Keys)
{
  Test_logger logger;

  const auto test_type = [&](auto type_specimen)
  {
    using Collection = decltype(type_specimen);

    const auto c1 = column("c1");
    const auto c2 = column("c2", "foo");
    const auto c3 = column("c3");
    const Collection cc{&logger, { { "c1", c1 }, { "foo", c2 }, { "c3", c3 } }};
    EXPECT_EQ(cc.keys(), Keys({ "c1", "foo", "c3" })) << CTX;

    const auto ci = cc.as_immutable();
    EXPECT_EQ(ci.keys(), Keys({ "c1", "foo", "c3" })) << CTX;
  };

  test_type(Columns{});
  test_type(Dedupe_columns{});
} // TEST(Column_collection_common, Keys)

TEST(Column_collection_common, Key_index_error)
{
  Test_logger logger;

  const auto test_type = [&](auto type_specimen)
  {
    using Collection = decltype(type_specimen);

    const Collection cc{&logger, { { "col1", column("col1") }, { "col2", column("col2") } }};

    // Null err_code: exceptions.
    try
    {
      cc.at("foo");
      ADD_FAILURE() << CTX;
    }
    catch (const Runtime_error& exc)
    {
      EXPECT_EQ(exc.code(), Code::S_KEY_NOT_FOUND) << CTX;
    }
    try
    {
      cc.contains(column("col1"));
      ADD_FAILURE() << CTX;
    }
    catch (const Runtime_error& exc)
    {
      EXPECT_EQ(exc.code(), Code::S_MEMBERSHIP_REQUIRES_KEY) << CTX;
    }
    try
    {
      cc.at(5);
      ADD_FAILURE() << CTX;
    }
    catch (const Runtime_error& exc)
    {
      EXPECT_EQ(exc.code(), Code::S_POSITION_OUT_OF_RANGE) << CTX;
    }

    // Non-null err_code: codes, null results.
    Error_code err_code;
    EXPECT_FALSE(cc.at("foo", &err_code)) << CTX;
    EXPECT_EQ(err_code, Code::S_KEY_NOT_FOUND) << CTX;
    EXPECT_FALSE(cc.contains(cc.at(0), &err_code)) << CTX;
    EXPECT_EQ(err_code, Code::S_MEMBERSHIP_REQUIRES_KEY) << CTX;
    EXPECT_FALSE(cc.at(2, &err_code)) << CTX;
    EXPECT_EQ(err_code, Code::S_POSITION_OUT_OF_RANGE) << CTX;
    EXPECT_EQ(cc.at(1, &err_code)->name(), "col2") << CTX;
    EXPECT_FALSE(err_code) << CTX;
    EXPECT_EQ(cc.at("col1", &err_code)->name(), "col1") << CTX;
    EXPECT_FALSE(err_code) << CTX;

    // The no-error lookup.
    const auto dflt = column("dflt");
    EXPECT_EQ(cc.get("foo"), Column_ptr()) << CTX;
    EXPECT_EQ(cc.get("foo", dflt), dflt) << CTX;
    EXPECT_EQ(cc.get("col2", dflt), cc.at(1)) << CTX;
  };

  test_type(Columns{});
  test_type(Dedupe_columns{});
} // TEST(Column_collection_common, Key_index_error)

TEST(Column_collection_common, Contains)
{
  const auto test_type = [&](auto type_specimen)
  {
    using Collection = decltype(type_specimen);

    const auto c1 = column("c1");
    const auto c2 = column("c2");
    const auto c3 = column("c3");
    const Collection cc{nullptr, { { "c1", c1 }, { "c2", c2 } }};

    EXPECT_TRUE(cc.contains_column(c1)) << CTX;
    EXPECT_FALSE(cc.contains_column(c3)) << CTX;
    EXPECT_FALSE(cc.contains_column(column("c1"))) << CTX; // Identity, not equal name/key.

    EXPECT_TRUE(cc.contains("c1")) << CTX;
    EXPECT_TRUE(cc.contains("c2")) << CTX;
    EXPECT_FALSE(cc.contains("c3")) << CTX;
  };

  test_type(Columns{});
  test_type(Dedupe_columns{});
} // TEST(Column_collection_common, Contains)

TEST(Column_collection_common, Compare)
{
  const auto test_type = [&](auto type_specimen)
  {
    using Collection = decltype(type_specimen);

    const auto c1 = column("col1");
    const auto c2 = column("col2");
    const auto c3 = column("col3");

    const Collection cc1{nullptr, { { "col1", c1 }, { "col2", c2 }, { "col3", c3 } }};
    const Collection cc2{nullptr, { { "col1", c1 }, { "col2", c2 }, { "col3", c3 } }};
    const Collection cc3{nullptr, { { "col1", c1 }, { "col2", c2 } }};
    const Collection cc4{nullptr, { { "col1", c1 }, { "col2", column("col2") }, { "col3", c3 } }};

    EXPECT_TRUE(cc1.compare(cc2)) << CTX;
    EXPECT_TRUE(cc1 == cc2) << CTX;
    EXPECT_FALSE(cc1.compare(cc3)) << CTX;
    EXPECT_FALSE(cc3.compare(cc1)) << CTX;
    EXPECT_TRUE(cc1 != cc3) << CTX;
    EXPECT_FALSE(cc1.compare(cc4)) << CTX; // Same keys; a different (if identically named) item.

    // A view compares as the collection it views.
    EXPECT_TRUE(cc1.as_immutable() == cc2) << CTX;
    EXPECT_TRUE(Collection{}.compare(Collection{})) << CTX;
  };

  test_type(Columns{});
  test_type(Dedupe_columns{});

  // Across variants: same entries compare equal.
  const auto c1 = column("c1");
  const auto c2 = column("c2");
  EXPECT_TRUE(Columns(nullptr, { { "c1", c1 }, { "c2", c2 } }) == Dedupe_columns(nullptr, { { "c1", c1 }, { "c2", c2 } }));
} // TEST(Column_collection_common, Compare)

TEST(Column_collection_common, Print)
{
  const auto c1 = column("c1");
  const auto c2 = column("c2", "k2");

  EXPECT_EQ(util::ostream_op_string(Columns(nullptr, { { "c1", c1 }, { "k2", c2 } })), "Column_collection[c1, k2]");
  EXPECT_EQ(util::ostream_op_string(Dedupe_columns(nullptr, { { "k2", c2 } })), "Dedupe_column_collection[k2]");
  EXPECT_EQ(util::ostream_op_string(Columns{}), "Column_collection[]");
  EXPECT_EQ(util::ostream_op_string(Columns(nullptr, { { "c1", c1 } }).as_immutable()),
            "Immutable_column_collection[c1]");
  EXPECT_EQ(util::ostream_op_string(*c1, ' ', *c2), "Column[c1] Column[c2 key=k2]");
} // TEST(Column_collection_common, Print)

TEST(Column_collection_common, Copy)
{
  const auto test_type = [&](auto type_specimen)
  {
    using Collection = decltype(type_specimen);

    const auto c1 = column("c1");
    const auto c2 = column("c2");
    const auto c3 = column("c3");

    Collection cc{nullptr, { { "c1", c1 }, { "c2", c2 } }};
    const auto ci = cc.as_immutable();

    // A copy has its own structures: mutating it affects neither the original nor its views.
    Collection copy{cc};
    EXPECT_TRUE(copy == cc) << CTX;
    EXPECT_FALSE(copy.shares_state_with(cc)) << CTX;
    copy.add(c3);
    EXPECT_EQ(copy.size(), size_t(3)) << CTX;
    EXPECT_EQ(cc.size(), size_t(2)) << CTX;
    EXPECT_EQ(ci.size(), size_t(2)) << CTX;
    expect_collection_integrity(copy, CTX);
    expect_collection_integrity(cc, CTX);

    // Assignment: *this gets a copy; old views keep the old structures.
    Collection other;
    const auto other_view = other.as_immutable();
    other = copy;
    EXPECT_TRUE(other == copy) << CTX;
    EXPECT_FALSE(other.shares_state_with(copy)) << CTX;
    EXPECT_TRUE(other_view.empty()) << CTX;
    EXPECT_FALSE(other_view.shares_state_with(other)) << CTX;

    // Swap: views follow the structures.
    using std::swap;
    swap(cc, other);
    EXPECT_EQ(cc.size(), size_t(3)) << CTX;
    EXPECT_EQ(other.size(), size_t(2)) << CTX;
    EXPECT_TRUE(ci.shares_state_with(other)) << CTX;
    EXPECT_TRUE(other_view.empty()) << CTX;
  };

  test_type(Columns{});
  test_type(Dedupe_columns{});
} // TEST(Column_collection_common, Copy)

TEST(Column_collection_common, Iteration)
{
  const auto test_type = [&](auto type_specimen)
  {
    using Collection = decltype(type_specimen);

    Collection cc;
    EXPECT_TRUE(cc.begin() == cc.end()) << CTX;
    EXPECT_TRUE(cc.empty()) << CTX;

    const auto c1 = column("c1");
    const auto c2 = column("c2");
    cc.extend({ c1, c2 });

    auto it = cc.begin();
    EXPECT_TRUE(it != cc.end()) << CTX;
    EXPECT_EQ(*it, c1) << CTX;
    EXPECT_EQ((*it)->name(), "c1") << CTX;
    const auto it_copy = it;
    ++it;
    EXPECT_EQ(*it, c2) << CTX;
    EXPECT_EQ(*it_copy, c1) << CTX;
    EXPECT_TRUE(it != it_copy) << CTX;
    it++;
    EXPECT_TRUE(it == cc.end()) << CTX;

    // A snapshot: additions after begin() are not seen by that iteration.
    const auto c3 = column("c3");
    Items seen;
    for (auto iter = cc.begin(); iter != cc.end(); ++iter)
    {
      if (seen.empty())
      {
        cc.add(c3);
      }
      seen.push_back(*iter);
    }
    EXPECT_EQ(seen, Items({ c1, c2 })) << CTX;
    EXPECT_EQ(iterated(cc), Items({ c1, c2, c3 })) << CTX;
  };

  test_type(Columns{});
  test_type(Dedupe_columns{});
} // TEST(Column_collection_common, Iteration)

TEST(Column_collection_common, Null_item)
{
  const auto test_type = [&](auto type_specimen)
  {
    using Collection = decltype(type_specimen);

    const auto c1 = column("c1");

    // Constructor: throws; or leaves it empty.
    EXPECT_THROW(Collection(nullptr, { { "c1", c1 }, { "x", Column_ptr() } }), Runtime_error) << CTX;
    Error_code err_code;
    const Collection cc_bad{nullptr, { { "c1", c1 }, { "x", Column_ptr() } }, &err_code};
    EXPECT_EQ(err_code, Code::S_NULL_ITEM) << CTX;
    EXPECT_TRUE(cc_bad.empty()) << CTX;
    expect_collection_integrity(cc_bad, CTX);

    Collection cc{nullptr, { { "c1", c1 } }, &err_code};
    EXPECT_FALSE(err_code) << CTX;

    EXPECT_FALSE(cc.add(Column_ptr(), &err_code)) << CTX;
    EXPECT_EQ(err_code, Code::S_NULL_ITEM) << CTX;
    EXPECT_FALSE(cc.add(Column_ptr(), "x", &err_code)) << CTX;
    EXPECT_EQ(err_code, Code::S_NULL_ITEM) << CTX;
    EXPECT_THROW(cc.add(Column_ptr()), Runtime_error) << CTX;

    // extend(): all or nothing.
    EXPECT_FALSE(cc.extend({ column("c2"), Column_ptr() }, &err_code)) << CTX;
    EXPECT_EQ(err_code, Code::S_NULL_ITEM) << CTX;
    EXPECT_EQ(cc.keys(), Keys({ "c1" })) << CTX;
    expect_collection_integrity(cc, CTX);
  };

  test_type(Columns{});
  test_type(Dedupe_columns{});
} // TEST(Column_collection_common, Null_item)

TEST(Column_collection_common, Logging)
{
  log::Config cfg{log::Sev::S_TRACE};
  log::Buffer_logger logger{&cfg};
  log::Buffer_logger logger2{&cfg};

  Dedupe_columns cc{&logger};
  cc.add(column("c1"));
  Error_code err_code;
  cc.at("nope", &err_code);
  EXPECT_TRUE(err_code);

  const auto out = logger.buffer_str_copy();
  EXPECT_NE(out.find("[debg]"), string::npos) << out; // Creation.
  EXPECT_NE(out.find("appended item [c1]"), string::npos) << out;
  EXPECT_NE(out.find("[warn]"), string::npos) << out; // Emitted error.
  EXPECT_NE(out.find(Error_code(Code::S_KEY_NOT_FOUND).message()), string::npos) << out;

  // Redirect.
  EXPECT_EQ(cc.get_logger(), &logger);
  cc.set_logger(&logger2);
  EXPECT_EQ(cc.get_logger(), &logger2);
  cc.add(column("c2"));
  EXPECT_NE(logger2.buffer_str_copy().find("appended item [c2]"), string::npos);
  EXPECT_EQ(logger.buffer_str_copy().find("appended item [c2]"), string::npos);
} // TEST(Column_collection_common, Logging)

TEST(Column_collection, Separate_key)
{
  const auto c1 = column("col1");
  const auto c2 = column("col2");
  const Columns cc{nullptr, { { "kcol1", c1 }, { "kcol2", c2 } }};

  EXPECT_EQ(cc.items(), Items({ c1, c2 }));
  EXPECT_EQ(cc.at("kcol1"), c1);
  EXPECT_EQ(cc.at("kcol2"), c2);
  EXPECT_FALSE(cc.contains("col1"));
  EXPECT_TRUE(cc.contains("kcol2"));
  expect_collection_integrity(cc);

  Columns cc2;
  cc2.add(c1, "kcol1");
  EXPECT_TRUE(cc2 == Columns(nullptr, { { "kcol1", c1 } }));
} // TEST(Column_collection, Separate_key)

TEST(Column_collection, Dupes_add)
{
  Test_logger logger;

  const auto c1 = column("c1");
  const auto c2a = column("c2");
  const auto c3 = column("c3");
  const auto c2b = column("c2");

  Columns cc{&logger};
  EXPECT_TRUE(cc.add(c1));
  EXPECT_TRUE(cc.add(c2a, "c2"));
  EXPECT_TRUE(cc.add(c3));
  EXPECT_TRUE(cc.add(c2b));

  EXPECT_EQ(cc.items(), Items({ c1, c2a, c3, c2b }));
  EXPECT_EQ(iterated(cc), Items({ c1, c2a, c3, c2b }));
  EXPECT_EQ(cc.keys(), Keys({ "c1", "c2", "c3", "c2" }));
  EXPECT_EQ(cc.size(), size_t(4));

  EXPECT_TRUE(cc.contains_column(c2a));
  EXPECT_TRUE(cc.contains_column(c2b));

  // Deterministic: the first one.
  EXPECT_EQ(cc.at("c2"), c2a);
  EXPECT_EQ(cc.at(3), c2b);
  expect_collection_integrity(cc);

  const auto ci = cc.as_immutable();
  EXPECT_EQ(ci.items(), Items({ c1, c2a, c3, c2b }));
  EXPECT_EQ(iterated(ci), Items({ c1, c2a, c3, c2b }));
  EXPECT_EQ(ci.keys(), Keys({ "c1", "c2", "c3", "c2" }));
} // TEST(Column_collection, Dupes_add)

TEST(Column_collection, Dupes_construct)
{
  const auto c1 = column("c1");
  const auto c2a = column("c2");
  const auto c3 = column("c3");
  const auto c2b = column("c2");

  const Columns cc{nullptr, { { "c1", c1 }, { "c2", c2a }, { "c3", c3 }, { "c2", c2b } }};

  EXPECT_EQ(cc.items(), Items({ c1, c2a, c3, c2b }));
  EXPECT_EQ(iterated(cc), Items({ c1, c2a, c3, c2b }));
  EXPECT_EQ(cc.keys(), Keys({ "c1", "c2", "c3", "c2" }));
  EXPECT_TRUE(cc.contains_column(c2a));
  EXPECT_TRUE(cc.contains_column(c2b));
  EXPECT_EQ(cc.at("c2"), c2a);
  expect_collection_integrity(cc);

  const auto ci = cc.as_immutable();
  EXPECT_EQ(ci.items(), Items({ c1, c2a, c3, c2b }));
  EXPECT_EQ(ci.keys(), Keys({ "c1", "c2", "c3", "c2" }));
} // TEST(Column_collection, Dupes_construct)

TEST(Column_collection, Identical_dupe_construct)
{
  const auto c1 = column("c1");
  const auto c2 = column("c2");
  const auto c3 = column("c3");

  const Columns cc{nullptr, { { "c1", c1 }, { "c2", c2 }, { "c3", c3 }, { "c2", c2 } }};

  // Every entry is kept, even the very same item twice.
  EXPECT_EQ(cc.items(), Items({ c1, c2, c3, c2 }));
  EXPECT_EQ(iterated(cc), Items({ c1, c2, c3, c2 }));
  EXPECT_EQ(cc.size(), size_t(4));
  EXPECT_EQ(cc.active_set().m_items.size(), size_t(3));
  EXPECT_TRUE(cc.contains_column(c2));
  expect_collection_integrity(cc);

  const auto ci = cc.as_immutable();
  EXPECT_EQ(iterated(ci), Items({ c1, c2, c3, c2 }));
} // TEST(Column_collection, Identical_dupe_construct)

TEST(Column_collection, Extend)
{
  const auto c1 = column("c1");
  const auto c2a = column("c2");
  const auto c2b = column("c2");

  Columns cc;
  const auto ci = cc.as_immutable();
  EXPECT_TRUE(cc.extend({ c1, c2a, c2b, c1 }));
  EXPECT_EQ(cc.items(), Items({ c1, c2a, c2b, c1 }));
  EXPECT_EQ(cc.at("c2"), c2a);
  EXPECT_EQ(ci.size(), size_t(4));
  expect_collection_integrity(cc);

  EXPECT_TRUE(cc.extend({}));
  EXPECT_EQ(cc.size(), size_t(4));
} // TEST(Column_collection, Extend)

} // namespace keyseq::collection::test
