#include <gtest/gtest.h>
#include <exceptions.hpp>
#include <sstream>
#include <value.hpp>

using caprec::Record;
using caprec::Value;

TEST(ValueTest, DefaultIsNone) {
  Value v;
  EXPECT_TRUE(v.IsNone());
  EXPECT_EQ(v, Value::None());
}

TEST(ValueTest, WrongAccessorThrows) {
  Value v = Value::Signed(-3);
  EXPECT_EQ(v.AsSigned(), -3);
  EXPECT_THROW(v.AsUnsigned(), caprec::CaprecError);
  EXPECT_THROW(v.AsString(), caprec::CaprecError);
}

TEST(ValueTest, EqualityIsByKindAndContent) {
  EXPECT_EQ(Value::String("a"), Value::String("a"));
  EXPECT_NE(Value::String("a"), Value::String("b"));
  EXPECT_NE(Value::Signed(1), Value::Unsigned(1));
  EXPECT_NE(Value::Bool(false), Value::None());
}

TEST(RecordTest, KeepsInsertionOrderAndReplaces) {
  Record record{"Entry"};
  record.Set("b", Value::Signed(1));
  record.Set("a", Value::Signed(2));
  record.Set("b", Value::Signed(3));

  ASSERT_EQ(record.Size(), 2u);
  EXPECT_EQ(record.begin()->first, "b");
  EXPECT_EQ(record.Get("b"), Value::Signed(3));
  EXPECT_TRUE(record.Contains("a"));
  EXPECT_THROW(record.Get("c"), caprec::CaprecError);
}

TEST(RecordTest, NestedRecordsCompareByContent) {
  Record inner{"Inner"};
  inner.Set("foo", Value::String("abc"));
  Record a{"Outer"};
  a.Set("first", Value::Nested(inner));
  Record b{"Outer"};
  b.Set("first", Value::Nested(inner));

  EXPECT_EQ(a, b);
  EXPECT_EQ(a.Get("first").AsRecord().Get("foo").AsString(), "abc");
}

TEST(RecordTest, Prints) {
  Record inner{"Inner"};
  inner.Set("bar", Value::Unsigned(7));
  Record record{"Entry"};
  record.Set("foo", Value::Signed(1));
  record.Set("bar", Value::Bool(true));
  record.Set("baz", Value::String("hello"));
  record.Set("none", Value::None());
  record.Set("inner", Value::Nested(inner));

  std::ostringstream ss;
  ss << record;
  EXPECT_EQ(ss.str(),
            "Entry { foo: 1, bar: true, baz: \"hello\", none: none, inner: "
            "Inner { bar: 7 } }");

  std::ostringstream empty;
  empty << Record{"Empty"};
  EXPECT_EQ(empty.str(), "Empty {}");
}
