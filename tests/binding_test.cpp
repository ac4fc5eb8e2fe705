#include <gtest/gtest.h>
#include <binding.hpp>
#include <exceptions.hpp>
#include <thread>
#include <vector>

namespace {

struct LogEntry {
  uint64_t foo{0};
  bool bar{false};
  std::string baz;
};

struct Inner {
  std::string foo;
  uint32_t bar{0};

  bool operator==(const Inner &other) const {
    return foo == other.foo && bar == other.bar;
  }
};

struct Outer {
  Inner first;
  std::optional<Inner> second;
};

struct Message {
  uint8_t level{0};
  std::string text;
};

struct Reading {
  std::string sensor;
  double value{0};
  std::optional<int16_t> offset;
  std::string unit;
};

const caprec::Binding<LogEntry> &LogEntryBinding() {
  static const auto binding =
      caprec::Binding<LogEntry>(
          "LogEntry", R"((?P<foo>\d+)\s+(?P<bar>true|false)\s+(?P<baz>\S+))")
          .Field("foo", &LogEntry::foo)
          .Field("bar", &LogEntry::bar)
          .Field("baz", &LogEntry::baz);
  return binding;
}

const caprec::Binding<Inner> &InnerBinding() {
  static const auto binding =
      caprec::Binding<Inner>("Inner", R"((?P<foo>\w+):(?P<bar>\d+))")
          .Field("foo", &Inner::foo)
          .Field("bar", &Inner::bar);
  return binding;
}

const caprec::Binding<Outer> &OuterBinding() {
  static const auto binding =
      caprec::Binding<Outer>("Outer", R"((?P<first>[^ ]+)( (?P<second>[^ ]+))?)")
          .Field("first", &Outer::first, InnerBinding())
          .Field("second", &Outer::second, InnerBinding());
  return binding;
}
}  // namespace

TEST(BindingTest, ParsesLinesIntoStructs) {
  const std::vector<std::string> lines{"1 true hello", "2 false world"};

  LogEntry one = LogEntryBinding().Parse(lines[0]);
  EXPECT_EQ(one.foo, 1u);
  EXPECT_TRUE(one.bar);
  EXPECT_EQ(one.baz, "hello");

  LogEntry two = LogEntryBinding().Parse(lines[1]);
  EXPECT_EQ(two.foo, 2u);
  EXPECT_FALSE(two.bar);
  EXPECT_EQ(two.baz, "world");
}

TEST(BindingTest, DerivesShapesFromMemberTypes) {
  const caprec::Schema &schema = LogEntryBinding().GetSchema();
  ASSERT_EQ(schema.Fields().size(), 3u);
  EXPECT_EQ(schema.Fields()[0].shape.Name(), "u64");
  EXPECT_EQ(schema.Fields()[1].shape.Name(), "bool");
  EXPECT_EQ(schema.Fields()[2].shape.Name(), "string");
  EXPECT_EQ(OuterBinding().GetSchema().Fields()[1].shape.Name(),
            "?record Inner");
}

TEST(BindingTest, FiltersBeforeParsing) {
  std::vector<LogEntry> entries;
  for (const std::string line : {"1 true hello", "# comment", "2 false x"}) {
    if (LogEntryBinding().IsMatch(line)) {
      entries.emplace_back(LogEntryBinding().Parse(line));
    }
  }
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[1].baz, "x");
}

TEST(BindingTest, NestedStructs) {
  Outer both = OuterBinding().Parse("abc:123 def:456");
  EXPECT_EQ(both.first, (Inner{"abc", 123}));
  ASSERT_TRUE(both.second.has_value());
  EXPECT_EQ(*both.second, (Inner{"def", 456}));

  Outer one = OuterBinding().Parse("ghi:789");
  EXPECT_EQ(one.first, (Inner{"ghi", 789}));
  EXPECT_FALSE(one.second.has_value());
}

TEST(BindingTest, OptionalsRenamesAndDefaults) {
  auto binding =
      caprec::Binding<Reading>(
          "Reading",
          R"(^(?P<sensor>\w+)=(?P<v>\S+)(?: offset=(?P<offset>\S+))?(?: (?P<unit>\w+))?$)")
          .Field("sensor", &Reading::sensor)
          .Field("value", &Reading::value)
          .From("v")
          .Field("offset", &Reading::offset)
          .Field("unit", &Reading::unit)
          .Default(caprec::Value::String("celsius"));

  Reading plain = binding.Parse("t1=21.5");
  EXPECT_EQ(plain.sensor, "t1");
  EXPECT_DOUBLE_EQ(plain.value, 21.5);
  EXPECT_FALSE(plain.offset.has_value());
  EXPECT_EQ(plain.unit, "celsius");

  Reading full = binding.Parse("t2=-3e1 offset=-4 kelvin");
  EXPECT_DOUBLE_EQ(full.value, -30.0);
  ASSERT_TRUE(full.offset.has_value());
  EXPECT_EQ(*full.offset, -4);
  EXPECT_EQ(full.unit, "kelvin");

  EXPECT_THROW(binding.Parse("t3=warm"), caprec::TypeMismatchError);
  EXPECT_THROW(binding.Parse("t4=1 offset=40000"), caprec::TypeMismatchError);
}

TEST(BindingTest, DefaultsOutsideTheMemberRangeAreRejected) {
  auto binding =
      caprec::Binding<Message>("Message", R"((?:(?P<level>\d+) )?(?P<text>\w+))")
          .Field("level", &Message::level);

  EXPECT_THROW(binding.Default(caprec::Value::Unsigned(300)),
               caprec::CaprecError);
  EXPECT_THROW(binding.Default(caprec::Value::Signed(3)), caprec::CaprecError);

  binding.Default(caprec::Value::Unsigned(255)).Field("text", &Message::text);

  Message message = binding.Parse("hi");
  EXPECT_EQ(message.level, 255);
  EXPECT_EQ(message.text, "hi");

  EXPECT_THROW(binding.Parse("300 hi"), caprec::TypeMismatchError);
}

TEST(BindingTest, MissingRequiredMember) {
  auto binding = caprec::Binding<LogEntry>(
                     "LogEntry", R"((?P<foo>\d+)(?: (?P<baz>\S+))?)")
                     .Field("foo", &LogEntry::foo)
                     .Field("baz", &LogEntry::baz);

  try {
    binding.Parse("17");
    FAIL() << "expected MissingFieldError";
  } catch (const caprec::MissingFieldError &e) {
    EXPECT_EQ(e.Field(), "baz");
  }
}

TEST(BindingTest, ParsesConcurrently) {
  caprec::cache::PatternCache cache;
  caprec::Decoder decoder{cache};
  std::vector<uint64_t> results(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] {
      results[i] =
          LogEntryBinding().Parse(std::to_string(i) + " true t", decoder).foo;
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i], i);
  }
  EXPECT_EQ(cache.Size(), 1u);
}
