#include <msgdec/decode/decoder.h>
#include <msgdec/value/timestamp.h>
#include <msgdec/value/value.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <string>

using msgdec::value::Value;

// ------------------------------------------------------------------
// 1. Kinds and construction
// ------------------------------------------------------------------

TEST(ValueTest, DefaultIsNil) {
    Value v;
    EXPECT_TRUE(v.is_nil());
    EXPECT_EQ(v.kind(), Value::Kind::Nil);
    EXPECT_TRUE(Value(nullptr).is_nil());
}

TEST(ValueTest, IntegralSignednessPicksKind) {
    EXPECT_TRUE(Value(int8_t{-3}).is_int());
    EXPECT_TRUE(Value(42).is_int());
    EXPECT_TRUE(Value(uint8_t{3}).is_uint());
    EXPECT_TRUE(Value(42u).is_uint());
    EXPECT_EQ(Value(-7).as_int(), -7);
    EXPECT_EQ(Value(std::numeric_limits<uint64_t>::max()).as_uint(),
              std::numeric_limits<uint64_t>::max());
}

TEST(ValueTest, ScalarsAndText) {
    EXPECT_TRUE(Value(true).as_bool());
    EXPECT_DOUBLE_EQ(Value(2.5).as_float(), 2.5);
    EXPECT_DOUBLE_EQ(Value(1.5f).as_float(), 1.5);
    EXPECT_EQ(Value("abc").as_string(), "abc");
    EXPECT_EQ(Value(std::string("x")).kind(), Value::Kind::String);
    EXPECT_EQ(Value(Value::Bytes{1, 2}).as_bytes().size(), 2u);
}

TEST(ValueTest, WrongAccessorThrows) {
    Value v(1);
    EXPECT_THROW(v.as_string(), std::bad_variant_access);
}

TEST(ValueTest, KindNames) {
    EXPECT_STREQ(Value::kind_name(Value::Kind::Nil), "nil");
    EXPECT_STREQ(Value::kind_name(Value::Kind::Uint), "uint");
    EXPECT_STREQ(Value::kind_name(Value::Kind::Record), "record");
}

// ------------------------------------------------------------------
// 2. Equality and ordering
// ------------------------------------------------------------------

TEST(ValueTest, StructuralEquality) {
    Value a(Value::Sequence{Value(1), Value("x")});
    Value b(Value::Sequence{Value(1), Value("x")});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, Value(Value::Sequence{Value(1)}));
    EXPECT_NE(Value(1), Value(1u));
}

TEST(ValueTest, OrderIsKindThenPayload) {
    EXPECT_LT(Value(), Value(false));
    EXPECT_LT(Value(true), Value(-5));
    EXPECT_LT(Value(-5), Value(3));
    EXPECT_LT(Value(100), Value(0u));
    EXPECT_LT(Value("a"), Value("b"));
    EXPECT_LT(Value("zzz"), Value(Value::Bytes{}));
}

TEST(ValueTest, NanIsOrderedLast) {
    Value nan(std::nan(""));
    Value big(1e300);
    EXPECT_LT(big, nan);
    EXPECT_FALSE(nan < big);
    EXPECT_EQ(nan, Value(std::nan("")));
}

TEST(ValueTest, UsableAsMapKey) {
    Value::Map m;
    m[Value("a")] = Value(1);
    m[Value(2)] = Value("two");
    m[Value("a")] = Value(3);
    EXPECT_EQ(m.size(), 2u);
    EXPECT_EQ(m[Value("a")].as_int(), 3);
}

TEST(ValueTest, RecordsCompareByIdentity) {
    Value a = msgdec::decode::box<int>(5);
    Value b = msgdec::decode::box<int>(5);
    Value a2 = a;
    EXPECT_EQ(a, a2);
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b || b < a);
}

// ------------------------------------------------------------------
// 3. Boxed records
// ------------------------------------------------------------------

TEST(ValueTest, RecordAsReturnsTypedPointer) {
    Value v = msgdec::decode::box<std::map<std::string, double>>();
    ASSERT_TRUE(v.is_record());
    auto* m = v.record_as<std::map<std::string, double>>();
    ASSERT_NE(m, nullptr);
    EXPECT_TRUE(m->empty());
    EXPECT_EQ(v.record_as<int>(), nullptr);
    EXPECT_EQ(Value(1).record_as<int>(), nullptr);
}

// ------------------------------------------------------------------
// 4. Rendering
// ------------------------------------------------------------------

TEST(ValueTest, ToStringCompactForm) {
    Value::Map m;
    m[Value("a")] = Value(1);
    m[Value("b")] = Value(Value::Sequence{Value(true), Value()});
    EXPECT_EQ(Value(m).to_string(), "{\"a\": 1, \"b\": [true, nil]}");
    EXPECT_EQ(Value(Value::Bytes{0x0a, 0xff}).to_string(), "bytes(0aff)");
    EXPECT_EQ(Value("q\"\n").to_string(), "\"q\\\"\\x0a\"");
    EXPECT_EQ(Value(1.5).to_string(), "1.5");
}

TEST(ValueTest, StreamOperatorMatchesToString) {
    Value v(Value::Sequence{Value(1u), Value(-2)});
    std::ostringstream oss;
    oss << v;
    EXPECT_EQ(oss.str(), v.to_string());
    EXPECT_EQ(oss.str(), "[1, -2]");
}

// ------------------------------------------------------------------
// 5. Timestamps
// ------------------------------------------------------------------

TEST(TimestampTest, BuildsFromSecondsAndNanos) {
    auto ts = msgdec::value::make_timestamp(1700000000, 123);
    EXPECT_EQ(msgdec::value::timestamp_seconds(ts), 1700000000);
    EXPECT_EQ(msgdec::value::timestamp_nanos(ts), 123);
}

TEST(TimestampTest, NormalizesNanosecondOverflow) {
    auto ts = msgdec::value::make_timestamp(10, 2'500'000'000);
    EXPECT_EQ(msgdec::value::timestamp_seconds(ts), 12);
    EXPECT_EQ(msgdec::value::timestamp_nanos(ts), 500'000'000);

    auto neg = msgdec::value::make_timestamp(10, -1);
    EXPECT_EQ(msgdec::value::timestamp_seconds(neg), 9);
    EXPECT_EQ(msgdec::value::timestamp_nanos(neg), 999'999'999);
}

TEST(TimestampTest, FormatsAsUtc) {
    auto ts = msgdec::value::make_timestamp(0, 6);
    EXPECT_EQ(msgdec::value::format_timestamp(ts), "1970-01-01T00:00:00.000000006Z");
    auto later = msgdec::value::make_timestamp(1704164645, 0);
    EXPECT_EQ(msgdec::value::format_timestamp(later), "2024-01-02T03:04:05.000000000Z");
}
