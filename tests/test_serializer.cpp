#include <cmath>
#include <limits>
#include <gtest/gtest.h>
#include "Serializer.hpp"
#include "TestSupport.hpp"

// JSON numbers come back as doubles.
static Value fromJson(google::protobuf::Value const& v)
{
    switch (v.kind_case())
    {
        case google::protobuf::Value::kBoolValue:   return Value(v.bool_value());
        case google::protobuf::Value::kNumberValue: return Value(v.number_value());
        case google::protobuf::Value::kStringValue: return Value(v.string_value());
        case google::protobuf::Value::kListValue:
        {
            Value out = Value::sequence();
            for (auto const& item : v.list_value().values())
                out.push(fromJson(item));
            return out;
        }
        case google::protobuf::Value::kStructValue:
        {
            Value out = Value::table();
            for (auto const& [key, item] : v.struct_value().fields())
                out.set(Value::Key{key}, fromJson(item));
            return out;
        }
        default:
            return Value();
    }
}

static Value decode(std::string const& text)
{
    google::protobuf::Value parsed;
    EXPECT_TRUE(parseJson(text, parsed)) << text;
    return fromJson(parsed);
}

TEST(Serializer, Scalars)
{
    EXPECT_EQ(Serializer::encode(Value()), "null");
    EXPECT_EQ(Serializer::encode(Value(true)), "true");
    EXPECT_EQ(Serializer::encode(Value(false)), "false");
    EXPECT_EQ(Serializer::encode(Value(42)), "42");
    EXPECT_EQ(Serializer::encode(Value(-7)), "-7");
    EXPECT_EQ(Serializer::encode(Value(0.5)), "0.5");
    EXPECT_EQ(Serializer::encode(Value(0.1)), "0.1");
    EXPECT_EQ(Serializer::encode(Value("hi")), "\"hi\"");
}

TEST(Serializer, NonFiniteNumbersBecomeNull)
{
    EXPECT_EQ(Serializer::encode(Value(std::numeric_limits<double>::quiet_NaN())), "null");
    EXPECT_EQ(Serializer::encode(Value(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(Serializer::encode(Value(-std::numeric_limits<double>::infinity())), "null");

    Value t = record({{"speed", std::numeric_limits<double>::quiet_NaN()}, {"ok", 1}});
    EXPECT_EQ(Serializer::encode(t), "{\"ok\":1,\"speed\":null}");
}

TEST(Serializer, ContiguousIntegerKeysEncodeAsArray)
{
    Value t = Value::table();
    t.set(Value::Key{std::int64_t{1}}, Value("a"));
    t.set(Value::Key{std::int64_t{2}}, Value("b"));
    t.set(Value::Key{std::int64_t{3}}, Value("c"));
    EXPECT_EQ(Serializer::encode(t), "[\"a\",\"b\",\"c\"]");
}

TEST(Serializer, GappedOrStringKeysEncodeAsObject)
{
    Value gapped = Value::table();
    gapped.set(Value::Key{std::int64_t{1}}, Value(1));
    gapped.set(Value::Key{std::int64_t{2}}, Value(2));
    gapped.set(Value::Key{std::int64_t{4}}, Value(4));
    EXPECT_EQ(Serializer::encode(gapped), "{\"1\":1,\"2\":2,\"4\":4}");

    EXPECT_EQ(Serializer::encode(record({{"a", 1}})), "{\"a\":1}");

    Value zeroBased = Value::table();
    zeroBased.set(Value::Key{std::int64_t{0}}, Value(0));
    zeroBased.set(Value::Key{std::int64_t{1}}, Value(1));
    EXPECT_EQ(Serializer::encode(zeroBased), "{\"0\":0,\"1\":1}");
}

TEST(Serializer, EmptyContainers)
{
    EXPECT_EQ(Serializer::encode(Value::sequence()), "[]");
    EXPECT_EQ(Serializer::encode(Value::table()), "{}");
}

TEST(Serializer, ObjectKeysAreSortedByStringForm)
{
    Value t = Value::table();
    t.set(Value::Key{std::string("b")}, Value(2));
    t.set(Value::Key{std::int64_t{10}}, Value(10));
    t.set(Value::Key{std::string("a")}, Value(1));
    t.set(Value::Key{std::int64_t{9}}, Value(9));
    // "10" < "9" < "a" < "b" lexicographically.
    EXPECT_EQ(Serializer::encode(t), "{\"10\":10,\"9\":9,\"a\":1,\"b\":2}");
}

TEST(Serializer, OutputIsDeterministic)
{
    Value a = Value::table();
    a["zeta"] = 1;
    a["alpha"] = list({1, 2});
    Value b = Value::table();
    b["alpha"] = list({1, 2});
    b["zeta"] = 1;
    EXPECT_EQ(Serializer::encode(a), Serializer::encode(b));
}

TEST(Serializer, EscapesControlCharacters)
{
    std::string s = "back\\slash \"quote\"\nline\rcr\ttab";
    s += '\x01';
    EXPECT_EQ(Serializer::encode(Value(s)),
              "\"back\\\\slash \\\"quote\\\"\\nline\\rcr\\ttab\\u0001\"");
    EXPECT_EQ(decode(Serializer::encode(Value(s))), Value(s));
}

TEST(Serializer, OpaqueValuesBecomeNull)
{
    Value t = record({{"callback", Value::opaque()}, {"n", 1}});
    EXPECT_EQ(Serializer::encode(t), "{\"callback\":null,\"n\":1}");
}

TEST(Serializer, DepthIsCapped)
{
    Value leaf = Value("bottom");
    for (int i = 0; i < Serializer::MAX_DEPTH + 10; ++i)
        leaf = list({leaf});

    std::string text = Serializer::encode(leaf);
    EXPECT_EQ(text.find("bottom"), std::string::npos);
    EXPECT_NE(text.find("null"), std::string::npos);

    google::protobuf::Value parsed;
    EXPECT_TRUE(parseJson(text, parsed));
}

TEST(Serializer, DecodesBackToEqualStructure)
{
    Value v = Value::table();
    v["name"] = "Central \"Hbf\"";
    v["open"] = true;
    v["closed"] = false;
    v["count"] = 3;
    v["ratio"] = 0.25;
    v["missing"] = Value();
    v["items"] = list({1.5, "two", list({true})});
    v["nested"] = record({{"deep", record({{"x", -1.0}})}});

    Value expected = v;
    expected["count"] = 3.0;

    Value decoded = decode(Serializer::encode(v));
    EXPECT_TRUE(decoded.field("missing") == nullptr);
    EXPECT_EQ(decoded, expected);
}

TEST(Serializer, NonFiniteDecodesAsNull)
{
    Value v = list({1.0, std::numeric_limits<double>::infinity()});
    google::protobuf::Value parsed;
    ASSERT_TRUE(parseJson(Serializer::encode(v), parsed));
    ASSERT_EQ(parsed.list_value().values_size(), 2);
    EXPECT_EQ(parsed.list_value().values(1).kind_case(), google::protobuf::Value::kNullValue);
}
