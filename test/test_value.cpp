#include <gtest/gtest.h>
#include <fmt/format.h>
#include <jsondoc/core/Value.h>
#include <jsondoc/parser/json.h>
#include <jsondoc/fmt_support.h>

using namespace jsondoc;

struct TestValue : public Value
{
    TestValue(const Value& value) : Value(value) {}

    refcnt_t ref_count() const {
        switch (m_fields.repr_ix) {
            case STR:   return m_repr.ps->ref_count;
            case DECIMAL: return m_repr.pd->ref_count;
            case ARRAY: return m_repr.pa->ref_count;
            case MAP:   return m_repr.pm->ref_count;
            default:    return 0;
        }
    }
};

TEST(Value, TypeName) {
    EXPECT_EQ(Value{}.type_name(), "empty");
    EXPECT_EQ(Value{nil}.type_name(), "null");
    EXPECT_EQ(Value{true}.type_name(), "bool");
    EXPECT_EQ(Value{-1}.type_name(), "int");
    EXPECT_EQ(Value{0xFFFFFFFFFFFFFFFFULL}.type_name(), "uint");
    EXPECT_EQ(Value{1.5}.type_name(), "float");
    EXPECT_EQ(Value{Decimal{"1.5"}}.type_name(), "decimal");
    EXPECT_EQ(Value{"foo"}.type_name(), "string");
    EXPECT_EQ(Value{Value::ARRAY}.type_name(), "array");
    EXPECT_EQ(Value{Value::MAP}.type_name(), "object");
}

TEST(Value, Empty) {
  Value v;
  EXPECT_TRUE(v.is_empty());
  EXPECT_THROW(v.to_json(), EmptyReference);
  EXPECT_THROW(v == Value{1}, EmptyReference);
}

TEST(Value, Null) {
  Value v{nil};
  EXPECT_TRUE(v.is_nil());
  EXPECT_TRUE(v == nil);
  EXPECT_EQ(v.to_json(), "null");
}

TEST(Value, Bool) {
  Value v{true};
  EXPECT_TRUE(v.is_bool());
  EXPECT_FALSE(v.is_num());
  EXPECT_EQ(v.to_json(), "true");

  v = false;
  EXPECT_TRUE(v.is_bool());
  EXPECT_EQ(v.to_json(), "false");

  v = Value::BOOL;
  EXPECT_TRUE(v.is_bool());
  EXPECT_EQ(v.as<bool>(), false);
}

TEST(Value, Int64) {
  Value v{-0x7FFFFFFFFFFFFFFFLL};
  EXPECT_TRUE(v.is_int());
  EXPECT_TRUE(v.is_num());
  EXPECT_EQ(v.to_json(), "-9223372036854775807");
  EXPECT_EQ(v.as<Int>(), -0x7FFFFFFFFFFFFFFFLL);
}

TEST(Value, UInt64) {
  Value v{0xFFFFFFFFFFFFFFFFULL};
  EXPECT_TRUE(v.is_uint());
  EXPECT_TRUE(v.is_num());
  EXPECT_EQ(v.to_json(), "18446744073709551615");

  Value small{7U};
  EXPECT_TRUE(small.is_int());
  EXPECT_EQ(small.as<Int>(), 7);
}

TEST(Value, Double) {
  Value v{3.141593};
  EXPECT_TRUE(v.is_float());
  EXPECT_TRUE(v.is_num());
  EXPECT_EQ(v.to_json(), "3.141593");
  EXPECT_EQ(v.as<Float>(), 3.141593);
}

TEST(Value, Decimal) {
  Value v{Decimal{"0.30"}};
  EXPECT_TRUE(v.is_decimal());
  EXPECT_TRUE(v.is_num());
  EXPECT_FALSE(v.is_float());
  EXPECT_EQ(v.to_json(), "0.30");
  EXPECT_EQ(v.to_str(), "0.30");
  EXPECT_EQ(v.to_float(), 0.3);
  EXPECT_EQ(v.to_int(), 0);
  EXPECT_TRUE(v.to_bool());
  EXPECT_FALSE(Value{Decimal{"0.000"}}.to_bool());
  EXPECT_THROW(v.as<Float>(), WrongType);
  EXPECT_EQ(v.as<Decimal>().str(), "0.30");
}

TEST(Value, DecimalEquality) {
  EXPECT_EQ(Value{Decimal{"0.30"}}, Value{Decimal{"3e-1"}});
  EXPECT_EQ(Value{Decimal{"-12.5e1"}}, Value{-125});
  EXPECT_EQ(Value{-125}, Value{Decimal{"-12.5e1"}});
  EXPECT_EQ(Value{Decimal{"18446744073709551615.0"}}, Value{0xFFFFFFFFFFFFFFFFULL});
  EXPECT_EQ(Value{Decimal{"0.25"}}, Value{0.25});
  EXPECT_FALSE(Value{Decimal{"0.3"}} == Value{Decimal{"-0.3"}});
  EXPECT_FALSE(Value{Decimal{"1"}} == Value{"1"});
}

TEST(Value, DecimalSharedAndCopied) {
  TestValue v{Value{Decimal{"2.5"}}};
  Value other = v;
  EXPECT_EQ(v.ref_count(), 2UL);
  EXPECT_TRUE(other.is(v));
  EXPECT_EQ(v.copy().to_json(), "2.5");
}

TEST(Value, DecimalInvalidLiteral) {
  EXPECT_THROW(Decimal{"1.2.3"}, parse::SyntaxError);
  EXPECT_THROW(Decimal{""}, parse::SyntaxError);
  EXPECT_FALSE(Decimal::parse("abc").has_value());
  EXPECT_TRUE(Decimal::parse("-7.25E+2").has_value());
}

TEST(Value, String) {
  Value v{"123"};
  EXPECT_TRUE(v.is_str());
  EXPECT_EQ(v.to_json(), "\"123\"");
  EXPECT_EQ(v.to_str(), "123");
  EXPECT_EQ(v.as<String>(), "123");

  Value quoted{"a\"b"};
  EXPECT_EQ(quoted.to_json(), "\"a\\\"b\"");
}

TEST(Value, AsWrongType) {
  EXPECT_THROW(Value{1}.as<bool>(), WrongType);
  EXPECT_THROW(Value{true}.as<Int>(), WrongType);
  EXPECT_THROW(Value{1}.as<String>(), WrongType);
  EXPECT_THROW(Value{"x"}.as<Array>(), WrongType);
}

TEST(Value, Array) {
  Value array{Array{Value(1), Value("tea"), Value(3.14), Value(true)}};
  EXPECT_TRUE(array.is_array());
  EXPECT_TRUE(array.is_container());
  EXPECT_EQ(array.to_json(), "[1, \"tea\", 3.14, true]");
  EXPECT_EQ(array.size(), 4UL);
}

TEST(Value, ArrayFromLvalue) {
  Array items{Value(1), Value(2)};
  Value array{items};
  EXPECT_TRUE(array.is_array());
  EXPECT_EQ(array.size(), 2UL);
  EXPECT_EQ(array.get(1), 2);
  EXPECT_EQ(items.size(), 2UL);
}

TEST(Value, ArrayFromRvalue) {
  Value array{Array{Value(1), Value(2)}};
  EXPECT_EQ(array.size(), 2UL);
  EXPECT_EQ(array.get(0), 1);

  Value nested{Array{Value{Array{}}, Value{Array{Value("x")}}}};
  EXPECT_EQ(nested.size(), 2UL);
  EXPECT_EQ(nested.get(0).size(), 0UL);
  EXPECT_EQ(nested.get(1).get(0), "x");
}

TEST(Value, MapKeyOrder) {
  auto map = "{'x': 100, 'y': 'tea', 'a': true}"_json;
  EXPECT_TRUE(map.is_map());
  EXPECT_EQ(map.to_json(), "{\"x\": 100, \"y\": \"tea\", \"a\": true}");
  EXPECT_EQ(map.keys(), (KeyList{"x", "y", "a"}));
}

TEST(Value, ToJsonIndent) {
  auto value = "{'a': [1, 2], 'b': {}}"_json;
  EXPECT_EQ(value.to_json(2), "{\n  \"a\": [\n    1,\n    2\n  ],\n  \"b\": {}\n}");
}

TEST(Value, Size) {
    EXPECT_EQ(Value(nil).size(), 0UL);
    EXPECT_EQ(Value(1).size(), 0UL);
    EXPECT_EQ(Value("foo").size(), 3UL);
    EXPECT_EQ("[1, 2, 3]"_json.size(), 3UL);
    EXPECT_EQ("{'x': 1, 'y': 2}"_json.size(), 2UL);
}

TEST(Value, ToBool) {
    EXPECT_FALSE(Value(nil).to_bool());
    EXPECT_TRUE(Value(1).to_bool());
    EXPECT_FALSE(Value(0.0).to_bool());
    EXPECT_FALSE(Value("").to_bool());
    EXPECT_TRUE("[0]"_json.to_bool());
    EXPECT_FALSE("{}"_json.to_bool());
}

TEST(Value, ToNumber) {
    EXPECT_EQ(Value(true).to_int(), 1);
    EXPECT_EQ(Value(2.9).to_int(), 2);
    EXPECT_EQ(Value(7).to_float(), 7.0);
    EXPECT_EQ(Value(7).to_uint(), 7UL);
    EXPECT_THROW(Value("7").to_int(), WrongType);
}

TEST(Value, GetMap) {
    auto map = "{'x': 1}"_json;
    EXPECT_EQ(map.get("x"), 1);
    EXPECT_TRUE(map.get("y").is_empty());
    EXPECT_TRUE(map.contains("x"));
    EXPECT_FALSE(map.contains("y"));
    EXPECT_THROW(map.get(0), WrongType);
}

TEST(Value, GetArray) {
    auto array = "[10, 20, 30]"_json;
    EXPECT_EQ(array.get(0), 10);
    EXPECT_EQ(array.get(-1), 30);
    EXPECT_EQ(array.get(-3), 10);
    EXPECT_TRUE(array.get(3).is_empty());
    EXPECT_TRUE(array.get(-4).is_empty());
    EXPECT_THROW(array.get("x"), WrongType);
}

TEST(Value, GetScalar) {
    EXPECT_THROW(Value{1}.get("x"), WrongType);
    EXPECT_THROW(Value{}.get("x"), EmptyReference);
}

TEST(Value, SetMap) {
    Value map{Value::MAP};
    map.set("x", 1);
    map.set("y", "tea");
    map.set("x", 2);
    EXPECT_EQ(map.to_json(), "{\"x\": 2, \"y\": \"tea\"}");
    EXPECT_THROW(map.set(0, 1), WrongType);
}

TEST(Value, SetArray) {
    auto array = "[1, 2]"_json;
    array.set(0, "a");
    array.set(-1, "b");
    array.set(2, "c");
    EXPECT_EQ(array.to_json(), "[\"a\", \"b\", \"c\"]");
    EXPECT_THROW(array.set(4, "e"), NoSuchElement);
    EXPECT_THROW(array.set(-5, "e"), NoSuchElement);
}

TEST(Value, SetEmptyValue) {
    Value map{Value::MAP};
    EXPECT_THROW(map.set("x", Value{}), EmptyReference);
}

TEST(Value, Append) {
    Value array{Value::ARRAY};
    array.append(1);
    array.append("x");
    EXPECT_EQ(array.to_json(), "[1, \"x\"]");
    EXPECT_THROW(Value{Value::MAP}.append(1), WrongType);
}

TEST(Value, Del) {
    auto map = "{'x': 1, 'y': 2, 'z': 3}"_json;
    map.del("y");
    EXPECT_EQ(map.keys(), (KeyList{"x", "z"}));
    map.del("absent");
    EXPECT_EQ(map.size(), 2UL);

    auto array = "[1, 2, 3]"_json;
    array.del(-1);
    EXPECT_EQ(array.to_json(), "[1, 2]");
}

TEST(Value, Items) {
    auto map = "{'x': 1, 'y': 2}"_json;
    auto items = map.items();
    ASSERT_EQ(items.size(), 2UL);
    EXPECT_EQ(items[0].first, "x");
    EXPECT_EQ(items[1].second, 2);
}

TEST(Value, Aliasing) {
    auto map = "{'inner': {'x': 1}}"_json;
    auto inner = map.get("inner");
    inner.set("x", 2);
    EXPECT_EQ(map.get("inner").get("x"), 2);
    EXPECT_TRUE(inner.is(map.get("inner")));
}

TEST(Value, RefCount) {
    TestValue value{"[1]"_json};
    EXPECT_EQ(value.ref_count(), 1UL);
    {
        Value alias = value;
        EXPECT_EQ(value.ref_count(), 2UL);
    }
    EXPECT_EQ(value.ref_count(), 1UL);
}

TEST(Value, IdentityComparison) {
    auto a = "[1, 2]"_json;
    auto b = "[1, 2]"_json;
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a.is(b));
    EXPECT_TRUE(a.is(a));
    EXPECT_TRUE(Value{1}.is(Value{1}));
    EXPECT_FALSE(Value{1}.is(Value{1.0}));
}

TEST(Value, CompareNumbers) {
    EXPECT_TRUE(Value{1} == Value{1.0});
    EXPECT_TRUE(Value{1.0} == Value{1});
    EXPECT_TRUE(Value{0xFFFFFFFFFFFFFFFFULL} == Value{0xFFFFFFFFFFFFFFFFULL});
    EXPECT_FALSE(Value{-1} == Value{0xFFFFFFFFFFFFFFFFULL});
    EXPECT_FALSE(Value{1} == Value{"1"});
}

TEST(Value, CompareBool) {
    EXPECT_TRUE(Value{true} == Value{true});
    EXPECT_FALSE(Value{true} == Value{1});
    EXPECT_FALSE(Value{1} == Value{true});
    EXPECT_FALSE(Value{false} == Value{nil});
}

TEST(Value, CompareContainers) {
    EXPECT_TRUE("{'x': 1, 'y': [1, 2]}"_json == "{'y': [1, 2], 'x': 1}"_json);
    EXPECT_FALSE("{'x': 1}"_json == "{'x': 1, 'y': 2}"_json);
    EXPECT_FALSE("[1, 2]"_json == "[2, 1]"_json);
    EXPECT_FALSE("[]"_json == "{}"_json);
}

TEST(Value, Copy) {
    auto original = "{'a': {'b': [1, 2]}}"_json;
    auto copy = original.copy();
    EXPECT_TRUE(copy == original);
    EXPECT_FALSE(copy.is(original));
    EXPECT_FALSE(copy.get("a").is(original.get("a")));
    copy.get("a").get("b").set(0, 100);
    EXPECT_EQ(original.get("a").get("b").get(0), 1);
}

TEST(Value, DefaultMarks) {
    Value map{Value::MAP};
    map.set_default("x", 1);
    map.set("y", 2);
    EXPECT_TRUE(map.is_default("x"));
    EXPECT_FALSE(map.is_default("y"));
    EXPECT_FALSE(map.is_default("z"));
    EXPECT_TRUE(map.get("x").is_default());

    map.clear_default("x");
    EXPECT_FALSE(map.is_default("x"));

    map.set_default("z", 3);
    map.set("z", 3);
    EXPECT_FALSE(map.is_default("z"));
}

TEST(Value, WithoutDefaults) {
    auto inner = "{'p': 1}"_json;
    inner.set_default("q", 2);
    Value map{Value::MAP};
    map.set("inner", inner);
    map.set_default("d", "{'x': 1}"_json);
    map.set("r", true);

    auto real = map.without_defaults();
    EXPECT_EQ(real, "{'inner': {'p': 1}, 'r': true}"_json);
    EXPECT_EQ(map.size(), 3UL);
}

TEST(Value, CopyPreservesDefaultMarks) {
    Value map{Value::MAP};
    map.set_default("x", 1);
    auto copy = map.copy();
    EXPECT_TRUE(copy.is_default("x"));
}

TEST(Value, CopyUnmarked) {
    Value map{Value::MAP};
    map.set_default("x", "{'y': 1}"_json);
    map.get("x").set_default("z", 2);
    map.mark_default();

    auto copy = map.copy_unmarked();
    EXPECT_EQ(copy, map);
    EXPECT_FALSE(copy.is_default());
    EXPECT_FALSE(copy.is_default("x"));
    EXPECT_FALSE(copy.get("x").is_default("z"));
    EXPECT_EQ(copy.without_defaults(), "{'x': {'y': 1, 'z': 2}}"_json);
    EXPECT_TRUE(map.is_default("x"));
}

TEST(Value, Freeze) {
    auto value = "{'a': [1, {'b': 2}], 's': 'str'}"_json;
    value.freeze();
    EXPECT_TRUE(value.is_frozen());
    EXPECT_TRUE(value.get("a").is_frozen());
    EXPECT_TRUE(value.get("a").get(1).is_frozen());
    EXPECT_THROW(value.set("x", 1), WriteProtect);
    EXPECT_THROW(value.del("a"), WriteProtect);
    EXPECT_THROW(value.get("a").append(3), WriteProtect);
    EXPECT_THROW(value.get("a").get(1).set("b", 3), WriteProtect);
    EXPECT_EQ(value.get("a").get(1).get("b"), 2);
}

TEST(Value, CopyOfFrozenIsWritable) {
    auto value = "{'a': 1}"_json;
    value.freeze();
    auto copy = value.copy();
    EXPECT_FALSE(copy.is_frozen());
    copy.set("a", 2);
    EXPECT_EQ(copy.get("a"), 2);
}

TEST(Value, StdStreamOperator) {
    std::stringstream ss;
    ss << "[1, 'a']"_json;
    EXPECT_EQ(ss.str(), "[1, \"a\"]");
}

TEST(Value, Format) {
    EXPECT_EQ(fmt::format("{}", Value{"tea"}), "tea");
    EXPECT_EQ(fmt::format("{}", "[1]"_json), "[1]");
    EXPECT_EQ(fmt::format("{}", Value{}), "<empty>");
}
