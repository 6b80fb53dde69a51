#include <gtest/gtest.h>
#include <sstream>
#include "config/ordered_map_serializer.hpp"

using namespace config;

namespace {

    std::string serialize(const json& value, const SerializeOptions& options) {
        std::ostringstream oss;
        serialize_object_map(value, options, oss);
        return oss.str();
    }

    SerializeOptions indented(int level, bool separator = true) {
        SerializeOptions options;
        options.whitespace = Whitespace{};
        options.whitespace->indent_level = level;
        options.whitespace->separator = separator;
        return options;
    }

}  // namespace

TEST(OrderedMapSerializerTest, KeepsInsertionOrder) {
    json value = json::object();
    value["b"] = 1;
    value["a"] = 2;

    EXPECT_EQ(serialize(value, indented(0)), "{\n    \"b\": 1,\n    \"a\": 2\n}");
}

TEST(OrderedMapSerializerTest, CompactWithoutWhitespace) {
    json value = json::object();
    value["b"] = 1;
    value["a"] = json::object();
    value["a"]["c"] = "x";

    EXPECT_EQ(serialize(value, SerializeOptions{}), "{\"b\":1,\"a\":{\"c\":\"x\"}}");
}

TEST(OrderedMapSerializerTest, NestedObjectsIndentOneLevelDeeper) {
    json value = json::object();
    value["x"] = json::object();
    value["x"]["y"] = true;

    EXPECT_EQ(serialize(value, indented(1)),
              "{\n"
              "        \"x\": {\n"
              "            \"y\": true\n"
              "        }\n"
              "    }");
}

TEST(OrderedMapSerializerTest, HandlesArbitraryDepth) {
    json value = json::object();
    value["l1"]["l2"]["l3"]["l4"] = 4;

    EXPECT_EQ(serialize(value, indented(0)),
              "{\n"
              "    \"l1\": {\n"
              "        \"l2\": {\n"
              "            \"l3\": {\n"
              "                \"l4\": 4\n"
              "            }\n"
              "        }\n"
              "    }\n"
              "}");
}

TEST(OrderedMapSerializerTest, WithoutSeparator) {
    json value = json::object();
    value["k"] = "v";

    EXPECT_EQ(serialize(value, indented(0, false)), "{\n    \"k\":\"v\"\n}");
}

TEST(OrderedMapSerializerTest, EmptyObject) {
    EXPECT_EQ(serialize(json::object(), indented(2)), "{}");
    EXPECT_EQ(serialize(json::object(), SerializeOptions{}), "{}");
}

TEST(OrderedMapSerializerTest, EscapesKeysAndStrings) {
    json value = json::object();
    value["quote\"key"] = "line\nbreak";

    EXPECT_EQ(serialize(value, SerializeOptions{}), "{\"quote\\\"key\":\"line\\nbreak\"}");
}

TEST(OrderedMapSerializerTest, OutputParsesBackInOrder) {
    json value = json::object();
    value["zeta"] = json::object();
    value["zeta"]["description"] = "last letter";
    value["alpha"] = json::array({1, 2, 3});

    json parsed = json::parse(serialize(value, indented(1)));
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed.begin().key(), "zeta");
    EXPECT_EQ(parsed, value);
}

TEST(OrderedMapSerializerTest, RejectsNonObject) {
    EXPECT_THROW(serialize(json::array(), SerializeOptions{}), std::invalid_argument);
}
