#include <gtest/gtest.h>
#include <string>

#include "toon/toon.hpp"
#include "test_helpers.hpp"

using namespace toon;

TEST(Parser, ScalarProperties)
{
    auto r = parse("name: Alice\nage: 30\nactive: true\nretired: false\nnothing: null");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    ASSERT_EQ(r.properties().size(), 5u);

    EXPECT_EQ(str_of(value_of(r.document(), "name")), "Alice");
    const number_value* age = as_number(value_of(r.document(), "age"));
    ASSERT_NE(age, nullptr);
    EXPECT_DOUBLE_EQ(age->value, 30.0);
    EXPECT_TRUE(age->is_integer);
    EXPECT_EQ(age->raw, "30");
    EXPECT_TRUE(as_bool(value_of(r.document(), "active"))->value);
    EXPECT_FALSE(as_bool(value_of(r.document(), "retired"))->value);
    EXPECT_TRUE(is_null(value_of(r.document(), "nothing")));
}

TEST(Parser, NumberForms)
{
    auto r = parse("pi: 3.14\nneg: -15\nsci: 2.5E3\nbig: 999999999999999\nzero: 0");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_FALSE(as_number(value_of(r.document(), "pi"))->is_integer);
    EXPECT_DOUBLE_EQ(as_number(value_of(r.document(), "pi"))->value, 3.14);
    EXPECT_TRUE(as_number(value_of(r.document(), "neg"))->is_integer);
    EXPECT_DOUBLE_EQ(as_number(value_of(r.document(), "sci"))->value, 2500.0);
    EXPECT_DOUBLE_EQ(as_number(value_of(r.document(), "big"))->value, 999999999999999.0);
    EXPECT_DOUBLE_EQ(as_number(value_of(r.document(), "zero"))->value, 0.0);
}

TEST(Parser, LeadingZeroValueIsString)
{
    auto r = parse("value: 05");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_EQ(str_of(value_of(r.document(), "value")), "05");

    auto z = parse("value: 0");
    const number_value* n = as_number(value_of(z.document(), "value"));
    ASSERT_NE(n, nullptr);
    EXPECT_DOUBLE_EQ(n->value, 0.0);
}

TEST(Parser, NestedObjects)
{
    auto r = parse("server:\n  host: localhost\n  port: 8080\n  tls:\n    enabled: true\nname: app");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    ASSERT_EQ(r.properties().size(), 2u);
    const object* server = as_object(value_of(r.document(), "server"));
    ASSERT_NE(server, nullptr);
    EXPECT_EQ(server->properties.size(), 3u);
    EXPECT_DOUBLE_EQ(as_number(value_at(r.document(), "server.port"))->value, 8080.0);
    EXPECT_TRUE(as_bool(value_at(r.document(), "server.tls.enabled"))->value);
}

TEST(Parser, KeyWithoutValueIsEmptyObject)
{
    auto r = parse("config:\nnext: 1");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    const object* o = as_object(value_of(r.document(), "config"));
    ASSERT_NE(o, nullptr);
    EXPECT_TRUE(o->properties.empty());
}

TEST(Parser, MultiWordValuesAreJoined)
{
    auto r = parse("city: New York\n"
                   "note: This is important (see page 42)\n"
                   "name: Dr. John Smith Jr.\n"
                   "spaced: a   b\n"
                   "email: user@example.com\n"
                   "time: 10:30");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_EQ(str_of(value_of(r.document(), "city")), "New York");
    EXPECT_EQ(str_of(value_of(r.document(), "note")), "This is important (see page 42)");
    EXPECT_EQ(str_of(value_of(r.document(), "name")), "Dr. John Smith Jr.");
    EXPECT_EQ(str_of(value_of(r.document(), "spaced")), "a   b");
    EXPECT_EQ(str_of(value_of(r.document(), "email")), "user@example.com");
    EXPECT_EQ(str_of(value_of(r.document(), "time")), "10:30");
}

TEST(Parser, TrailingCommentIsNotPartOfValue)
{
    auto r = parse("port: 8080 # default\ncity: New York // big");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_DOUBLE_EQ(as_number(value_of(r.document(), "port"))->value, 8080.0);
    EXPECT_EQ(str_of(value_of(r.document(), "city")), "New York");
}

TEST(Parser, QuotedKeysAndValues)
{
    auto r = parse("\"my key\": \"It's a wonderful day\"\n'other': 'x'");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_EQ(str_of(value_of(r.document(), "my key")), "It's a wonderful day");
    EXPECT_EQ(str_of(value_of(r.document(), "other")), "x");
    const string_value* s = as_string(value_of(r.document(), "other"));
    EXPECT_EQ(s->raw, "'x'");
}

TEST(Parser, QuotedKeywordIsString)
{
    auto r = parse("flag: \"true\"");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_EQ(str_of(value_of(r.document(), "flag")), "true");
}

TEST(Parser, DuplicateKeysAreKept)
{
    auto r = parse("a: 1\na: 2");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_EQ(r.properties().size(), 2u);
    EXPECT_DOUBLE_EQ(as_number(value_of(r.document(), "a"))->value, 2.0);
}

TEST(Parser, PropertyIndentAndSpan)
{
    auto r = parse("root:\n  child: x");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    const object* root = as_object(value_of(r.document(), "root"));
    ASSERT_NE(root, nullptr);
    ASSERT_EQ(root->properties.size(), 1u);
    const node& child = *root->properties[0];
    EXPECT_EQ(as_property(child)->indent_level, 2u);
    EXPECT_EQ(child.span.start_line, 2);
    EXPECT_EQ(child.span.start_column, 3);
    EXPECT_EQ(child.span.end_column, 11);
    EXPECT_EQ(child.span.end_offset, 16u);
}

TEST(Parser, KeywordAndNumberKeys)
{
    auto r = parse("null: a\n1: b");
    ASSERT_TRUE(r.is_success()) << dump_errors(r);
    EXPECT_EQ(str_of(value_of(r.document(), "null")), "a");
    EXPECT_EQ(str_of(value_of(r.document(), "1")), "b");
}

TEST(Parser, ResultKeepsTokens)
{
    auto r = parse("a: 1");
    ASSERT_FALSE(r.tokens().empty());
    EXPECT_EQ(r.tokens().back().kind, token_kind::end_of_input);
}

TEST(Parser, TryParseReportsRecordedErrorsAsSucceeded)
{
    ParseResult out;
    EXPECT_TRUE(try_parse("a 1", out));
    EXPECT_FALSE(out.is_success());
    EXPECT_TRUE(out.has_errors());
}
