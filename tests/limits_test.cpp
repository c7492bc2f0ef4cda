#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "toon/toon.hpp"
#include "test_helpers.hpp"

using namespace toon;

// Objects nested `levels` deep: l0:\n  l1:\n    l2: ... with a scalar at the bottom.
static std::string nested_objects(int levels)
{
    std::string out;
    for (int i = 0; i < levels; ++i)
        out += std::string(static_cast<std::size_t>(i) * 2, ' ') + "l" + std::to_string(i) + ":\n";
    out += std::string(static_cast<std::size_t>(levels) * 2, ' ') + "leaf: 1\n";
    return out;
}

TEST(Limits, OversizeInputThrows)
{
    ParserOptions opts;
    opts.max_input_size = 16;
    std::string src(64, 'a');
    try
    {
        parse(src, opts);
        FAIL() << "expected input_error";
    }
    catch (const input_error& e)
    {
        std::string what = e.what();
        EXPECT_NE(what.find("exceeds maximum allowed size"), std::string::npos) << what;
        EXPECT_NE(what.find("ParserOptions"), std::string::npos) << what;
        EXPECT_EQ(what.find("stack"), std::string::npos) << what;
    }
}

TEST(Limits, TryParseReportsOversizeInput)
{
    ParserOptions opts;
    opts.max_input_size = 4;
    ParseResult out;
    EXPECT_FALSE(try_parse(std::string_view("name: value"), out, opts));
    ASSERT_EQ(out.errors().size(), 1u);
    EXPECT_EQ(out.errors()[0].code, codes::input_too_large);
    EXPECT_TRUE(out.properties().empty());
}

TEST(Limits, NullSource)
{
    const char* src = nullptr;
    EXPECT_THROW(parse(src), input_error);

    ParseResult out;
    EXPECT_FALSE(try_parse(src, out));
    ASSERT_EQ(out.errors().size(), 1u);
    EXPECT_EQ(out.errors()[0].code, codes::null_source);
}

TEST(Limits, InputAtLimitIsAccepted)
{
    ParserOptions opts;
    opts.max_input_size = 4;
    EXPECT_NO_THROW(parse("a: 1", opts));
}

TEST(Limits, TokenCountStopsLexing)
{
    ParserOptions opts;
    opts.max_token_count = 10;
    auto r = parse("a: 1\nb: 2\nc: 3\nd: 4", opts);
    ASSERT_EQ(count_code(r, codes::token_limit), 1u) << dump_errors(r);
    EXPECT_EQ(r.errors().size(), 1u) << dump_errors(r);
    EXPECT_EQ(r.properties().size(), 2u);
    EXPECT_EQ(r.tokens().size(), 11u);
}

TEST(Limits, StringLength)
{
    ParserOptions opts;
    opts.max_string_length = 5;

    auto quoted = parse("a: \"abcdefgh\"", opts);
    ASSERT_EQ(quoted.errors().size(), 1u) << dump_errors(quoted);
    EXPECT_EQ(quoted.errors()[0].code, codes::string_length_limit);
    EXPECT_EQ(quoted.errors()[0].message, "String length 8 exceeds maximum allowed length of 5");

    auto bare = parse("a: abcdefgh", opts);
    ASSERT_EQ(bare.errors().size(), 1u) << dump_errors(bare);
    EXPECT_EQ(bare.errors()[0].message, "Unquoted string length 8 exceeds maximum allowed length of 5");

    auto key = parse("abcdefgh: 1", opts);
    ASSERT_EQ(key.errors().size(), 1u) << dump_errors(key);
    EXPECT_EQ(key.errors()[0].message, "Identifier length 8 exceeds maximum allowed length of 5");
    EXPECT_TRUE(find_property(key.document(), "abcdefgh").has_value());
}

TEST(Limits, NestingDepthKeepsOuterLevels)
{
    ParserOptions opts;
    opts.max_nesting_depth = 2;
    auto r = parse("outer:\n  middle:\n    inner:\n      x: 1", opts);
    ASSERT_GE(count_code(r, codes::depth_limit), 1u) << dump_errors(r);
    EXPECT_EQ(first_error(r, codes::depth_limit)->message, "Maximum nesting depth of 2 exceeded");
    EXPECT_NE(as_object(value_at(r.document(), "outer.middle")), nullptr);
    EXPECT_TRUE(is_null(value_at(r.document(), "outer.middle.inner")));
}

TEST(Limits, NestingWithinDefaultLimit)
{
    auto r = parse(nested_objects(10));
    EXPECT_TRUE(r.is_success()) << dump_errors(r);
}

TEST(Limits, NestingCountsArrayBodies)
{
    ParserOptions opts;
    opts.max_nesting_depth = 1;

    auto flat = parse("items[2]:\n  - x\n  - y", opts);
    EXPECT_TRUE(flat.is_success()) << dump_errors(flat);

    auto deep = parse("list[1]:\n  - [1]:\n    - z", opts);
    ASSERT_EQ(deep.errors().size(), 1u) << dump_errors(deep);
    EXPECT_EQ(deep.errors()[0].code, codes::depth_limit);
    const array* list = as_array(value_of(deep.document(), "list"));
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->elements.size(), 1u);
    EXPECT_TRUE(as_array(*list->elements[0])->elements.empty());
}

TEST(Limits, NestingCountsListItemObjects)
{
    ParserOptions opts;
    opts.max_nesting_depth = 1;

    auto keyed = parse("items[2]:\n  - a: 1\n    b: 2\n  - c: 3\nnext: 1", opts);
    ASSERT_EQ(count_code(keyed, codes::depth_limit), 2u) << dump_errors(keyed);
    EXPECT_EQ(keyed.errors().size(), 2u);
    const array* items = as_array(value_of(keyed.document(), "items"));
    ASSERT_NE(items, nullptr);
    ASSERT_EQ(items->elements.size(), 2u);
    EXPECT_TRUE(is_null(*items->elements[0]));
    EXPECT_EQ(keyed.properties().size(), 2u);

    auto bare = parse("items[1]:\n  -\n    a: 1", opts);
    ASSERT_EQ(bare.errors().size(), 1u) << dump_errors(bare);
    EXPECT_EQ(bare.errors()[0].code, codes::depth_limit);

    opts.max_nesting_depth = 2;
    EXPECT_TRUE(parse("items[2]:\n  - a: 1\n    b: 2\n  - c: 3", opts).is_success());
}

TEST(Limits, UnlimitedOptionsAllowDeepNesting)
{
    std::string src = nested_objects(150);
    auto limited = parse(src);
    EXPECT_GE(count_code(limited, codes::depth_limit), 1u);

    auto r = parse(src, ParserOptions::unlimited());
    EXPECT_TRUE(r.is_success()) << dump_errors(r);
}

TEST(Limits, DeclaredArraySize)
{
    ParserOptions opts;
    opts.max_array_size = 10;
    auto r = parse("items[15]: a\nnext: 1", opts);
    ASSERT_EQ(r.errors().size(), 1u) << dump_errors(r);
    EXPECT_EQ(r.errors()[0].code, codes::array_size_limit);
    EXPECT_EQ(r.errors()[0].message, "Array size 15 exceeds maximum allowed size of 10");
    ASSERT_EQ(r.properties().size(), 1u);
    EXPECT_EQ(as_property(*r.properties()[0])->key, "next");
}

TEST(Limits, HugeDeclaredSizes)
{
    auto r = parse("items[2147483647]: a");
    EXPECT_EQ(count_code(r, codes::array_size_limit), 1u) << dump_errors(r);

    auto overflow = parse("items[99999999999999999999999]: a");
    ASSERT_EQ(count_code(overflow, codes::array_size_limit), 1u) << dump_errors(overflow);
    EXPECT_NE(first_error(overflow, codes::array_size_limit)->message.find("99999999999999999999999"), std::string::npos);
}

TEST(Limits, ActualElementCount)
{
    ParserOptions opts;
    opts.max_array_size = 3;
    auto r = parse("items[3]: a,b,c,d,e", opts);
    EXPECT_EQ(count_code(r, codes::array_size_limit), 1u) << dump_errors(r);
    EXPECT_EQ(count_code(r, codes::array_size_mismatch), 1u);
}

TEST(Limits, ZeroLimitIsRejected)
{
    ParserOptions opts;
    opts.max_nesting_depth = 0;
    EXPECT_THROW(parse("a: 1", opts), std::invalid_argument);
    EXPECT_THROW(tokenize("a: 1", opts), std::invalid_argument);
}

TEST(Limits, TryParseReportsZeroLimit)
{
    ParserOptions opts;
    opts.max_token_count = 0;
    ParseResult out;
    EXPECT_FALSE(try_parse("a: 1", out, opts));
    ASSERT_EQ(out.errors().size(), 1u);
    EXPECT_EQ(out.errors()[0].code, codes::invalid_options);
    EXPECT_NE(out.errors()[0].message.find("max_token_count"), std::string::npos);
    EXPECT_TRUE(out.properties().empty());
}
