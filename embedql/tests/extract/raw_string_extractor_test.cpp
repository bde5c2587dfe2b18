// Raw string extractor tests

#include "extract/raw_string_extractor.hpp"

#include <gtest/gtest.h>

using namespace embedql;
using namespace embedql::extract;

class RawStringExtractorTest : public ::testing::Test {
protected:
    RawStringExtractor extractor;

    Result<std::vector<LiteralSpan>, Error> run(const std::string& text,
                                                bool validate_names = false) {
        source::File file{"app/UserView.cpp"};
        return extractor.extract(text, "/project", file, ExtractionOptions{validate_names});
    }
};

TEST_F(RawStringExtractorTest, ExtractsGraphqlDelimitedLiteral) {
    auto result = run("constexpr auto Q = R\"graphql(query UserViewQuery { id })graphql\";\n");
    ASSERT_TRUE(is_ok(result));
    const auto& spans = unwrap(result);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].text, "query UserViewQuery { id }");
    EXPECT_EQ(spans[0].tag, "graphql");
    EXPECT_EQ(spans[0].file, "app/UserView.cpp");
    EXPECT_EQ(spans[0].start.line, 1u);
    EXPECT_EQ(spans[0].start.column, 30u);
}

TEST_F(RawStringExtractorTest, EncodingPrefixes) {
    auto result = run("auto a = u8R\"graphql(fragment UserView_a on T { a })graphql\";\n"
                      "auto b = LR\"graphql(fragment UserView_b on T { b })graphql\";\n");
    ASSERT_TRUE(is_ok(result));
    const auto& spans = unwrap(result);
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[1].text, "fragment UserView_b on T { b }");
    EXPECT_EQ(spans[1].start.line, 2u);
}

TEST_F(RawStringExtractorTest, SkipsOtherLiterals) {
    auto result = run("// R\"graphql(query A { a })graphql\"\n"
                      "/* R\"graphql(query B { b })graphql\" */\n"
                      "const char* s = \"R\\\"graphql(query C { c })graphql\\\"\";\n"
                      "auto sql = R\"sql(SELECT 'graphql(' FROM t)sql\";\n"
                      "int n = 1'000'000; char q = '\"';\n"
                      "auto x = R\"graphql(fragment UserView_x on T { x })graphql\";\n");
    ASSERT_TRUE(is_ok(result));
    const auto& spans = unwrap(result);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].text, "fragment UserView_x on T { x }");
}

TEST_F(RawStringExtractorTest, OtherDelimiterMayContainGraphqlTerminator) {
    auto result = run("auto doc = R\"md(see R\"graphql( ... )graphql\" in docs)md\";\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).empty());
}

TEST_F(RawStringExtractorTest, MultiLineLiteral) {
    auto result = run("auto q = R\"graphql(\n  query UserViewQuery {\n    viewer { id }\n  }\n)graphql\";");
    ASSERT_TRUE(is_ok(result));
    const auto& spans = unwrap(result);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].text, "\n  query UserViewQuery {\n    viewer { id }\n  }\n");
}

TEST_F(RawStringExtractorTest, UnterminatedLiteral) {
    auto result = run("\nauto q = R\"graphql(query UserViewQuery { id }\";\n");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, ErrorKind::Extraction);
    EXPECT_EQ(err.message, "Unterminated raw string literal `R\"graphql(`.");
    ASSERT_TRUE(err.location.has_value());
    EXPECT_EQ(err.location->line, 2u);
    EXPECT_EQ(err.location->column, 10u);
}

TEST_F(RawStringExtractorTest, NamesValidatedAgainstFileStem) {
    auto good = run("auto q = R\"graphql(query UserViewQuery { id })graphql\";", true);
    EXPECT_TRUE(is_ok(good));

    auto bad = run("auto q = R\"graphql(query OtherQuery { id })graphql\";", true);
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).kind, ErrorKind::Extraction);
}
