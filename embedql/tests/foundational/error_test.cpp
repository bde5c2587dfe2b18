// Error taxonomy tests

#include "common/error.hpp"

#include <gtest/gtest.h>

using namespace embedql;

TEST(ErrorTest, FactoriesSetKind) {
    EXPECT_EQ(Error::precondition("x").kind, ErrorKind::Precondition);
    EXPECT_EQ(Error::malformed("x", "a.js").kind, ErrorKind::MalformedLiteral);
    EXPECT_EQ(Error::extraction("x", "a.js").kind, ErrorKind::Extraction);
    EXPECT_EQ(Error::io("x", "a.js").kind, ErrorKind::IO);
}

TEST(ErrorTest, ToStringWithLocation) {
    auto err = Error::malformed("Syntax Error: Expected Name, found <EOF>.", "src/Foo.js",
                                SourceLocation{3, 14, 40});
    EXPECT_EQ(err.to_string(),
              "src/Foo.js:3:14: malformed literal: Syntax Error: Expected Name, found <EOF>.");
}

TEST(ErrorTest, ToStringWithoutLocation) {
    auto err = Error::io("No such file: /p/a.js", "a.js");
    EXPECT_EQ(err.to_string(), "a.js: io error: No such file: /p/a.js");
}

TEST(ErrorTest, ToStringWithoutFile) {
    auto err = Error::precondition("bad call");
    EXPECT_EQ(err.to_string(), "precondition violation: bad call");
}

TEST(ErrorTest, KindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::Extraction), "extraction error");
    EXPECT_STREQ(error_kind_name(ErrorKind::MalformedLiteral), "malformed literal");
}
