#include "gtest/gtest.h"
#include "jsonedit++/spec_scanner.h"
#include "jsonedit++/exceptions.h"

using namespace jsonedit;
using PathStep = SpecScanner::PathStep;

TEST(SpecScannerTest, EmptySpecHasNoStep) {
    SpecScanner scanner("");
    EXPECT_TRUE(scanner.at_end());
    EXPECT_THROW(scanner.next(), SpecSyntaxException);
}

TEST(SpecScannerTest, SingleMember) {
    SpecScanner scanner(".key_1");
    PathStep step = scanner.next();
    EXPECT_EQ(step.type, PathStep::Type::MEMBER);
    EXPECT_EQ(step.member_name, "key_1");
    EXPECT_EQ(step.offset, 0u);
    EXPECT_TRUE(step.is_final);
    EXPECT_TRUE(scanner.at_end());
}

TEST(SpecScannerTest, MemberChain) {
    SpecScanner scanner(".a.bc.d");
    PathStep first = scanner.next();
    EXPECT_EQ(first.member_name, "a");
    EXPECT_FALSE(first.is_final);
    EXPECT_EQ(scanner.offset(), 2u);
    EXPECT_EQ(scanner.remainder(), ".bc.d");

    PathStep second = scanner.next();
    EXPECT_EQ(second.member_name, "bc");
    EXPECT_EQ(second.offset, 2u);
    EXPECT_FALSE(second.is_final);

    PathStep third = scanner.next();
    EXPECT_EQ(third.member_name, "d");
    EXPECT_EQ(third.offset, 5u);
    EXPECT_TRUE(third.is_final);
}

TEST(SpecScannerTest, ArrayIndex) {
    SpecScanner scanner("[123]");
    PathStep step = scanner.next();
    EXPECT_EQ(step.type, PathStep::Type::INDEX);
    EXPECT_EQ(step.index, 123);
    EXPECT_TRUE(step.is_final);
}

TEST(SpecScannerTest, NegativeArrayIndex) {
    SpecScanner scanner("[-2].x");
    PathStep step = scanner.next();
    EXPECT_EQ(step.type, PathStep::Type::INDEX);
    EXPECT_EQ(step.index, -2);
    EXPECT_FALSE(step.is_final);

    PathStep member = scanner.next();
    EXPECT_EQ(member.member_name, "x");
    EXPECT_EQ(member.offset, 4u);
}

TEST(SpecScannerTest, AppendMarkerAsFinalStep) {
    SpecScanner scanner(".list[]");
    scanner.next();
    PathStep step = scanner.next();
    EXPECT_EQ(step.type, PathStep::Type::APPEND);
    EXPECT_EQ(step.offset, 5u);
    EXPECT_TRUE(step.is_final);
}

TEST(SpecScannerTest, AppendMarkerMustBeLast) {
    SpecScanner scanner("[].a");
    try {
        scanner.next();
        FAIL() << "Expected SpecSyntaxException";
    } catch (const SpecSyntaxException& e) {
        EXPECT_EQ(e.offset(), 0u);
        EXPECT_EQ(e.remainder(), "[].a");
        EXPECT_EQ(e.error_code(), ErrorCode::SPEC_SYNTAX);
    }
}

TEST(SpecScannerTest, MemberNameStopsAtForeignCharacter) {
    SpecScanner scanner(".a-b");
    PathStep step = scanner.next();
    EXPECT_EQ(step.member_name, "a");
    EXPECT_FALSE(step.is_final);
    try {
        scanner.next();
        FAIL() << "Expected SpecSyntaxException";
    } catch (const SpecSyntaxException& e) {
        EXPECT_EQ(e.offset(), 2u);
        EXPECT_EQ(e.remainder(), "-b");
    }
}

TEST(SpecScannerTest, InvalidSyntax) {
    EXPECT_THROW(SpecScanner("a").next(), SpecSyntaxException);       // Missing '.'
    EXPECT_THROW(SpecScanner(".").next(), SpecSyntaxException);       // Missing name
    EXPECT_THROW(SpecScanner("..a").next(), SpecSyntaxException);
    EXPECT_THROW(SpecScanner("[").next(), SpecSyntaxException);
    EXPECT_THROW(SpecScanner("[1").next(), SpecSyntaxException);
    EXPECT_THROW(SpecScanner("[a]").next(), SpecSyntaxException);
    EXPECT_THROW(SpecScanner("[-]").next(), SpecSyntaxException);
    EXPECT_THROW(SpecScanner("[ 1]").next(), SpecSyntaxException);
    EXPECT_THROW(SpecScanner("['key']").next(), SpecSyntaxException);
}

TEST(SpecScannerTest, MemberNamesAreAsciiOnly) {
    SpecScanner scanner(".k\xC3\xA4y"); // "käy"
    PathStep step = scanner.next();
    EXPECT_EQ(step.member_name, "k");
    EXPECT_FALSE(step.is_final);
    EXPECT_THROW(scanner.next(), SpecSyntaxException);
}

TEST(SpecScannerTest, IndexNotRepresentable) {
    SpecScanner scanner("[99999999999999999999]");
    EXPECT_THROW(scanner.next(), SpecSyntaxException);
}
