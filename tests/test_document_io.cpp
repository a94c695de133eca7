#include "gtest/gtest.h"
#include "jsonedit++/document_io.h"
#include "jsonedit++/exceptions.h"
#include <sstream>

using namespace jsonedit;

TEST(DocumentIOTest, ParsePreservesMemberOrder) {
    json doc = parse_document(R"({"z": 1, "a": 2, "m": 3})");
    EXPECT_EQ(serialize_document(doc), R"({"z":1,"a":2,"m":3})");
}

TEST(DocumentIOTest, ParseFromStream) {
    std::istringstream in("[1, 2.5, \"x\", null, true]");
    json doc = parse_document(in);
    ASSERT_TRUE(doc.is_array());
    EXPECT_EQ(doc.size(), 5u);
    EXPECT_EQ(serialize_document(doc), R"([1,2.5,"x",null,true])");
}

TEST(DocumentIOTest, LenientParseSkipsComments) {
    ParseOptions options;
    options.lenient = true;
    json doc = parse_document("{ /* block */ \"a\": 1 // line\n }", options);
    EXPECT_EQ(doc["a"], 1);

    std::istringstream in("[1, /* two */ 2]");
    EXPECT_EQ(parse_document(in, options), json::array({1, 2}));
}

TEST(DocumentIOTest, StrictParseRejectsComments) {
    EXPECT_THROW(parse_document("{ /* block */ \"a\": 1 }"), JsonParsingException);
    std::istringstream in("[1] // trailing");
    EXPECT_THROW(parse_document(in), JsonParsingException);
}

TEST(DocumentIOTest, ParseScalars) {
    EXPECT_EQ(parse_document("\"d\""), "d");
    EXPECT_EQ(parse_document("-7"), -7);
    EXPECT_TRUE(parse_document("null").is_null());
}

TEST(DocumentIOTest, ParseErrors) {
    EXPECT_THROW(parse_document(""), JsonParsingException);
    EXPECT_THROW(parse_document("{\"a\": }"), JsonParsingException);
    EXPECT_THROW(parse_document("[1, 2] trailing"), JsonParsingException);
    try {
        parse_document("unquoted");
        FAIL() << "Expected JsonParsingException";
    } catch (const JsonParsingException& e) {
        EXPECT_EQ(e.error_code(), ErrorCode::JSON_PARSING_ERROR);
        EXPECT_EQ(std::string(e.what()).rfind("JSON Parsing Error: ", 0), 0u);
    }
}

TEST(DocumentIOTest, WriteCompactByDefault) {
    std::ostringstream out;
    write_document(out, parse_document(R"({ "a" : [ 1, 2 ] })"));
    EXPECT_EQ(out.str(), R"({"a":[1,2]})");
}

TEST(DocumentIOTest, WriteIndented) {
    OutputOptions options;
    options.pretty_printing = true;
    options.indent = 4;
    EXPECT_EQ(serialize_document(parse_document(R"({"a": 1})"), options), "{\n    \"a\": 1\n}");
}
