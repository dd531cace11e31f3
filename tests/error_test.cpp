#include <folio-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace folio_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_position),  "invalid_position");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_content),   "invalid_content");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_schema),    "invalid_schema");
    EXPECT_EQ(to_string_view(ErrorKind::step_failed),       "step_failed");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_selection), "invalid_selection");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_json),      "invalid_json");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation), "invalid_operation");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::invalid_position, "out of range"};
    const auto e2 = Error{ErrorKind::invalid_position, "out of range"};
    const auto e3 = Error{ErrorKind::invalid_content, "out of range"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::step_failed, "foo"};
    const auto e2 = Error{ErrorKind::step_failed, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_the_structured_error) {
    const auto ex = Exception{ErrorKind::invalid_json, "missing field"};

    EXPECT_EQ(ex.kind(), ErrorKind::invalid_json);
    EXPECT_EQ(ex.error().message, "missing field");
    EXPECT_STREQ(ex.what(), "missing field");
}

TEST(Exception, is_a_runtime_error) {
    try {
        throw Exception{ErrorKind::invalid_operation, "stale"};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "stale");
        return;
    }
    FAIL() << "exception was not caught as std::runtime_error";
}
