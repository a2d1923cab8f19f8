#include <marksync/error.hpp>

#include <gtest/gtest.h>

using namespace marksync;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::not_found),         "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_field),     "unknown_field");
    EXPECT_EQ(to_string_view(ErrorKind::causality_gap),     "causality_gap");
    EXPECT_EQ(to_string_view(ErrorKind::storage_failure),   "storage_failure");
    EXPECT_EQ(to_string_view(ErrorKind::fatal_mismatch),    "fatal_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::encoding_error),    "encoding_error");
    EXPECT_EQ(to_string_view(ErrorKind::decoding_error),    "decoding_error");
    EXPECT_EQ(to_string_view(ErrorKind::sync_error),        "sync_error");
    EXPECT_EQ(to_string_view(ErrorKind::transport_failure), "transport_failure");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_config),    "invalid_config");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::not_found, "no such bookmark"};
    const auto e2 = Error{ErrorKind::not_found, "no such bookmark"};
    const auto e3 = Error{ErrorKind::causality_gap, "no such bookmark"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    EXPECT_NE((Error{ErrorKind::sync_error, "foo"}), (Error{ErrorKind::sync_error, "bar"}));
}

TEST(Error, retryable_kinds) {
    EXPECT_TRUE((Error{ErrorKind::causality_gap, ""}).retryable());
    EXPECT_TRUE((Error{ErrorKind::transport_failure, ""}).retryable());
    EXPECT_TRUE((Error{ErrorKind::storage_failure, ""}).retryable());
    EXPECT_FALSE((Error{ErrorKind::not_found, ""}).retryable());
    EXPECT_FALSE((Error{ErrorKind::sync_error, ""}).retryable());
}

TEST(Exception, carries_the_error) {
    try {
        throw Exception{ErrorKind::storage_failure, "disk full"};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "storage_failure: disk full");
        const auto* ex = dynamic_cast<const Exception*>(&e);
        ASSERT_NE(ex, nullptr);
        EXPECT_EQ(ex->kind(), ErrorKind::storage_failure);
        EXPECT_EQ(ex->error().message, "disk full");
    }
}

TEST(FatalMismatch, is_a_logic_error) {
    EXPECT_THROW(throw FatalMismatch{"ids differ"}, std::logic_error);
}
