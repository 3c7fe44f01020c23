#include <gtest/gtest.h>
#include "check_validator.hpp"
#include "../utils/mocks.hpp"

namespace {
constexpr int kMaxTimeout = 5;
}

TEST(CheckValidatorTest, AcceptsWellFormedCheck) {
    EXPECT_TRUE(validate_check(make_check("chk1"), kMaxTimeout).ok());

    Check root = make_check("chk2");
    root.protocol = "http";
    root.path = "";
    root.method = "delete";
    EXPECT_TRUE(validate_check(root, kMaxTimeout).ok());
}

TEST(CheckValidatorTest, RejectsMissingId) {
    Check check = make_check("");
    EXPECT_EQ(validate_check(check, kMaxTimeout).kind, ErrorKind::Validation);
}

TEST(CheckValidatorTest, RejectsUnknownProtocol) {
    Check check = make_check("chk1");
    check.protocol = "ftp";
    Status status = validate_check(check, kMaxTimeout);
    EXPECT_EQ(status.kind, ErrorKind::Validation);
    EXPECT_NE(status.message.find("ftp"), std::string::npos);
}

TEST(CheckValidatorTest, RejectsMissingHostAndRelativePath) {
    Check no_host = make_check("chk1");
    no_host.host.clear();
    EXPECT_FALSE(validate_check(no_host, kMaxTimeout).ok());

    Check relative = make_check("chk1");
    relative.path = "health";
    EXPECT_FALSE(validate_check(relative, kMaxTimeout).ok());
}

TEST(CheckValidatorTest, RejectsUnsupportedMethod) {
    Check check = make_check("chk1");
    check.method = "patch";
    EXPECT_FALSE(validate_check(check, kMaxTimeout).ok());
}

TEST(CheckValidatorTest, TimeoutMustBeWithinBounds) {
    Check check = make_check("chk1");

    check.timeout_seconds = 0;
    EXPECT_FALSE(validate_check(check, kMaxTimeout).ok());

    check.timeout_seconds = kMaxTimeout;
    EXPECT_TRUE(validate_check(check, kMaxTimeout).ok());

    check.timeout_seconds = kMaxTimeout + 1;
    EXPECT_FALSE(validate_check(check, kMaxTimeout).ok());
}

TEST(CheckValidatorTest, SuccessCodesMustBeNonEmptyHttpStatuses) {
    Check empty = make_check("chk1", {});
    EXPECT_FALSE(validate_check(empty, kMaxTimeout).ok());

    Check out_of_range = make_check("chk1", {200, 700});
    EXPECT_FALSE(validate_check(out_of_range, kMaxTimeout).ok());
}

TEST(CheckValidatorTest, RejectsNegativeLastChecked) {
    Check check = make_check("chk1");
    check.last_checked = -1;
    EXPECT_FALSE(validate_check(check, kMaxTimeout).ok());
}
