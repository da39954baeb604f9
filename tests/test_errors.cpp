#include "objdet/errors.hpp"

#include <gtest/gtest.h>

using namespace objdet;

TEST(ErrorsTest, KindsMapToHttpStatus) {
    EXPECT_EQ(httpStatusFor(ErrorKind::ServiceUnavailable), 503);
    EXPECT_EQ(httpStatusFor(ErrorKind::NotReady), 503);
    EXPECT_EQ(httpStatusFor(ErrorKind::InvalidParameter), 422);
    EXPECT_EQ(httpStatusFor(ErrorKind::Decode), 400);
    EXPECT_EQ(httpStatusFor(ErrorKind::InvalidUpload), 400);
    EXPECT_EQ(httpStatusFor(ErrorKind::PayloadTooLarge), 413);
    EXPECT_EQ(httpStatusFor(ErrorKind::UnknownClass), 500);
    EXPECT_EQ(httpStatusFor(ErrorKind::Contract), 500);
    EXPECT_EQ(httpStatusFor(ErrorKind::Load), 500);
    EXPECT_EQ(httpStatusFor(ErrorKind::Internal), 500);
}

TEST(ErrorsTest, SubclassesCarryTheirKind) {
    EXPECT_EQ(DecodeError("x").kind(), ErrorKind::Decode);
    EXPECT_EQ(LoadError("x").kind(), ErrorKind::Load);
    EXPECT_EQ(ServiceUnavailableError("x").httpStatus(), 503);
    EXPECT_EQ(InvalidParameterError("x").httpStatus(), 422);

    try {
        throw UnknownClassError("class 99");
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownClass);
        EXPECT_STREQ(e.what(), "class 99");
    }
}

TEST(ErrorsTest, KindNames) {
    EXPECT_STREQ(errorKindName(ErrorKind::ServiceUnavailable), "service_unavailable");
    EXPECT_STREQ(errorKindName(ErrorKind::InvalidParameter), "invalid_parameter");
}
