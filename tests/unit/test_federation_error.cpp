#include <gtest/gtest.h>
#include "fedtrust/federation/federation_error.hpp"

using namespace fedtrust::federation;

TEST(FederationErrorTest, DefaultResultIsSuccess) {
    FederationResult result;
    
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.error_class(), ErrorClass::None);
    EXPECT_EQ(result.describe(), "SUCCESS");
}

TEST(FederationErrorTest, DescribeIncludesMessage) {
    FederationResult result(FederationError::DNS_TIMEOUT, "example.org did not answer");
    
    EXPECT_FALSE(result);
    EXPECT_EQ(result.describe(), "DNS_TIMEOUT: example.org did not answer");
}

TEST(FederationErrorTest, Classification) {
    EXPECT_EQ(classify(FederationError::INVALID_SERVER_NAME), ErrorClass::Encoding);
    EXPECT_EQ(classify(FederationError::INVALID_JSON), ErrorClass::Encoding);
    
    EXPECT_EQ(classify(FederationError::INVALID_SIGNATURE), ErrorClass::Crypto);
    EXPECT_EQ(classify(FederationError::CONTENT_HASH_MISMATCH), ErrorClass::Crypto);
    
    EXPECT_EQ(classify(FederationError::DNS_FAILURE), ErrorClass::Network);
    EXPECT_EQ(classify(FederationError::DNS_TIMEOUT), ErrorClass::Network);
    EXPECT_EQ(classify(FederationError::NO_SERVER_FOUND), ErrorClass::Network);
    EXPECT_EQ(classify(FederationError::HTTP_FAILURE), ErrorClass::Network);
    EXPECT_EQ(classify(FederationError::INVALID_RESPONSE), ErrorClass::Network);
    EXPECT_EQ(classify(FederationError::WELL_KNOWN_FAILURE), ErrorClass::Network);
    EXPECT_EQ(classify(FederationError::STORAGE_FAILURE), ErrorClass::Network);
    
    EXPECT_EQ(classify(FederationError::KEY_NOT_FOUND), ErrorClass::Trust);
    EXPECT_EQ(classify(FederationError::KEY_EXPIRED), ErrorClass::Trust);
    EXPECT_EQ(classify(FederationError::UNTRUSTED_KEY_BUNDLE), ErrorClass::Trust);
    EXPECT_EQ(classify(FederationError::SERVER_NAME_MISMATCH), ErrorClass::Trust);
    
    EXPECT_EQ(classify(FederationError::BACKOFF), ErrorClass::Policy);
}

TEST(FederationErrorTest, Names) {
    EXPECT_STREQ(to_string(FederationError::UNTRUSTED_KEY_BUNDLE), "UNTRUSTED_KEY_BUNDLE");
    EXPECT_STREQ(to_string(ErrorClass::Trust), "trust");
    EXPECT_STREQ(to_string(static_cast<FederationError>(999)), "UNKNOWN");
}
