#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "fedtrust/federation/well_known_client.hpp"
#include <memory>

using namespace fedtrust::federation;
using ::testing::_;
using ::testing::AllOf;
using ::testing::DoAll;
using ::testing::Field;
using ::testing::Return;
using ::testing::SetArgReferee;

class MockHttpClient : public HttpClient {
public:
    MOCK_METHOD(FederationResult, perform, (const HttpRequest& request, HttpResponse& out_response), (override));
};

class WellKnownClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<MockHttpClient>();
        client_ = std::make_unique<WellKnownClient>(http_, std::chrono::milliseconds(2500));
    }
    
    void answer(long status, const std::string& body) {
        EXPECT_CALL(*http_, perform(_, _))
            .WillOnce(DoAll(SetArgReferee<1>(HttpResponse{status, body}), Return(FederationResult())));
    }
    
    std::shared_ptr<MockHttpClient> http_;
    std::unique_ptr<WellKnownClient> client_;
};

TEST_F(WellKnownClientTest, RequestsWellKnownPath) {
    EXPECT_CALL(*http_, perform(AllOf(
            Field(&HttpRequest::method, "GET"),
            Field(&HttpRequest::url, "https://example.org/.well-known/matrix/server"),
            Field(&HttpRequest::timeout, std::chrono::milliseconds(2500))), _))
        .WillOnce(DoAll(SetArgReferee<1>(HttpResponse{200, R"({"m.server": "matrix.example.org:443"})"}),
                        Return(FederationResult())));
    
    WellKnownResponse response;
    auto result = client_->fetch("example.org", response);
    
    ASSERT_TRUE(result.success()) << result.describe();
    EXPECT_EQ(response.server, "matrix.example.org:443");
}

TEST_F(WellKnownClientTest, ExtraFieldsAreIgnored) {
    answer(200, R"({"m.server": "delegate.example.org", "org.example.other": true})");
    
    WellKnownResponse response;
    ASSERT_TRUE(client_->fetch("example.org", response).success());
    EXPECT_EQ(response.server, "delegate.example.org");
}

TEST_F(WellKnownClientTest, NonSuccessStatus) {
    answer(404, "");
    
    WellKnownResponse response;
    EXPECT_EQ(client_->fetch("example.org", response).error, FederationError::WELL_KNOWN_FAILURE);
}

TEST_F(WellKnownClientTest, TransportFailureMeansNoDelegation) {
    EXPECT_CALL(*http_, perform(_, _))
        .WillOnce(Return(FederationResult(FederationError::HTTP_FAILURE, "Connection refused")));
    
    WellKnownResponse response;
    auto result = client_->fetch("example.org", response);
    
    EXPECT_EQ(result.error, FederationError::WELL_KNOWN_FAILURE);
    EXPECT_NE(result.message.find("Connection refused"), std::string::npos);
}

TEST_F(WellKnownClientTest, MalformedBodies) {
    const char* bodies[] = {
        "not json",
        "[\"m.server\"]",
        "{}",
        R"({"m.server": 8448})",
        R"({"m.server": ""})"
    };
    
    for (const char* body : bodies) {
        answer(200, body);
        WellKnownResponse response;
        EXPECT_EQ(client_->fetch("example.org", response).error, FederationError::WELL_KNOWN_FAILURE) << body;
        EXPECT_TRUE(response.server.empty());
    }
}
