#include <gtest/gtest.h>
#include "fedtrust/crypto/base64.hpp"
#include "fedtrust/crypto/signature.hpp"
#include "fedtrust/events/content_hasher.hpp"
#include "fedtrust/signing/event_signer.hpp"
#include "fedtrust/signing/event_verifier.hpp"
#include "fedtrust/signing/request_signer.hpp"
#include "../support/fakes.hpp"
#include <memory>

namespace fedtrust::signing::test {

using events::Event;
using federation::FederationError;
using fedtrust::test::FixedLocalKeyProvider;
using fedtrust::test::StaticKeyProvider;
using fedtrust::test::example_signing_key;
using json::Value;

namespace {

const std::string EXPECTED_EVENT_SIGNATURE =
    "t1x6uduxERf+0tZbN5djONVV/mKnQHQ+4yqzNj43mz6WB9Ia08xLq3APglHKOJY0Dheae0SMJRejsUD6k53KBg==";
const std::string EXPECTED_REQUEST_SIGNATURE =
    "a6ZWWOwGGK2VhWZCeWElmz7Fi506C6N4945AYATgXkO7ilyRMYNZHS6Gu4btrZNqym+GVMDdrNYpeKU0wYDPDw==";

Value message_event() {
    return Value{
        {"room_id", "!room:example.org"},
        {"sender", "@alice:example.org"},
        {"type", "m.room.message"},
        {"content", {{"body", "hello"}, {"msgtype", "m.text"}}},
        {"origin_server_ts", 1700000000000},
        {"prev_events", Value::array({"$prev"})},
        {"auth_events", Value::array({"$create"})},
        {"depth", 5},
        {"origin", "example.org"}
    };
}

}

class EventSigningTest : public ::testing::Test {
protected:
    void SetUp() override {
        local_keys_ = std::make_shared<FixedLocalKeyProvider>(example_signing_key("example.org"));
        signer_ = std::make_unique<EventSigner>(local_keys_, "example.org");
        
        public_keys_ = std::make_shared<StaticKeyProvider>();
        public_keys_->add("example.org", "ed25519:1", fedtrust::test::MATRIX_EXAMPLE_PUBLIC_KEY);
        verifier_ = std::make_unique<EventVerifier>(public_keys_);
    }
    
    Event signed_event() {
        auto event = Event::from_json(message_event());
        signer_->sign_event(event, "ed25519:1");
        return event;
    }
    
    std::shared_ptr<FixedLocalKeyProvider> local_keys_;
    std::unique_ptr<EventSigner> signer_;
    std::shared_ptr<StaticKeyProvider> public_keys_;
    std::unique_ptr<EventVerifier> verifier_;
};

TEST_F(EventSigningTest, SignEventAttachesHashAndSignature) {
    auto event = signed_event();
    
    EXPECT_EQ(event.content_hash(), "DCfwNerbcW6dBj/CpaD9baMYmPQY4p3IjSI7Q4qiLAg");
    EXPECT_EQ(event.signatures["example.org"]["ed25519:1"], EXPECTED_EVENT_SIGNATURE);
}

TEST_F(EventSigningTest, SignEventKeepsOtherSignatures) {
    auto event = Event::from_json(message_event());
    event.signatures["other.org"]["ed25519:z"] = "b3RoZXI";
    event.signatures["example.org"]["ed25519:old"] = "b2xk";
    
    signer_->sign_event(event, "ed25519:1");
    
    EXPECT_EQ(event.signatures["other.org"]["ed25519:z"], "b3RoZXI");
    EXPECT_EQ(event.signatures["example.org"]["ed25519:old"], "b2xk");
    EXPECT_EQ(event.signatures["example.org"]["ed25519:1"], EXPECTED_EVENT_SIGNATURE);
}

TEST_F(EventSigningTest, SigningViewExcludesUnsignedAndSignatures) {
    auto event = signed_event();
    event.unsigned_data = Value{{"age", 1}};
    
    auto view = EventSigner::signing_view(event);
    
    EXPECT_FALSE(view.contains("signatures"));
    EXPECT_FALSE(view.contains("unsigned"));
    EXPECT_FALSE(view.contains("origin"));
    EXPECT_TRUE(view.contains("hashes"));
    EXPECT_EQ(view["content"], event.content);
}

TEST_F(EventSigningTest, RefusesForeignSender) {
    auto json = message_event();
    json["sender"] = "@mallory:evil.org";
    auto event = Event::from_json(json);
    
    EXPECT_THROW(signer_->sign_event(event, "ed25519:1"), SigningError);
    EXPECT_TRUE(event.signatures.empty());
}

TEST_F(EventSigningTest, RefusesIncompleteEvent) {
    auto event = Event::from_json(message_event());
    event.room_id.clear();
    
    EXPECT_THROW(signer_->sign_event(event, "ed25519:1"), SigningError);
}

TEST_F(EventSigningTest, RefusesUnknownKeyId) {
    auto event = Event::from_json(message_event());
    
    EXPECT_THROW(signer_->sign_event(event, "ed25519:nope"), SigningError);
}

TEST_F(EventSigningTest, MissingPrivateKeyThrows) {
    auto key = example_signing_key("example.org");
    key.private_key.reset();
    EventSigner signer(std::make_shared<FixedLocalKeyProvider>(key), "example.org");
    auto event = Event::from_json(message_event());
    
    EXPECT_THROW(signer.sign_event(event, "ed25519:1"), SigningError);
}

TEST_F(EventSigningTest, SignJsonMergesSignature) {
    auto signed_object = signer_->sign_json(Value::object(), "ed25519:1");
    
    EXPECT_EQ(signed_object["signatures"]["example.org"]["ed25519:1"],
              "K8280/U9SSy9IVtjBuVeLr+HpOB4BQFWbg+UZaADMtTdGYI7Geitb76LTrr5QV/7Xg4ahLwYGYZzuHGZKM5ZAQ==");
}

TEST_F(EventSigningTest, ValidSignedEventVerifies) {
    auto event = signed_event();
    
    auto result = verifier_->validate_event_crypto(event, {"example.org"});
    EXPECT_TRUE(result.success()) << result.describe();
    
    auto from_wire = verifier_->validate_event_crypto(event.to_json(), {"example.org"});
    EXPECT_TRUE(from_wire.success()) << from_wire.describe();
}

TEST_F(EventSigningTest, UnsignedChangesDoNotBreakVerification) {
    auto event = signed_event();
    event.unsigned_data = Value{{"age", 12345}};
    
    EXPECT_TRUE(verifier_->validate_event_crypto(event, {"example.org"}).success());
}

TEST_F(EventSigningTest, NoExpectedServersIsAnError) {
    auto event = signed_event();
    
    EXPECT_EQ(verifier_->validate_event_crypto(event, {}).error, FederationError::INVALID_SIGNATURE);
}

TEST_F(EventSigningTest, MissingSignatureFromExpectedServer) {
    auto event = signed_event();
    
    auto result = verifier_->validate_event_crypto(event, {"example.org", "other.org"});
    EXPECT_EQ(result.error, FederationError::INVALID_SIGNATURE);
}

TEST_F(EventSigningTest, TamperedContentFailsSignature) {
    auto event = signed_event();
    event.content["body"] = "goodbye";
    
    EXPECT_EQ(verifier_->validate_event_crypto(event, {"example.org"}).error, FederationError::INVALID_SIGNATURE);
}

TEST_F(EventSigningTest, TamperedUnsignedFieldFailsContentHash) {
    auto event = signed_event();
    event.extra["origin"] = "evil.org";
    
    // origin is outside the signing view, so only the content hash catches this
    EXPECT_EQ(verifier_->validate_event_crypto(event, {"example.org"}).error,
              FederationError::CONTENT_HASH_MISMATCH);
}

TEST_F(EventSigningTest, MissingContentHash) {
    auto event = Event::from_json(message_event());
    std::string canonical = json::encode_canonical(EventSigner::signing_view(event));
    
    crypto::SecureBytes seed;
    ASSERT_TRUE(crypto::decode_base64(fedtrust::test::MATRIX_EXAMPLE_SEED, seed.data));
    std::string signature;
    crypto::SignatureEngine engine;
    ASSERT_TRUE(engine.sign_base64(crypto::as_bytes(canonical), seed.span(), signature));
    event.signatures["example.org"]["ed25519:1"] = signature;
    
    EXPECT_EQ(verifier_->validate_event_crypto(event, {"example.org"}).error,
              FederationError::CONTENT_HASH_MISMATCH);
}

TEST_F(EventSigningTest, OneGoodSignatureAmongBadOnesSuffices) {
    auto event = signed_event();
    event.signatures["example.org"]["ed25519:0"] = "Z2FyYmFnZQ";
    event.signatures["example.org"]["ed25519:unknown"] = EXPECTED_EVENT_SIGNATURE;
    
    EXPECT_TRUE(verifier_->validate_event_crypto(event, {"example.org"}).success());
}

TEST_F(EventSigningTest, UnknownKeyFailsVerification) {
    auto event = signed_event();
    EventVerifier verifier(std::make_shared<StaticKeyProvider>());
    
    EXPECT_EQ(verifier.validate_event_crypto(event, {"example.org"}).error, FederationError::INVALID_SIGNATURE);
}

TEST_F(EventSigningTest, MalformedJsonIsReportedNotThrown) {
    Value broken = message_event();
    broken.erase("depth");
    
    EXPECT_EQ(verifier_->validate_event_crypto(broken, {"example.org"}).error, FederationError::INVALID_JSON);
    EXPECT_EQ(verifier_->validate_event_crypto(Value("string"), {"example.org"}).error,
              FederationError::INVALID_JSON);
}

TEST_F(EventSigningTest, RequestSigning) {
    RequestSigner signer(local_keys_, "example.org");
    
    auto auth = signer.sign_request("GET", "/_matrix/federation/v1/version", "remote.org");
    
    EXPECT_EQ(auth.origin, "example.org");
    EXPECT_EQ(auth.destination, "remote.org");
    EXPECT_EQ(auth.key_id, "ed25519:1");
    EXPECT_EQ(auth.signature, EXPECTED_REQUEST_SIGNATURE);
    EXPECT_EQ(auth.to_header(),
              "X-Matrix origin=\"example.org\",destination=\"remote.org\",key=\"ed25519:1\",sig=\"" +
              EXPECTED_REQUEST_SIGNATURE + "\"");
    
    EXPECT_TRUE(verifier_->verify_request(auth, "GET", "/_matrix/federation/v1/version", std::nullopt).success());
}

TEST_F(EventSigningTest, RequestSignatureCoversBody) {
    RequestSigner signer(local_keys_, "example.org");
    Value body = {{"pdus", Value::array()}};
    
    auto auth = signer.sign_request("PUT", "/_matrix/federation/v1/send/1", "remote.org", body);
    
    EXPECT_TRUE(verifier_->verify_request(auth, "PUT", "/_matrix/federation/v1/send/1", body).success());
    EXPECT_FALSE(verifier_->verify_request(auth, "PUT", "/_matrix/federation/v1/send/1", std::nullopt).success());
    EXPECT_FALSE(verifier_->verify_request(auth, "PUT", "/_matrix/federation/v1/send/2", body).success());
    
    Value other_body = {{"pdus", Value::array({1})}};
    EXPECT_EQ(verifier_->verify_request(auth, "PUT", "/_matrix/federation/v1/send/1", other_body).error,
              FederationError::INVALID_SIGNATURE);
}

TEST_F(EventSigningTest, IncompleteRequestCredentials) {
    XMatrixAuth auth;
    auth.origin = "example.org";
    auth.key_id = "ed25519:1";
    
    EXPECT_EQ(verifier_->verify_request(auth, "GET", "/", std::nullopt).error, FederationError::INVALID_SIGNATURE);
}

}
