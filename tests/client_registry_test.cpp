#include "test_framework.h"
#include "../src/common/crypto.h"
#include "../src/server/client_registry.h"

namespace chunkpost {
namespace test {

class ClientRegistryTest : public ChunkpostTestBase {
protected:
    void SetUp() override {
        ChunkpostTestBase::SetUp();
        ASSERT_TRUE(Crypto::generateKeyPair(key_pair_));
    }

    std::string registryJson(const std::string& client_id, const std::string& key_base64) {
        return R"({"clients":{")" + client_id + R"(":{"publicKeyBase64":")" + key_base64 + R"("}}})";
    }

    std::string signatureFor(const std::string& timestamp, const std::string& name) {
        std::string signature;
        EXPECT_TRUE(Crypto::sign(Crypto::uploadSigningMessage(timestamp, name), key_pair_.secret_key, signature));
        return Utils::base64Encode(signature);
    }

    Ed25519KeyPair key_pair_;
};

TEST_F(ClientRegistryTest, LoadsFromFileAndVerifies) {
    std::string path = createTempFile(registryJson("app", Utils::base64Encode(key_pair_.public_key)),
                                      "clients.json");
    ClientRegistry registry;
    ASSERT_STATUS_OK(registry.loadFromFile(path));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.hasClient("app"));

    std::string signature = signatureFor("1700000000000", "photo.jpg");
    EXPECT_TRUE(registry.verifyUploadSignature("app", "1700000000000", "photo.jpg", signature));
    EXPECT_FALSE(registry.verifyUploadSignature("app", "1700000000001", "photo.jpg", signature));
    EXPECT_FALSE(registry.verifyUploadSignature("app", "1700000000000", "other.jpg", signature));
    EXPECT_FALSE(registry.verifyUploadSignature("ghost", "1700000000000", "photo.jpg", signature));
    EXPECT_FALSE(registry.verifyUploadSignature("app", "1700000000000", "photo.jpg", "%%%"));
}

TEST_F(ClientRegistryTest, MissingFileIsConfigError) {
    ClientRegistry registry;
    ASSERT_STATUS_CODE(registry.loadFromFile(test_dir_ + "/nope.json"), ErrorCode::kConfigError);
}

TEST_F(ClientRegistryTest, MalformedRegistriesAreConfigErrors) {
    ClientRegistry registry;
    ASSERT_STATUS_CODE(registry.loadFromJson("{"), ErrorCode::kConfigError);
    ASSERT_STATUS_CODE(registry.loadFromJson(R"({"keys":{}})"), ErrorCode::kConfigError);
    ASSERT_STATUS_CODE(registry.loadFromJson(R"({"clients":{}})"), ErrorCode::kConfigError);
    ASSERT_STATUS_CODE(registry.loadFromJson(registryJson("app", "c2hvcnQ=")), ErrorCode::kConfigError);
}

TEST_F(ClientRegistryTest, AddClientRequiresRawKey) {
    ClientRegistry registry;
    EXPECT_FALSE(registry.addClient("app", "short"));
    EXPECT_TRUE(registry.addClient("app", key_pair_.public_key));
    EXPECT_TRUE(registry.verifyUploadSignature("app", "1", "a.png", signatureFor("1", "a.png")));
}

} // namespace test
} // namespace chunkpost
