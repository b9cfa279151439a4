#include "test_framework.h"
#include "../src/common/crypto.h"

namespace chunkpost {
namespace test {

namespace {

std::string fromHex(const std::string& hex) {
    std::string out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out += static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16));
    }
    return out;
}

} // namespace

class CryptoTest : public ChunkpostTestBase {
protected:
    void SetUp() override {
        ChunkpostTestBase::SetUp();
        ASSERT_TRUE(Crypto::generateKeyPair(key_pair_));
    }

    Ed25519KeyPair key_pair_;
};

TEST_F(CryptoTest, KeyGeneration) {
    ASSERT_EQ(key_pair_.public_key.size(), Crypto::PUBLIC_KEY_SIZE);
    ASSERT_EQ(key_pair_.secret_key.size(), Crypto::SECRET_KEY_SIZE);
    // seed || public key
    EXPECT_EQ(key_pair_.secret_key.substr(32), key_pair_.public_key);

    Ed25519KeyPair other;
    ASSERT_TRUE(Crypto::generateKeyPair(other));
    EXPECT_NE(other.public_key, key_pair_.public_key);
}

TEST_F(CryptoTest, SignAndVerify) {
    std::string message = Crypto::uploadSigningMessage("1700000000000", "photo.jpg");
    EXPECT_EQ(message, "1700000000000:photo.jpg");

    std::string signature;
    ASSERT_TRUE(Crypto::sign(message, key_pair_.secret_key, signature));
    ASSERT_EQ(signature.size(), Crypto::SIGNATURE_SIZE);
    EXPECT_TRUE(Crypto::verifySignature(message, signature, key_pair_.public_key));
}

TEST_F(CryptoTest, SeedOnlySecretKeySignsIdentically) {
    std::string message = "1:a.png";
    std::string full_sig;
    std::string seed_sig;
    ASSERT_TRUE(Crypto::sign(message, key_pair_.secret_key, full_sig));
    ASSERT_TRUE(Crypto::sign(message, key_pair_.secret_key.substr(0, 32), seed_sig));
    EXPECT_EQ(full_sig, seed_sig);
}

TEST_F(CryptoTest, TamperedMessageOrSignatureFails) {
    std::string signature;
    ASSERT_TRUE(Crypto::sign("1:a.jpg", key_pair_.secret_key, signature));

    EXPECT_FALSE(Crypto::verifySignature("1:b.jpg", signature, key_pair_.public_key));
    EXPECT_FALSE(Crypto::verifySignature("2:a.jpg", signature, key_pair_.public_key));

    std::string corrupted = signature;
    corrupted[10] = static_cast<char>(corrupted[10] ^ 0x01);
    EXPECT_FALSE(Crypto::verifySignature("1:a.jpg", corrupted, key_pair_.public_key));

    Ed25519KeyPair other;
    ASSERT_TRUE(Crypto::generateKeyPair(other));
    EXPECT_FALSE(Crypto::verifySignature("1:a.jpg", signature, other.public_key));
}

TEST_F(CryptoTest, RejectsWrongKeySizes) {
    std::string signature;
    EXPECT_FALSE(Crypto::sign("m", "short", signature));
    EXPECT_FALSE(Crypto::verifySignature("m", std::string(64, 'x'), "short"));
    EXPECT_FALSE(Crypto::verifySignature("m", "short", key_pair_.public_key));
}

// RFC 8032, section 7.1, test 1
TEST_F(CryptoTest, Rfc8032TestVector) {
    std::string seed = fromHex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    std::string public_key = fromHex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
    std::string expected = fromHex(
        "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");

    std::string signature;
    ASSERT_TRUE(Crypto::sign("", seed, signature));
    EXPECT_EQ(signature, expected);
    EXPECT_TRUE(Crypto::verifySignature("", signature, public_key));
}

TEST_F(CryptoTest, RandomBytes) {
    std::string a = Crypto::generateRandomBytes(32);
    std::string b = Crypto::generateRandomBytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_TRUE(Crypto::generateRandomBytes(0).empty());
}

} // namespace test
} // namespace chunkpost
