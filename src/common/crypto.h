#pragma once

#include <string>

namespace chunkpost {

// Raw Ed25519 key material. The secret key may be the 32-byte seed or the
// 64-byte seed || public key layout produced by NaCl-style libraries.
struct Ed25519KeyPair {
    std::string public_key;  // 32 bytes
    std::string secret_key;  // 64 bytes
};

// Ed25519 wrapper over OpenSSL EVP
class Crypto {
public:
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t SEED_SIZE = 32;
    static constexpr size_t SECRET_KEY_SIZE = 64;
    static constexpr size_t SIGNATURE_SIZE = 64;

    // Generate a fresh key pair
    static bool generateKeyPair(Ed25519KeyPair& out);

    // Detached signature over message
    static bool sign(const std::string& message, const std::string& secret_key, std::string& signature);

    static bool verifySignature(const std::string& message,
                                const std::string& signature,
                                const std::string& public_key);

    // Message covered by an upload signature: "<timestamp>:<originalName>"
    static std::string uploadSigningMessage(const std::string& timestamp, const std::string& original_name);

    // Random bytes from the OpenSSL CSPRNG
    static std::string generateRandomBytes(size_t count);
};

} // namespace chunkpost
