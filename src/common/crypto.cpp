#include "crypto.h"
#include "utils.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>

namespace chunkpost {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

std::string lastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace

bool Crypto::generateKeyPair(Ed25519KeyPair& out) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        Utils::logError("Ed25519 keygen init failed: " + lastOpenSslError());
        return false;
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        Utils::logError("Ed25519 keygen failed: " + lastOpenSslError());
        return false;
    }
    PkeyPtr pkey(raw);

    std::string seed(SEED_SIZE, '\0');
    std::string public_key(PUBLIC_KEY_SIZE, '\0');
    size_t seed_len = seed.size();
    size_t public_len = public_key.size();

    if (EVP_PKEY_get_raw_private_key(pkey.get(), reinterpret_cast<unsigned char*>(&seed[0]), &seed_len) != 1 ||
        EVP_PKEY_get_raw_public_key(pkey.get(), reinterpret_cast<unsigned char*>(&public_key[0]), &public_len) != 1) {
        Utils::logError("Failed to export Ed25519 key: " + lastOpenSslError());
        return false;
    }

    out.public_key = public_key;
    out.secret_key = seed + public_key;
    return true;
}

bool Crypto::sign(const std::string& message, const std::string& secret_key, std::string& signature) {
    if (secret_key.size() != SEED_SIZE && secret_key.size() != SECRET_KEY_SIZE) {
        Utils::logError("Invalid Ed25519 secret key size: " + std::to_string(secret_key.size()));
        return false;
    }

    // Only the seed half is needed; OpenSSL derives the public key itself
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              reinterpret_cast<const unsigned char*>(secret_key.data()),
                                              SEED_SIZE));
    if (!pkey) {
        Utils::logError("Failed to load Ed25519 secret key: " + lastOpenSslError());
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        Utils::logError("Ed25519 sign init failed: " + lastOpenSslError());
        return false;
    }

    std::string out(SIGNATURE_SIZE, '\0');
    size_t out_len = out.size();
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]), &out_len,
                       reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
        Utils::logError("Ed25519 sign failed: " + lastOpenSslError());
        return false;
    }

    out.resize(out_len);
    signature = out;
    return true;
}

bool Crypto::verifySignature(const std::string& message,
                             const std::string& signature,
                             const std::string& public_key) {
    if (public_key.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) {
        return false;
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             reinterpret_cast<const unsigned char*>(public_key.data()),
                                             public_key.size()));
    if (!pkey) {
        Utils::logWarning("Failed to load Ed25519 public key: " + lastOpenSslError());
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        Utils::logError("Ed25519 verify init failed: " + lastOpenSslError());
        return false;
    }

    int rc = EVP_DigestVerify(ctx.get(),
                              reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                              reinterpret_cast<const unsigned char*>(message.data()), message.size());
    if (rc != 1) {
        // Clear the queue so a failed verification does not leak into later errors
        ERR_clear_error();
        return false;
    }
    return true;
}

std::string Crypto::uploadSigningMessage(const std::string& timestamp, const std::string& original_name) {
    return timestamp + ":" + original_name;
}

std::string Crypto::generateRandomBytes(size_t count) {
    std::string bytes(count, '\0');
    if (count > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(&bytes[0]), static_cast<int>(count)) != 1) {
        Utils::logError("Failed to generate random bytes");
        return "";
    }
    return bytes;
}

} // namespace chunkpost
