#include "signer.h"
#include "crypto.h"

namespace chunkpost {

Signer::Signer(std::string client_id, std::string secret_key_base64)
    : client_id_(std::move(client_id)), secret_key_base64_(std::move(secret_key_base64)) {
}

Signer Signer::fromConfig(const Config& config) {
    return Signer(config.getClientId(), config.getSecretKeyBase64());
}

Status Signer::sign(const std::string& timestamp, const std::string& original_name,
                    std::string& signature_base64) const {
    if (client_id_.empty() || secret_key_base64_.empty()) {
        return Status(ErrorCode::kConfigError, "No signing key configured (client_id / secret_key_base64)");
    }

    std::string secret_key;
    if (!Utils::base64Decode(secret_key_base64_, secret_key) ||
        (secret_key.size() != Crypto::SEED_SIZE && secret_key.size() != Crypto::SECRET_KEY_SIZE)) {
        return Status(ErrorCode::kConfigError, "secret_key_base64 is not a valid Ed25519 secret key");
    }

    std::string signature;
    if (!Crypto::sign(Crypto::uploadSigningMessage(timestamp, original_name), secret_key, signature)) {
        return Status(ErrorCode::kConfigError, "Signing failed");
    }

    signature_base64 = Utils::base64Encode(signature);
    return Status::OK();
}

} // namespace chunkpost
