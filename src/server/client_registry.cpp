#include "client_registry.h"
#include "crypto.h"
#include "protocol.h"
#include "utils.h"

namespace chunkpost {

Status ClientRegistry::loadFromFile(const std::string& path) {
    std::string text;
    if (!Utils::readFile(path, text)) {
        return Status(ErrorCode::kConfigError, "Cannot read client registry: " + path);
    }
    Status status = loadFromJson(text);
    if (status.ok()) {
        Utils::logInfo("Loaded " + std::to_string(public_keys_.size()) + " client key(s) from " + path);
    }
    return status;
}

Status ClientRegistry::loadFromJson(const std::string& json_text) {
    Json::Value root;
    Status parsed = parseJsonBody(json_text, root);
    if (!parsed.ok()) {
        return Status(ErrorCode::kConfigError, "Client registry is not valid JSON");
    }

    const Json::Value& clients = root["clients"];
    if (!clients.isObject()) {
        return Status(ErrorCode::kConfigError, "Client registry has no \"clients\" object");
    }

    for (const auto& client_id : clients.getMemberNames()) {
        const Json::Value& entry = clients[client_id];
        if (!entry.isObject()) {
            return Status(ErrorCode::kConfigError, "Invalid registry entry for client " + client_id);
        }
        std::string encoded = entry.get("publicKeyBase64", "").asString();
        std::string public_key;
        if (encoded.empty() || !Utils::base64Decode(encoded, public_key)) {
            return Status(ErrorCode::kConfigError, "Invalid public key for client " + client_id);
        }
        if (!addClient(client_id, public_key)) {
            return Status(ErrorCode::kConfigError,
                          "Public key for client " + client_id + " must be " +
                          std::to_string(Crypto::PUBLIC_KEY_SIZE) + " bytes");
        }
    }

    if (public_keys_.empty()) {
        return Status(ErrorCode::kConfigError, "Client registry is empty");
    }
    return Status::OK();
}

bool ClientRegistry::addClient(const std::string& client_id, const std::string& public_key) {
    if (client_id.empty() || public_key.size() != Crypto::PUBLIC_KEY_SIZE) {
        return false;
    }
    public_keys_[client_id] = public_key;
    return true;
}

bool ClientRegistry::hasClient(const std::string& client_id) const {
    return public_keys_.find(client_id) != public_keys_.end();
}

bool ClientRegistry::verifyUploadSignature(const std::string& client_id,
                                           const std::string& timestamp,
                                           const std::string& original_name,
                                           const std::string& signature_base64) const {
    auto it = public_keys_.find(client_id);
    if (it == public_keys_.end()) {
        Utils::logWarning("Signature from unknown client: " + client_id);
        return false;
    }

    std::string signature;
    if (!Utils::base64Decode(signature_base64, signature)) {
        return false;
    }

    return Crypto::verifySignature(Crypto::uploadSigningMessage(timestamp, original_name),
                                   signature, it->second);
}

} // namespace chunkpost
