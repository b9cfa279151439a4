#pragma once

#include "status.h"
#include <string>
#include <unordered_map>

namespace chunkpost {

// clientId -> Ed25519 public key. Populated once at startup, read-only afterwards.
class ClientRegistry {
public:
    ClientRegistry() = default;

    // Load { "clients": { "<id>": { "publicKeyBase64": "..." } } }
    Status loadFromFile(const std::string& path);
    Status loadFromJson(const std::string& json_text);

    // Register a raw 32-byte public key
    bool addClient(const std::string& client_id, const std::string& public_key);

    bool hasClient(const std::string& client_id) const;
    size_t size() const { return public_keys_.size(); }

    // Check a base64 signature over "<timestamp>:<originalName>"
    bool verifyUploadSignature(const std::string& client_id,
                               const std::string& timestamp,
                               const std::string& original_name,
                               const std::string& signature_base64) const;

private:
    std::unordered_map<std::string, std::string> public_keys_;
};

} // namespace chunkpost
