#pragma once

#include "status.h"
#include "utils.h"
#include <string>

namespace chunkpost {

// Signs "<timestamp>:<originalName>" with the client's pre-shared Ed25519 key
class Signer {
public:
    Signer(std::string client_id, std::string secret_key_base64);

    static Signer fromConfig(const Config& config);

    Status sign(const std::string& timestamp, const std::string& original_name, std::string& signature_base64) const;

    const std::string& clientId() const { return client_id_; }

private:
    std::string client_id_;
    std::string secret_key_base64_;
};

} // namespace chunkpost
