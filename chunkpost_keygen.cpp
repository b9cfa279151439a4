#include "src/common/crypto.h"
#include "src/common/utils.h"
#include <json/json.h>
#include <iostream>

// Prints a fresh Ed25519 key pair and the matching clients.json entry
int main(int argc, char** argv) {
    try {
        std::string client_id = argc > 1 ? argv[1] : "mobile-app";

        chunkpost::Ed25519KeyPair key_pair;
        if (!chunkpost::Crypto::generateKeyPair(key_pair)) {
            std::cerr << "Error: key generation failed" << std::endl;
            return 1;
        }

        std::string public_key_base64 = chunkpost::Utils::base64Encode(key_pair.public_key);
        std::string secret_key_base64 = chunkpost::Utils::base64Encode(key_pair.secret_key);

        std::cout << "publicKeyBase64: " << public_key_base64 << std::endl;
        std::cout << "secretKeyBase64: " << secret_key_base64 << std::endl;

        Json::Value registry;
        registry["clients"][client_id]["publicKeyBase64"] = public_key_base64;
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";

        std::cout << "\nServer clients.json entry:\n" << Json::writeString(builder, registry) << std::endl;
        std::cout << "\nClient configuration:\n"
                  << "client_id = " << client_id << "\n"
                  << "secret_key_base64 = " << secret_key_base64 << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
