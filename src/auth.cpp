#include "auth.hpp"
#include "errors.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <vector>

namespace swiv {

std::string base64_encode(const std::string& data) {
    if (data.empty()) return "";

    // 4 output bytes per 3 input bytes, plus the terminating NUL
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

AuthGate::AuthGate(std::string secret) {
    if (!secret.empty()) {
        expected_ = "Basic " + base64_encode(secret);
    }
}

bool AuthGate::accepts(const std::string& authorization) const {
    if (!enabled()) return true;
    if (authorization.size() != expected_.size()) return false;
    return CRYPTO_memcmp(authorization.data(), expected_.data(), expected_.size()) == 0;
}

void AuthGate::authenticate(const Request& request) const {
    if (!accepts(request.header("Authorization"))) {
        throw Unauthorized();
    }
}

} // namespace swiv
