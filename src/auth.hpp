#pragma once

#include "http_types.hpp"
#include <string>

namespace swiv {

// Shared-secret HTTP Basic authentication. An empty secret disables the gate.
class AuthGate {
public:
    explicit AuthGate(std::string secret);

    bool enabled() const { return !expected_.empty(); }

    // Throws Unauthorized unless the Authorization header matches exactly
    void authenticate(const Request& request) const;

    bool accepts(const std::string& authorization) const;

private:
    std::string expected_; // "Basic <base64(secret)>"
};

std::string base64_encode(const std::string& data);

} // namespace swiv
