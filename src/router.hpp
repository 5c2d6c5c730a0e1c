#pragma once

#include "auth.hpp"
#include "http_types.hpp"
#include "mime.hpp"
#include <string>

namespace swiv {

// Turns one request into exactly one response:
// authenticate, resolve under the base directory, then render a view,
// stream a file, or answer with an error.
class Router {
public:
    // `base` must exist; it is canonicalized once here.
    // Throws std::filesystem::filesystem_error otherwise.
    Router(const std::string& base, AuthGate auth, const MimeDetector& mime);

    // Never throws: internal failures become 500
    Response route(const Request& request) const;

    const std::string& base() const { return base_; }

private:
    Response dispatch(const Request& request) const;

    // Canonical path for the request, or BadRequest if it leaves the base
    std::string resolve(const std::string& request_path) const;

    std::string base_;       // canonical, no trailing slash (except "/")
    std::string link_base_;  // prefix stripped from pathnames to build links
    AuthGate auth_;
    const MimeDetector& mime_;
};

} // namespace swiv
