#pragma once

#include "http_types.hpp"
#include <stdexcept>
#include <string>

namespace swiv {

// An error that carries its own client-facing response
class RespondableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
    virtual Response response() const = 0;
};

// Path resolves to neither a directory nor a file (or escapes the base)
class BadRequest : public RespondableError {
public:
    BadRequest() : RespondableError("Bad request") {}
    Response response() const override;
};

// Credentials missing or wrong
class Unauthorized : public RespondableError {
public:
    Unauthorized() : RespondableError("Unauthorized") {}
    Response response() const override;
};

// ─── Internal failures (flattened to 500 by the router) ─────────────────────

class FilesystemError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FileOpenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FileReadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CycleDetected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace swiv
