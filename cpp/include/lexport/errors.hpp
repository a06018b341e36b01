#pragma once

#include <stdexcept>
#include <string>

namespace lexport {

// Base of every failure raised by the archive engine itself. Anything else
// reaching the pipeline came from a collaborator or the platform.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Malformed or truncated input: bad signature, corrupt chunk, broken header.
class FormatError : public Error {
public:
    explicit FormatError(const std::string& message) : Error(message) {}
};

// AES-GCM tag mismatch. Wrong password and tampering are not told apart.
class AuthenticationError : public Error {
public:
    AuthenticationError() : Error("Incorrect password") {}
};

class ResourceTimeoutError : public Error {
public:
    explicit ResourceTimeoutError(const std::string& message) : Error(message) {}
};

class AbortError : public Error {
public:
    explicit AbortError(const std::string& message) : Error(message) {}
};

}  // namespace lexport
