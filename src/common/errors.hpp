#pragma once

#include <stdexcept>
#include <string>

namespace chandb {

// Base class for unrecoverable chandb errors. Recoverable I/O failures are
// reported as std::error_code instead.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

// An existing snapshot file could not be read or decoded while constructing
// a store. The store must not start with partial or empty state.
class SnapshotLoadError : public Error {
public:
    explicit SnapshotLoadError(const std::string& message)
        : Error("Snapshot load error: " + message) {}
};

// The crypto backend (digest or random source) failed.
class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& message)
        : Error("Crypto error: " + message) {}
};

} // namespace chandb
