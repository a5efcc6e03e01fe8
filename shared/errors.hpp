// shared/errors.hpp
// Error taxonomy for the server and protocol layers
#ifndef SHARED_ERRORS_HPP
#define SHARED_ERRORS_HPP

#include <stdexcept>
#include <string>

// Malformed wire record. Closes the offending connection only.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(const std::string& what, const std::string& record)
        : std::runtime_error(what + " in record '" + record + "'"), record_(record) {}

    const std::string& record() const { return record_; }

private:
    std::string record_;
};

// Block edit outside the configured world bounds or with an invalid material.
class OutOfRangeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Operation on a player id that is no longer registered.
class StaleReferenceError : public std::runtime_error {
public:
    explicit StaleReferenceError(int playerId)
        : std::runtime_error("player " + std::to_string(playerId) + " is not registered"),
          playerId_(playerId) {}

    int playerId() const { return playerId_; }

private:
    int playerId_;
};

// Persistence I/O failure or corrupt chunk record.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Socket-level failure or timeout on a single connection.
class ConnectionFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif // SHARED_ERRORS_HPP
