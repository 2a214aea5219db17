#pragma once

#include <string>
#include <exception>
#include <nlohmann/json.hpp>

namespace frogworks {

using json = nlohmann::json;

// Error types as constants
namespace ErrorType {
    constexpr const char* INSTANCE_LOCK_ERROR = "instance_lock_error";
    constexpr const char* BIND_ERROR = "bind_error";
    constexpr const char* RELAY_ERROR = "relay_error";
    constexpr const char* DECODE_ERROR = "decode_error";
    constexpr const char* INVALID_ARGUMENTS = "invalid_arguments";
    constexpr const char* BACKEND_ERROR = "backend_error";
    constexpr const char* TRAY_ERROR = "tray_error";
    constexpr const char* INTERNAL_ERROR = "internal_error";
}

// Base exception class for all Frogworks errors
class FrogworksException : public std::exception {
public:
    FrogworksException(const std::string& message, const std::string& type = ErrorType::INTERNAL_ERROR)
        : message_(message), type_(type) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& type() const { return type_; }

    json to_json() const {
        return {
            {"error", {
                {"message", message_},
                {"type", type_}
            }}
        };
    }

protected:
    std::string message_;
    std::string type_;
};

// Registering the instance lock failed for a reason other than "already held"
class InstanceLockException : public FrogworksException {
public:
    InstanceLockException(const std::string& name, const std::string& reason)
        : FrogworksException("Failed to register instance lock '" + name + "': " + reason,
                             ErrorType::INSTANCE_LOCK_ERROR) {}
};

class BindException : public FrogworksException {
public:
    BindException(const std::string& address, const std::string& reason)
        : FrogworksException("Failed to bind relay listener on " + address + ": " + reason,
                             ErrorType::BIND_ERROR) {}
};

enum class RelayError {
    UNREACHABLE,        // Nothing accepted the connection
    TRANSPORT_FAILURE   // Connected, but the frame could not be written in full
};

class RelayException : public FrogworksException {
public:
    RelayException(RelayError error, const std::string& message)
        : FrogworksException(describe(error) + ": " + message, ErrorType::RELAY_ERROR),
          error_(error) {}

    RelayError error() const { return error_; }

    json to_json() const {
        auto j = FrogworksException::to_json();
        j["error"]["relay_error"] = error_ == RelayError::UNREACHABLE ? "unreachable" : "transport_failure";
        return j;
    }

private:
    static std::string describe(RelayError error) {
        return error == RelayError::UNREACHABLE ? "Primary instance unreachable"
                                                : "Relay transport failure";
    }

    RelayError error_;
};

class DecodeException : public FrogworksException {
public:
    DecodeException(const std::string& message)
        : FrogworksException("Decode error: " + message, ErrorType::DECODE_ERROR) {}
};

class InvalidArgumentsException : public FrogworksException {
public:
    InvalidArgumentsException(const std::string& message)
        : FrogworksException("Invalid arguments: " + message, ErrorType::INVALID_ARGUMENTS) {}
};

class BackendException : public FrogworksException {
public:
    BackendException(const std::string& message, int status_code = 0)
        : FrogworksException("Frogworks backend error: " + message, ErrorType::BACKEND_ERROR),
          status_code_(status_code) {}

    int status_code() const { return status_code_; }

    json to_json() const {
        auto j = FrogworksException::to_json();
        if (status_code_ > 0) {
            j["error"]["status_code"] = status_code_;
        }
        return j;
    }

private:
    int status_code_;
};

} // namespace frogworks
