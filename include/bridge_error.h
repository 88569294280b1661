// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "json_utils.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace devbridge {

/**
 * @brief Error types for bridge operations
 */
enum class BridgeErrorType {
    NONE,            // No error
    TIMEOUT,         // Request timed out waiting for a response (coordinator side)
    CONNECTION_LOST, // Link to the device dropped while the request was in flight
    NO_DEVICE,       // No connected device to route to
    UNKNOWN_METHOD,  // Device has no built-in command or action with that name
    HANDLER_ERROR,   // Getter, action or callback threw
    INVALID_PARAMS,  // Parameters failed validation
    MALFORMED_FRAME, // Incoming frame does not match the envelope
    SEND_FAILED,     // Frame could not be written to the socket
    UNKNOWN          // Unknown error
};

/**
 * @brief Comprehensive error information for bridge operations
 *
 * Travels as a value through callbacks and as the `error` object of a
 * response frame (`{type, message}`).
 */
struct BridgeError {
    BridgeErrorType type = BridgeErrorType::NONE;
    std::string message; // Human-readable error message
    std::string method;  // Method that caused the error
    json details;        // Additional error details

    /**
     * @brief Check if there's an error
     */
    bool has_error() const {
        return type != BridgeErrorType::NONE;
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        return type_to_string(type);
    }

    static std::string type_to_string(BridgeErrorType t) {
        switch (t) {
        case BridgeErrorType::NONE:
            return "NONE";
        case BridgeErrorType::TIMEOUT:
            return "TIMEOUT";
        case BridgeErrorType::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case BridgeErrorType::NO_DEVICE:
            return "NO_DEVICE";
        case BridgeErrorType::UNKNOWN_METHOD:
            return "UNKNOWN_METHOD";
        case BridgeErrorType::HANDLER_ERROR:
            return "HANDLER_ERROR";
        case BridgeErrorType::INVALID_PARAMS:
            return "INVALID_PARAMS";
        case BridgeErrorType::MALFORMED_FRAME:
            return "MALFORMED_FRAME";
        case BridgeErrorType::SEND_FAILED:
            return "SEND_FAILED";
        case BridgeErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    static BridgeErrorType type_from_string(const std::string& s) {
        for (auto t : {BridgeErrorType::NONE, BridgeErrorType::TIMEOUT,
                       BridgeErrorType::CONNECTION_LOST, BridgeErrorType::NO_DEVICE,
                       BridgeErrorType::UNKNOWN_METHOD, BridgeErrorType::HANDLER_ERROR,
                       BridgeErrorType::INVALID_PARAMS, BridgeErrorType::MALFORMED_FRAME,
                       BridgeErrorType::SEND_FAILED}) {
            if (type_to_string(t) == s) {
                return t;
            }
        }
        return BridgeErrorType::UNKNOWN;
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        if (type == BridgeErrorType::NO_DEVICE) {
            return "No device connected. Start the instrumented app and make sure it can reach "
                   "the coordinator.";
        } else if (type == BridgeErrorType::TIMEOUT) {
            return "The device did not answer in time.";
        } else if (type == BridgeErrorType::CONNECTION_LOST) {
            return "Connection to the device was lost.";
        } else if (!message.empty()) {
            return message;
        } else {
            return "An unknown error occurred.";
        }
    }

    /// Serialize as the `error` member of a response frame
    json to_wire() const {
        json j = {{"type", get_type_string()}, {"message", message}};
        if (!details.is_null()) {
            j["details"] = details;
        }
        return j;
    }

    /**
     * @brief Create error from the `error` member of a response frame
     */
    static BridgeError from_wire(const json& error_obj, const std::string& method_name) {
        BridgeError err;
        err.type = BridgeErrorType::UNKNOWN;
        err.method = method_name;

        if (error_obj.is_object()) {
            err.type = type_from_string(json_util::safe_string(error_obj, "type"));
            err.message = json_util::safe_string(error_obj, "message");
            if (error_obj.contains("details")) {
                err.details = error_obj["details"];
            }
        }
        if (err.type == BridgeErrorType::NONE) {
            err.type = BridgeErrorType::UNKNOWN;
        }
        return err;
    }

    /**
     * @brief Create timeout error
     */
    static BridgeError timeout(const std::string& method_name, uint32_t timeout_ms) {
        BridgeError err;
        err.type = BridgeErrorType::TIMEOUT;
        err.method = method_name;
        if (timeout_ms % 1000 == 0) {
            err.message = "Request timeout (" + std::to_string(timeout_ms / 1000) + "s)";
        } else {
            err.message = "Request timeout (" + std::to_string(timeout_ms) + "ms)";
        }
        return err;
    }

    /**
     * @brief Create connection lost error
     */
    static BridgeError connection_lost(const std::string& method_name = "") {
        BridgeError err;
        err.type = BridgeErrorType::CONNECTION_LOST;
        err.method = method_name;
        err.message = "Device connection lost";
        return err;
    }

    static BridgeError no_device(const std::string& method_name, const std::string& device_id = "") {
        BridgeError err;
        err.type = BridgeErrorType::NO_DEVICE;
        err.method = method_name;
        err.message = device_id.empty()
                          ? "No device connected. Make sure your app is running with the bridge "
                            "enabled."
                          : "Device not connected: " + device_id;
        return err;
    }

    static BridgeError unknown_method(const std::string& method_name) {
        BridgeError err;
        err.type = BridgeErrorType::UNKNOWN_METHOD;
        err.method = method_name;
        err.message = "Unknown method: " + method_name;
        return err;
    }

    static BridgeError handler_error(const std::string& what, const std::string& method_name = "") {
        BridgeError err;
        err.type = BridgeErrorType::HANDLER_ERROR;
        err.method = method_name;
        err.message = what;
        return err;
    }

    static BridgeError invalid_params(const std::string& what, const std::string& method_name = "") {
        BridgeError err;
        err.type = BridgeErrorType::INVALID_PARAMS;
        err.method = method_name;
        err.message = what;
        return err;
    }

    static BridgeError malformed_frame(const std::string& what) {
        BridgeError err;
        err.type = BridgeErrorType::MALFORMED_FRAME;
        err.message = "Malformed frame: " + what;
        return err;
    }

    static BridgeError send_failed(const std::string& method_name = "") {
        BridgeError err;
        err.type = BridgeErrorType::SEND_FAILED;
        err.method = method_name;
        err.message = "Failed to send request to device";
        return err;
    }
};

/**
 * @brief Exception thrown by command handlers and parameter parsing
 *
 * Only used inside the dispatcher, which converts it into an error response.
 */
class CommandError : public std::runtime_error {
  public:
    CommandError(BridgeErrorType type, const std::string& message)
        : std::runtime_error(message), type_(type) {}

    BridgeErrorType type() const {
        return type_;
    }

    BridgeError to_error(const std::string& method_name) const {
        BridgeError err;
        err.type = type_;
        err.method = method_name;
        err.message = what();
        return err;
    }

  private:
    BridgeErrorType type_;
};

} // namespace devbridge
