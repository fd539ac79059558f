#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include "snmpkit/smi/pdu.hpp"

namespace snmpkit::event {

// Common data types
using PduPtr = std::shared_ptr<const smi::Pdu>;
// Caller supplied context, handed back by identity
using UserObject = std::shared_ptr<void>;

/*
 * Classification of a resolved request by the presence of
 * the response and the error in the ResponseEvent.
 */
enum class OutcomeKind {
    SUCCESS,        // response present, no error
    TIMEOUT,        // no response, no error
    ERROR,          // error, no response
    PARTIAL_ERROR   // response received but failed afterwards
};

const char* to_string(OutcomeKind kind);

class ResponseEventError : public std::runtime_error {
public:
    explicit ResponseEventError(const std::string& message)
        : std::runtime_error(message) {}
};

// BER encoding or decoding of the message failed
class EncodingError : public ResponseEventError {
public:
    explicit EncodingError(const std::string& message)
        : ResponseEventError(message) {}
};

// Authentication or privacy processing failed
class SecurityError : public ResponseEventError {
public:
    explicit SecurityError(const std::string& message)
        : ResponseEventError(message) {}
};

class TransportError : public ResponseEventError {
public:
    explicit TransportError(const std::string& message)
        : ResponseEventError(message) {}
};

// The session was closed while the request was still pending
class SessionClosedError : public ResponseEventError {
public:
    SessionClosedError()
        : ResponseEventError("Snmp session has been closed") {}
};

/**
 * @brief Returns the what() text of a stored error.
 * @return The message, or an empty string if error is null.
 */
std::string error_message(const std::exception_ptr& error);

} // namespace snmpkit::event
