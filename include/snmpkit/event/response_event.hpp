#pragma once

#include "response_event_types.hpp"
#include "snmpkit/smi/transport_address.hpp"
#include <cstdint>
#include <optional>

namespace snmpkit::event {

/**
 * @brief Associates a request PDU with its response, an optional user object,
 *        the peer that answered and the time it took.
 *
 * Instances are immutable once constructed and may be read from any thread.
 */
class ResponseEvent {
public:
    /**
     * @param source The component that resolved the request.
     * @param peer_address Transport address of the responder, if a response was attributed.
     * @param request The request PDU. Must not be null.
     * @param response The response PDU, or null if the request timed out or failed.
     * @param user_object The user object supplied with the asynchronous request.
     * @param duration_nanos Nanoseconds between sending and resolution, std::nullopt if not measured.
     * @param error The error that stopped the request processing, or null.
     * @throws std::invalid_argument if request is null.
     */
    ResponseEvent(const void* source,
                  std::optional<smi::TransportAddress> peer_address,
                  PduPtr request,
                  PduPtr response = nullptr,
                  UserObject user_object = nullptr,
                  std::optional<uint64_t> duration_nanos = std::nullopt,
                  std::exception_ptr error = nullptr);
    virtual ~ResponseEvent() = default;

    const void* get_source() const { return source_; }
    const PduPtr& get_request() const { return request_; }
    const PduPtr& get_response() const { return response_; }
    const UserObject& get_user_object() const { return user_object_; }
    const std::exception_ptr& get_error() const { return error_; }

    /**
     * @brief Gets the transport address of the response sender.
     * @return The address, or std::nullopt if no response has been received
     *         within the timeout or nothing could be attributed before an error.
     */
    const std::optional<smi::TransportAddress>& get_peer_address() const { return peer_address_; }

    /**
     * @brief Gets the nanoseconds waited between request and resolution.
     * @return The measured value, or 0 if the duration was not measured.
     */
    uint64_t get_duration_nanos() const { return duration_nanos_.value_or(0); }
    bool is_duration_measured() const { return duration_nanos_.has_value(); }

    OutcomeKind get_kind() const;
    bool is_success() const { return get_kind() == OutcomeKind::SUCCESS; }
    bool is_timeout() const { return get_kind() == OutcomeKind::TIMEOUT; }
    bool has_error() const { return error_ != nullptr; }

private:
    const void* source_;
    std::optional<smi::TransportAddress> peer_address_;
    PduPtr request_;
    PduPtr response_;
    UserObject user_object_;
    std::optional<uint64_t> duration_nanos_;
    std::exception_ptr error_;
};

} // namespace snmpkit::event
