#pragma once

#include "response_event.hpp"
#include <memory>

namespace snmpkit::event {

using ResponseEventPtr = std::shared_ptr<const ResponseEvent>;

/**
 * @brief Creates the ResponseEvent for every resolved request on behalf of a session.
 *
 * A host can supply its own implementation to add logging or response time
 * monitoring at the single point where outcomes are created.
 * Implementations must not throw for a non-null request.
 */
class IResponseEventFactory {
public:
    virtual ~IResponseEventFactory() = default;

    /**
     * @brief Creates a ResponseEvent from the resolved request.
     * @param source The component that resolved the request.
     * @param peer_address Transport address of the responder, if any.
     * @param request The request PDU. Must not be null.
     * @param response The response PDU, or null if the request timed out.
     * @param user_object An optional user object.
     * @param duration_nanos Nanoseconds between request and resolution, std::nullopt if not measured.
     * @param error The processing error, or null if no error occurred.
     * @return The new event.
     */
    virtual ResponseEventPtr create_response_event(
        const void* source,
        const std::optional<smi::TransportAddress>& peer_address,
        const PduPtr& request,
        const PduPtr& response,
        const UserObject& user_object,
        std::optional<uint64_t> duration_nanos,
        const std::exception_ptr& error) = 0;
};

class DefaultResponseEventFactory : public IResponseEventFactory {
public:
    ResponseEventPtr create_response_event(
        const void* source,
        const std::optional<smi::TransportAddress>& peer_address,
        const PduPtr& request,
        const PduPtr& response,
        const UserObject& user_object,
        std::optional<uint64_t> duration_nanos,
        const std::exception_ptr& error) override {
        return std::make_shared<ResponseEvent>(
            source, peer_address, request, response, user_object, duration_nanos, error);
    }
};

/*
 * Base for factories that add behavior around another factory.
 * A null delegate falls back to DefaultResponseEventFactory.
 */
class DelegatingResponseEventFactory : public IResponseEventFactory {
public:
    const std::shared_ptr<IResponseEventFactory>& get_delegate() const { return delegate_; }

protected:
    explicit DelegatingResponseEventFactory(std::shared_ptr<IResponseEventFactory> delegate)
        : delegate_(std::move(delegate)) {
        if (!delegate_) {
            delegate_ = std::make_shared<DefaultResponseEventFactory>();
        }
    }

    std::shared_ptr<IResponseEventFactory> delegate_;
};

} // namespace snmpkit::event
