#pragma once

#include "response_event_factory.hpp"
#include "response_listener.hpp"
#include <memory>
#include <mutex>

namespace snmpkit::event {

/**
 * @brief The call site a dispatch layer uses to report a resolved request.
 *
 * Each call creates exactly one ResponseEvent through the current factory
 * and hands it to exactly one listener.
 */
class ResponseNotifier {
public:
    /**
     * @param source Reported as the event source. Defaults to this notifier.
     * @param factory The factory to use; nullptr selects DefaultResponseEventFactory.
     */
    explicit ResponseNotifier(const void* source = nullptr,
                              std::shared_ptr<IResponseEventFactory> factory = nullptr);

    std::shared_ptr<IResponseEventFactory> get_factory() const;

    /**
     * @brief Replaces the factory used for subsequent events.
     * @param factory The new factory; nullptr restores DefaultResponseEventFactory.
     */
    void set_factory(std::shared_ptr<IResponseEventFactory> factory);

    /**
     * @brief Creates the event for a resolved request and delivers it.
     * @param listener Receives the event; may be null if the caller only needs the return value.
     * @return The event handed to the listener.
     * @throws std::invalid_argument if request is null.
     */
    ResponseEventPtr notify(IResponseListener* listener,
                            const std::optional<smi::TransportAddress>& peer_address,
                            const PduPtr& request,
                            const PduPtr& response,
                            const UserObject& user_object,
                            std::optional<uint64_t> duration_nanos,
                            const std::exception_ptr& error = nullptr);

    // Reports a request that was still pending when its session closed.
    ResponseEventPtr notify_session_closed(IResponseListener* listener,
                                           const PduPtr& request,
                                           const UserObject& user_object,
                                           std::optional<uint64_t> duration_nanos);

    const void* get_source() const { return source_; }

private:
    const void* source_;
    mutable std::mutex mtx_;
    std::shared_ptr<IResponseEventFactory> factory_;
};

} // namespace snmpkit::event
