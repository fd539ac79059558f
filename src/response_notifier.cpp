#include "snmpkit/event/response_notifier.hpp"
#include <stdexcept>

namespace snmpkit::event {

ResponseNotifier::ResponseNotifier(const void* source, std::shared_ptr<IResponseEventFactory> factory)
    : source_(source ? source : this) {
    set_factory(std::move(factory));
}

std::shared_ptr<IResponseEventFactory> ResponseNotifier::get_factory() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return factory_;
}

void ResponseNotifier::set_factory(std::shared_ptr<IResponseEventFactory> factory) {
    if (!factory) {
        factory = std::make_shared<DefaultResponseEventFactory>();
    }
    std::lock_guard<std::mutex> lock(mtx_);
    factory_ = std::move(factory);
}

ResponseEventPtr ResponseNotifier::notify(IResponseListener* listener,
                                          const std::optional<smi::TransportAddress>& peer_address,
                                          const PduPtr& request,
                                          const PduPtr& response,
                                          const UserObject& user_object,
                                          std::optional<uint64_t> duration_nanos,
                                          const std::exception_ptr& error) {
    if (!request) {
        throw std::invalid_argument("Cannot report a response event without a request PDU");
    }
    // Keep the factory alive even if it is replaced concurrently
    auto factory = get_factory();
    auto event = factory->create_response_event(source_, peer_address, request, response,
                                                user_object, duration_nanos, error);
    if (listener) {
        listener->on_response(event);
    }
    return event;
}

ResponseEventPtr ResponseNotifier::notify_session_closed(IResponseListener* listener,
                                                         const PduPtr& request,
                                                         const UserObject& user_object,
                                                         std::optional<uint64_t> duration_nanos) {
    return notify(listener, std::nullopt, request, nullptr, user_object, duration_nanos,
                  std::make_exception_ptr(SessionClosedError()));
}

} // namespace snmpkit::event
