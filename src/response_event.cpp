#include "snmpkit/event/response_event.hpp"
#include <stdexcept>

namespace snmpkit::event {

const char* to_string(OutcomeKind kind) {
    switch (kind) {
    case OutcomeKind::SUCCESS:
        return "SUCCESS";
    case OutcomeKind::TIMEOUT:
        return "TIMEOUT";
    case OutcomeKind::ERROR:
        return "ERROR";
    case OutcomeKind::PARTIAL_ERROR:
        return "PARTIAL_ERROR";
    }
    return "UNKNOWN";
}

std::string error_message(const std::exception_ptr& error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

ResponseEvent::ResponseEvent(const void* source,
                             std::optional<smi::TransportAddress> peer_address,
                             PduPtr request,
                             PduPtr response,
                             UserObject user_object,
                             std::optional<uint64_t> duration_nanos,
                             std::exception_ptr error)
    : source_(source),
      peer_address_(std::move(peer_address)),
      request_(std::move(request)),
      response_(std::move(response)),
      user_object_(std::move(user_object)),
      duration_nanos_(duration_nanos),
      error_(std::move(error)) {
    if (!request_) {
        throw std::invalid_argument("ResponseEvent requires a request PDU");
    }
    if (!response_ && !error_) {
        // A timeout has no responder to attribute
        peer_address_.reset();
    }
}

OutcomeKind ResponseEvent::get_kind() const {
    if (error_) {
        return response_ ? OutcomeKind::PARTIAL_ERROR : OutcomeKind::ERROR;
    }
    return response_ ? OutcomeKind::SUCCESS : OutcomeKind::TIMEOUT;
}

} // namespace snmpkit::event
