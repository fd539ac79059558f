#include "snmpkit/event/logging_response_event_factory.hpp"
#include <iomanip>
#include <mutex>
#include <sstream>

namespace snmpkit::event {

namespace {
std::mutex log_mutex;
}

const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::NONE:
        return "NONE";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::DEBUG:
        return "DEBUG";
    }
    return "UNKNOWN";
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    if (text == "NONE") {
        level = LogLevel::NONE;
    } else if (text == "INFO") {
        level = LogLevel::INFO;
    } else if (text == "DEBUG") {
        level = LogLevel::DEBUG;
    } else {
        return false;
    }
    return true;
}

LoggingResponseEventFactory::LoggingResponseEventFactory(std::shared_ptr<IResponseEventFactory> delegate,
                                                         LogLevel level, std::ostream& out)
    : DelegatingResponseEventFactory(std::move(delegate)), level_(level), out_(out) {}

ResponseEventPtr LoggingResponseEventFactory::create_response_event(
    const void* source,
    const std::optional<smi::TransportAddress>& peer_address,
    const PduPtr& request,
    const PduPtr& response,
    const UserObject& user_object,
    std::optional<uint64_t> duration_nanos,
    const std::exception_ptr& error) {
    try {
        log_outcome(peer_address, request, response, duration_nanos, error);
    } catch (const std::exception& e) {
        // the outcome must still be delivered
        std::cerr << "WARNING: Failed to log response event: " << e.what() << std::endl;
    }
    return delegate_->create_response_event(source, peer_address, request, response,
                                            user_object, duration_nanos, error);
}

void LoggingResponseEventFactory::log_outcome(const std::optional<smi::TransportAddress>& peer_address,
                                              const PduPtr& request, const PduPtr& response,
                                              std::optional<uint64_t> duration_nanos,
                                              const std::exception_ptr& error) {
    if (level_ == LogLevel::NONE || !request) {
        return;
    }
    bool failed = (error != nullptr) || (response == nullptr);
    if (level_ == LogLevel::INFO && !failed) {
        return;
    }

    bool timed_out = !response && !error;
    std::ostringstream line;
    if (error) {
        line << "ERROR: ";
    } else if (timed_out) {
        line << "INFO: ";
    } else {
        line << "DEBUG: ";
    }
    line << "Request done in ";
    if (duration_nanos) {
        line << std::fixed << std::setprecision(6)
             << static_cast<double>(*duration_nanos) / 1000000.0 << " ms";
    } else {
        line << "(not measured)";
    }
    line << ": " << request->to_string() << "->"
         << (response ? response->to_string() : std::string("null"));
    if (peer_address && !timed_out) {
        line << " from " << peer_address->to_string();
    }
    if (timed_out) {
        line << ", timed out";
    }
    if (error) {
        line << ", error=" << error_message(error);
    }

    std::lock_guard<std::mutex> lock(log_mutex);
    out_ << line.str() << std::endl;
}

} // namespace snmpkit::event
