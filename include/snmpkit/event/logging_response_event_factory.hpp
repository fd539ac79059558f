#pragma once

#include "response_event_factory.hpp"
#include <iostream>
#include <ostream>
#include <string>

namespace snmpkit::event {

enum class LogLevel {
    NONE,
    INFO,   // timeouts and errors only
    DEBUG   // every outcome
};

const char* to_string(LogLevel level);
bool parse_log_level(const std::string& text, LogLevel& level);

/*
 * Writes one line per outcome and then delegates.
 * A failing log stream never prevents the event from being returned.
 */
class LoggingResponseEventFactory : public DelegatingResponseEventFactory {
public:
    explicit LoggingResponseEventFactory(std::shared_ptr<IResponseEventFactory> delegate = nullptr,
                                         LogLevel level = LogLevel::DEBUG,
                                         std::ostream& out = std::cerr);

    ResponseEventPtr create_response_event(
        const void* source,
        const std::optional<smi::TransportAddress>& peer_address,
        const PduPtr& request,
        const PduPtr& response,
        const UserObject& user_object,
        std::optional<uint64_t> duration_nanos,
        const std::exception_ptr& error) override;

    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    std::ostream& out_;

    void log_outcome(const std::optional<smi::TransportAddress>& peer_address,
                     const PduPtr& request, const PduPtr& response,
                     std::optional<uint64_t> duration_nanos,
                     const std::exception_ptr& error);
};

} // namespace snmpkit::event
