#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace snmpkit::smi {

enum class TransportType {
    UDP,
    TCP,
    TLS,
    DTLS
};

const char* to_string(TransportType type);

/*
 * Transport-level address of an SNMP peer.
 * Text form is "<host>/<port>", optionally prefixed by "<type>:".
 */
struct TransportAddress {
    TransportType type = TransportType::UDP;
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;
    std::string to_uri() const;

    /**
     * @brief Parses "[udp|tcp|tls|dtls:]host/port".
     * @return The address, or std::nullopt if the text is not a valid address.
     */
    static std::optional<TransportAddress> parse(const std::string& text);

    bool operator==(const TransportAddress& other) const {
        return type == other.type && host == other.host && port == other.port;
    }
    bool operator!=(const TransportAddress& other) const {
        return !(*this == other);
    }
};

} // namespace snmpkit::smi
