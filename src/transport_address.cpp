#include "snmpkit/smi/transport_address.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace snmpkit::smi {

const char* to_string(TransportType type) {
    switch (type) {
    case TransportType::UDP:
        return "udp";
    case TransportType::TCP:
        return "tcp";
    case TransportType::TLS:
        return "tls";
    case TransportType::DTLS:
        return "dtls";
    }
    return "unknown";
}

static std::optional<TransportType> parse_transport_type(std::string prefix) {
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (prefix == "udp") {
        return TransportType::UDP;
    }
    if (prefix == "tcp") {
        return TransportType::TCP;
    }
    if (prefix == "tls") {
        return TransportType::TLS;
    }
    if (prefix == "dtls") {
        return TransportType::DTLS;
    }
    return std::nullopt;
}

std::string TransportAddress::to_string() const {
    return host + "/" + std::to_string(port);
}

std::string TransportAddress::to_uri() const {
    return std::string(smi::to_string(type)) + ":" + to_string();
}

std::optional<TransportAddress> TransportAddress::parse(const std::string& text) {
    TransportAddress address;
    std::string rest = text;

    // IPv6 hosts contain ':' too, so only a known prefix is treated as the type
    auto colon = rest.find(':');
    if (colon != std::string::npos) {
        auto type = parse_transport_type(rest.substr(0, colon));
        if (type) {
            address.type = *type;
            rest = rest.substr(colon + 1);
        } else if (rest.find(':', colon + 1) == std::string::npos) {
            return std::nullopt;
        }
    }

    auto slash = rest.rfind('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size()) {
        return std::nullopt;
    }
    address.host = rest.substr(0, slash);

    const char* first = rest.data() + slash + 1;
    const char* last = rest.data() + rest.size();
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    address.port = static_cast<uint16_t>(port);
    return address;
}

} // namespace snmpkit::smi
