#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace snmpkit::smi {

enum class PduType {
    GET,
    GETNEXT,
    GETBULK,
    SET,
    INFORM,
    RESPONSE,
    REPORT,
    TRAP
};

const char* to_string(PduType type);

// Text form of a variable binding; BER encoding lives in the message codec.
struct VariableBinding {
    std::string oid;
    std::string value;
};

struct Pdu {
    PduType type = PduType::GET;
    int32_t request_id = 0;
    int32_t error_status = 0;
    int32_t error_index = 0;
    std::vector<VariableBinding> variable_bindings;

    std::string to_string() const;
};

} // namespace snmpkit::smi
