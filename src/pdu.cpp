#include "snmpkit/smi/pdu.hpp"
#include <sstream>

namespace snmpkit::smi {

const char* to_string(PduType type) {
    switch (type) {
    case PduType::GET:
        return "GET";
    case PduType::GETNEXT:
        return "GETNEXT";
    case PduType::GETBULK:
        return "GETBULK";
    case PduType::SET:
        return "SET";
    case PduType::INFORM:
        return "INFORM";
    case PduType::RESPONSE:
        return "RESPONSE";
    case PduType::REPORT:
        return "REPORT";
    case PduType::TRAP:
        return "TRAP";
    }
    return "UNKNOWN";
}

std::string Pdu::to_string() const {
    std::ostringstream oss;
    oss << smi::to_string(type)
        << "[requestID=" << request_id
        << ", errorStatus=" << error_status
        << ", errorIndex=" << error_index
        << ", VBS[";
    for (size_t i = 0; i < variable_bindings.size(); ++i) {
        if (i > 0) {
            oss << "; ";
        }
        oss << variable_bindings[i].oid << " = " << variable_bindings[i].value;
    }
    oss << "]]";
    return oss.str();
}

} // namespace snmpkit::smi
