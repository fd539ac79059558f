#include "snmpkit/event/response_event_factory_loader.hpp"
#include "snmpkit/event/response_notifier.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace snmpkit;

namespace {
event::PduPtr make_get(int32_t request_id, const std::string& oid) {
    auto pdu = std::make_shared<smi::Pdu>();
    pdu->type = smi::PduType::GET;
    pdu->request_id = request_id;
    pdu->variable_bindings.push_back({oid, "Null"});
    return pdu;
}

event::PduPtr make_response(const event::PduPtr& request, const std::string& value) {
    auto pdu = std::make_shared<smi::Pdu>();
    pdu->type = smi::PduType::RESPONSE;
    pdu->request_id = request->request_id;
    for (const auto& vb : request->variable_bindings) {
        pdu->variable_bindings.push_back({vb.oid, value});
    }
    return pdu;
}

void print_outcome(const std::string& name, const event::ResponseEventPtr& event) {
    if (!event) {
        std::cerr << name << ": no outcome delivered" << std::endl;
        return;
    }
    std::cout << name << ": " << event::to_string(event->get_kind())
              << " context=" << *std::static_pointer_cast<std::string>(event->get_user_object());
    if (event->get_response()) {
        std::cout << " response=" << event->get_response()->to_string();
    }
    if (event->get_peer_address()) {
        std::cout << " peer=" << event->get_peer_address()->to_string();
    }
    if (event->has_error()) {
        std::cout << " error=" << event::error_message(event->get_error());
    }
    std::cout << std::endl;
}
}

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config_path]" << std::endl;
        return 1;
    }
    const std::string config_path = (argc == 2) ? argv[1] : "config/sample/response_event.json";

    event::ResponseEventFactoryLoader loader;
    if (!loader.load(config_path)) {
        std::cerr << "Failed to load response event config" << std::endl;
        return 1;
    }
    event::ResponseNotifier notifier(nullptr, loader.create_factory());
    auto peer = smi::TransportAddress::parse("udp:10.0.0.5/161");

    auto r1 = make_get(1, "1.3.6.1.2.1.1.1.0");
    auto r2 = make_get(2, "1.3.6.1.2.1.1.3.0");
    auto r3 = make_get(3, "1.3.6.1.2.1.1.5.0");
    event::SyncResponseListener l1;
    event::SyncResponseListener l2;
    event::SyncResponseListener l3;

    // Each request is resolved on its own thread, as a transport or timer thread would
    std::vector<std::thread> workers;
    workers.emplace_back([&] {
        notifier.notify(&l1, peer, r1, make_response(r1, "\"Linux router\""),
                        std::make_shared<std::string>("ctx-1"), 1500000);
    });
    workers.emplace_back([&] {
        notifier.notify(&l2, std::nullopt, r2, nullptr,
                        std::make_shared<std::string>("ctx-2"), 5000000000ULL);
    });
    workers.emplace_back([&] {
        notifier.notify(&l3, std::nullopt, r3, nullptr,
                        std::make_shared<std::string>("ctx-3"), std::nullopt,
                        std::make_exception_ptr(event::EncodingError("bad OID")));
    });

    print_outcome("r1", l1.wait(1000000));
    print_outcome("r2", l2.wait(1000000));
    print_outcome("r3", l3.wait(1000000));
    for (auto& worker : workers) {
        worker.join();
    }

    auto stats_factory = loader.get_statistics_factory();
    if (stats_factory) {
        auto stats = stats_factory->get_statistics();
        std::cout << "success=" << stats.success_count
                  << " timeout=" << stats.timeout_count
                  << " error=" << stats.error_count
                  << " partial_error=" << stats.partial_error_count
                  << " avg_nanos=" << stats.get_average_duration_nanos() << std::endl;
    }
    return 0;
}
