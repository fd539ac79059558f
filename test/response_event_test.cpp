#include <gtest/gtest.h>
#include "snmpkit/event/response_event.hpp"
#include <stdexcept>
#include <string>

using snmpkit::event::EncodingError;
using snmpkit::event::OutcomeKind;
using snmpkit::event::PduPtr;
using snmpkit::event::ResponseEvent;
using snmpkit::event::UserObject;
using snmpkit::smi::Pdu;
using snmpkit::smi::PduType;
using snmpkit::smi::TransportAddress;

class ResponseEventTest : public ::testing::Test {
protected:
    const int source_ = 0;
    const TransportAddress peer_ = {snmpkit::smi::TransportType::UDP, "10.0.0.5", 161};

    PduPtr make_request(int32_t request_id) {
        auto pdu = std::make_shared<Pdu>();
        pdu->type = PduType::GET;
        pdu->request_id = request_id;
        pdu->variable_bindings.push_back({"1.3.6.1.2.1.1.1.0", "Null"});
        return pdu;
    }
    PduPtr make_response(int32_t request_id) {
        auto pdu = std::make_shared<Pdu>();
        pdu->type = PduType::RESPONSE;
        pdu->request_id = request_id;
        pdu->variable_bindings.push_back({"1.3.6.1.2.1.1.1.0", "\"router\""});
        return pdu;
    }
};

TEST_F(ResponseEventTest, SuccessOutcome) {
    auto request = make_request(1);
    auto response = make_response(1);
    UserObject context = std::make_shared<std::string>("ctx-1");

    ResponseEvent event(&source_, peer_, request, response, context, 1500000);

    ASSERT_EQ(event.get_request(), request);
    ASSERT_EQ(event.get_response(), response);
    ASSERT_TRUE(event.get_peer_address().has_value());
    ASSERT_EQ(*event.get_peer_address(), peer_);
    ASSERT_EQ(event.get_user_object(), context);
    ASSERT_EQ(event.get_duration_nanos(), 1500000u);
    ASSERT_EQ(event.get_source(), &source_);
    ASSERT_FALSE(event.has_error());
    ASSERT_EQ(event.get_kind(), OutcomeKind::SUCCESS);
    ASSERT_TRUE(event.is_success());
}

TEST_F(ResponseEventTest, TimeoutOutcome) {
    auto request = make_request(2);
    UserObject context = std::make_shared<std::string>("ctx-2");

    ResponseEvent event(&source_, std::nullopt, request, nullptr, context, 5000000000ULL);

    ASSERT_EQ(event.get_response(), nullptr);
    ASSERT_FALSE(event.get_peer_address().has_value());
    ASSERT_EQ(event.get_error(), nullptr);
    ASSERT_EQ(event.get_duration_nanos(), 5000000000ULL);
    ASSERT_EQ(event.get_kind(), OutcomeKind::TIMEOUT);
    ASSERT_TRUE(event.is_timeout());
    ASSERT_FALSE(event.is_success());
}

TEST_F(ResponseEventTest, TimeoutDropsPeerAddress) {
    testing::internal::CaptureStderr();
    testing::internal::CaptureStdout();
    ResponseEvent event(&source_, peer_, make_request(3), nullptr, nullptr, 10);
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_TRUE(out.empty());
    ASSERT_TRUE(err.empty());
    ASSERT_TRUE(event.is_timeout());
    ASSERT_FALSE(event.get_peer_address().has_value());
}

TEST_F(ResponseEventTest, ProcessingErrorOutcome) {
    auto request = make_request(3);
    auto error = std::make_exception_ptr(EncodingError("bad OID"));

    ResponseEvent event(&source_, std::nullopt, request, nullptr, nullptr, 0, error);

    ASSERT_EQ(event.get_error(), error);
    ASSERT_THROW(std::rethrow_exception(event.get_error()), EncodingError);
    ASSERT_EQ(snmpkit::event::error_message(event.get_error()), "bad OID");
    ASSERT_EQ(event.get_kind(), OutcomeKind::ERROR);
    ASSERT_FALSE(event.is_success());
    ASSERT_FALSE(event.is_timeout());
}

TEST_F(ResponseEventTest, ErrorWinsOverResponse) {
    auto error = std::make_exception_ptr(snmpkit::event::SecurityError("unknown user name"));

    ResponseEvent event(&source_, peer_, make_request(4), make_response(4), nullptr, 200, error);

    ASSERT_NE(event.get_response(), nullptr);
    ASSERT_TRUE(event.get_peer_address().has_value());
    ASSERT_EQ(event.get_kind(), OutcomeKind::PARTIAL_ERROR);
    ASSERT_FALSE(event.is_success());
}

TEST_F(ResponseEventTest, NullRequestIsRejected) {
    ASSERT_THROW({
        ResponseEvent event(&source_, peer_, nullptr, make_response(5));
        (void)event;
    }, std::invalid_argument);
}

TEST_F(ResponseEventTest, UserObjectKeepsIdentity) {
    auto context = std::make_shared<std::string>("ctx");
    UserObject user_object = context;

    ResponseEvent event(&source_, std::nullopt, make_request(6), nullptr, user_object);

    ASSERT_EQ(event.get_user_object().get(), context.get());
    ASSERT_EQ(*std::static_pointer_cast<std::string>(event.get_user_object()), "ctx");
}

TEST_F(ResponseEventTest, NullUserObjectAllowed) {
    ResponseEvent event(&source_, std::nullopt, make_request(7));
    ASSERT_EQ(event.get_user_object(), nullptr);
}

TEST_F(ResponseEventTest, UnmeasuredDurationIsDistinctFromZero) {
    ResponseEvent unmeasured(&source_, std::nullopt, make_request(8));
    ResponseEvent measured_zero(&source_, std::nullopt, make_request(8), nullptr, nullptr, 0);

    ASSERT_EQ(unmeasured.get_duration_nanos(), 0u);
    ASSERT_FALSE(unmeasured.is_duration_measured());
    ASSERT_EQ(measured_zero.get_duration_nanos(), 0u);
    ASSERT_TRUE(measured_zero.is_duration_measured());
}
