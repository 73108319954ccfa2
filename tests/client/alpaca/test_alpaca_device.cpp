/*
 * test_alpaca_device.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "client/alpaca/alpaca_device.hpp"
#include "device/common/bridge_exceptions.hpp"
#include "support/test_doubles.hpp"

using namespace skybridge::client::alpaca;
using skybridge::device::ConnectionFailedException;
using skybridge::tests::HttpResult;
using skybridge::tests::MockHttpTransport;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

auto alpacaOk(const json& value) -> HttpResult {
    return HttpResponse{200, json{{"Value", value},
                                  {"ErrorNumber", 0},
                                  {"ErrorMessage", ""}}
                                 .dump()};
}

}  // namespace

class AlpacaDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<StrictMock<MockHttpTransport>>();
    }

    std::shared_ptr<StrictMock<MockHttpTransport>> transport_;
};

TEST_F(AlpacaDeviceTest, BuildsAlpacaUrl) {
    AlpacaTelescope telescope(transport_, {"192.168.1.50", 5555, 1});
    EXPECT_EQ(telescope.buildUrl("canslew"),
              "http://192.168.1.50:5555/api/v1/telescope/1/canslew");

    AlpacaFilterWheel wheel(transport_, {"localhost", 11111, 0});
    EXPECT_EQ(wheel.buildUrl("names"),
              "http://localhost:11111/api/v1/filterwheel/0/names");
}

TEST_F(AlpacaDeviceTest, GetAddsClientIds) {
    AlpacaTelescope telescope(transport_, {"localhost", 5555, 1});

    EXPECT_CALL(*transport_,
                get("http://localhost:5555/api/v1/telescope/1/connected"
                    "?ClientID=1&ClientTransactionID=1",
                    _))
        .WillOnce(Return(alpacaOk(true)));

    EXPECT_TRUE(telescope.isConnected());
}

TEST_F(AlpacaDeviceTest, SetConnectedPutsFormBody) {
    AlpacaCamera camera(transport_, {"localhost", 11111, 0});

    EXPECT_CALL(*transport_,
                put("http://localhost:11111/api/v1/camera/0/connected",
                    "Connected=true&ClientID=1&ClientTransactionID=1", _))
        .WillOnce(Return(alpacaOk(nullptr)));

    camera.setConnected(true);
}

TEST_F(AlpacaDeviceTest, AlpacaErrorBecomesConnectionFailure) {
    AlpacaFocuser focuser(transport_, {"localhost", 11111, 0});

    EXPECT_CALL(*transport_, put(_, _, _))
        .WillOnce(Return(HttpResponse{
            200, R"({"Value": null, "ErrorNumber": 1031,
                    "ErrorMessage": "Not connected"})"}));

    try {
        focuser.setConnected(true);
        FAIL() << "expected ConnectionFailedException";
    } catch (const ConnectionFailedException& e) {
        EXPECT_THAT(e.what(), HasSubstr("1031"));
        EXPECT_THAT(e.what(), HasSubstr("Not connected"));
        EXPECT_EQ(e.kindName(), "connection_failed");
    }
}

TEST_F(AlpacaDeviceTest, HttpAndTransportFailuresThrow) {
    AlpacaTelescope telescope(transport_, {"localhost", 5555, 1});

    EXPECT_CALL(*transport_, get(_, _))
        .WillOnce(Return(HttpResponse{500, "oops"}))
        .WillOnce(Return(HttpResponse{200, "not json"}))
        .WillOnce(Return(std::unexpected(
            HttpError{HttpErrorCode::Timeout, "timed out"})));

    EXPECT_THROW(static_cast<void>(telescope.canSlew()),
                 ConnectionFailedException);
    EXPECT_THROW(static_cast<void>(telescope.canSlew()),
                 ConnectionFailedException);
    EXPECT_THROW(static_cast<void>(telescope.canSlew()),
                 ConnectionFailedException);
}

TEST_F(AlpacaDeviceTest, ExtendedInfoSkipsFailingFields) {
    AlpacaFocuser focuser(transport_, {"localhost", 11111, 0});

    EXPECT_CALL(*transport_, get(HasSubstr("/driverinfo?"), _))
        .WillOnce(Return(alpacaOk("Focuser driver")));
    EXPECT_CALL(*transport_, get(HasSubstr("/driverversion?"), _))
        .WillOnce(Return(alpacaOk("2.1")));
    EXPECT_CALL(*transport_, get(HasSubstr("/interfaceversion?"), _))
        .WillOnce(Return(HttpResponse{404, ""}));
    EXPECT_CALL(*transport_, get(HasSubstr("/description?"), _))
        .WillOnce(Return(alpacaOk("Test focuser")));
    EXPECT_CALL(*transport_, get(HasSubstr("/position?"), _))
        .WillOnce(Return(alpacaOk(12000)));

    auto info = focuser.extendedInfo();

    EXPECT_EQ(info["driver_info"], "Focuser driver");
    EXPECT_EQ(info["driver_version"], "2.1");
    EXPECT_FALSE(info.contains("interface_version"));
    EXPECT_EQ(info["description"], "Test focuser");
    EXPECT_EQ(info["position"], 12000);
}

TEST(AlpacaResponseTest, FromJson) {
    auto response = AlpacaResponse::fromJson(
        {{"Value", json::array({"Red", "Green"})},
         {"ErrorNumber", 0},
         {"ClientTransactionID", 7},
         {"ServerTransactionID", 42}});

    EXPECT_TRUE(response.isSuccess());
    EXPECT_EQ(response.value.size(), 2u);
    EXPECT_EQ(response.clientTransactionId, 7);
    EXPECT_EQ(response.serverTransactionId, 42);
}

TEST(UrlEncodeTest, EscapesReservedCharacters) {
    EXPECT_EQ(urlEncode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(urlEncode("a b&c"), "a%20b%26c");
}
