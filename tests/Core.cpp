// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroCsms/Core/Frame.h>
#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Core/Configuration.h>
#include <MicroCsms/Core/FilesystemUtils.h>
#include <MicroCsms/Debug.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroCsms;

TEST_CASE( "Frame codec" ) {
    printf("\nRun %s\n",  "Frame codec");

    Frame frame;

    SECTION("Decode Call") {
        const char *raw = "[2,\"19223201\",\"BootNotification\",{\"chargePointVendor\":\"VendorX\",\"chargePointModel\":\"SingleSocketCharger\"}]";
        REQUIRE( decodeFrame(raw, strlen(raw), frame) == DecodeStatus::Ok );
        REQUIRE( frame.type == MessageType::Call );
        REQUIRE( frame.messageId == "19223201" );
        REQUIRE( frame.action == "BootNotification" );
        REQUIRE( !strcmp((*frame.payload)["chargePointVendor"] | "", "VendorX") );
    }

    SECTION("Decode CallResult") {
        const char *raw = "[3,\"1\",{\"status\":\"Accepted\"}]";
        REQUIRE( decodeFrame(raw, strlen(raw), frame) == DecodeStatus::Ok );
        REQUIRE( frame.type == MessageType::CallResult );
        REQUIRE( frame.messageId == "1" );
        REQUIRE( !strcmp((*frame.payload)["status"] | "", "Accepted") );
    }

    SECTION("Decode CallError") {
        const char *raw = "[4,\"2\",\"NotImplemented\",\"Unknown action\",{}]";
        REQUIRE( decodeFrame(raw, strlen(raw), frame) == DecodeStatus::Ok );
        REQUIRE( frame.type == MessageType::CallError );
        REQUIRE( frame.errorCode == "NotImplemented" );
        REQUIRE( frame.errorDescription == "Unknown action" );

        //errorDetails may be omitted
        const char *raw2 = "[4,\"3\",\"InternalError\",\"\"]";
        REQUIRE( decodeFrame(raw2, strlen(raw2), frame) == DecodeStatus::Ok );
        REQUIRE( frame.payload );
    }

    SECTION("Malformed input") {
        const char *notJson = "[2,\"1\",";
        REQUIRE( decodeFrame(notJson, strlen(notJson), frame) == DecodeStatus::MalformedFrame );

        const char *notArray = "{\"action\":\"Heartbeat\"}";
        REQUIRE( decodeFrame(notArray, strlen(notArray), frame) == DecodeStatus::MalformedFrame );
        REQUIRE( frame.messageId.empty() );

        const char *unknownType = "[5,\"1\",\"Heartbeat\",{}]";
        REQUIRE( decodeFrame(unknownType, strlen(unknownType), frame) == DecodeStatus::MalformedFrame );

        const char *idNotString = "[2,1,\"Heartbeat\",{}]";
        REQUIRE( decodeFrame(idNotString, strlen(idNotString), frame) == DecodeStatus::MalformedFrame );
        REQUIRE( frame.messageId.empty() );

        REQUIRE( decodeFrame("", 0, frame) == DecodeStatus::MalformedFrame );
    }

    SECTION("Malformed Call keeps messageId") {
        const char *raw = "[2,\"42\",\"Heartbeat\"]";
        REQUIRE( decodeFrame(raw, strlen(raw), frame) == DecodeStatus::MalformedFrame );
        REQUIRE( frame.type == MessageType::Call );
        REQUIRE( frame.messageId == "42" );
    }

    SECTION("Malformed responses keep their type") {
        const char *shortResult = "[3,\"7\"]";
        REQUIRE( decodeFrame(shortResult, strlen(shortResult), frame) == DecodeStatus::MalformedFrame );
        REQUIRE( frame.type == MessageType::CallResult );
        REQUIRE( frame.messageId == "7" );

        const char *shortError = "[4,\"8\",\"GenericError\"]";
        REQUIRE( decodeFrame(shortError, strlen(shortError), frame) == DecodeStatus::MalformedFrame );
        REQUIRE( frame.type == MessageType::CallError );
        REQUIRE( frame.messageId == "8" );
    }

    SECTION("Encode") {
        auto payload = makeJsonDoc(JSON_OBJECT_SIZE(1));
        (*payload)["transactionId"] = 7;

        std::string out;
        REQUIRE( encodeFrame(makeCall("5", "RemoteStopTransaction", std::move(payload)), out) );
        REQUIRE( out == "[2,\"5\",\"RemoteStopTransaction\",{\"transactionId\":7}]" );

        REQUIRE( encodeFrame(makeCallResult("6", createEmptyDocument()), out) );
        REQUIRE( out == "[3,\"6\",{}]" );

        REQUIRE( encodeFrame(makeCallError("7", "FormationViolation", "Malformed OCPP-J message"), out) );
        REQUIRE( out == "[4,\"7\",\"FormationViolation\",\"Malformed OCPP-J message\",{}]" );

        //no messageId
        REQUIRE( !encodeFrame(makeCallResult("", createEmptyDocument()), out) );
    }

    SECTION("Decoded frame is re-encoded to the same JSON value") {
        const char *raw = "[2,\"abc\",\"MeterValues\",{\"connectorId\":1,\"transactionId\":3,\"meterValue\":[{\"timestamp\":\"2023-01-01T00:00:00Z\",\"sampledValue\":[{\"value\":\"1500\"}]}]}]";
        REQUIRE( decodeFrame(raw, strlen(raw), frame) == DecodeStatus::Ok );
        std::string out;
        REQUIRE( encodeFrame(frame, out) );
        REQUIRE( out == raw );
    }
}

TEST_CASE( "Time" ) {
    printf("\nRun %s\n",  "Time");

    Clock clock;
    clock.setUnixTimeCb(custom_timer_cb);
    mtime = BASE_TIME_UNIX;

    Timestamp t;
    REQUIRE( !t.isDefined() );

    REQUIRE( clock.parseString("2023-01-01T00:00:00.486Z", t) );
    REQUIRE( t.toUnixTime() == BASE_TIME_UNIX );
    REQUIRE( t == clock.now() );

    char buf [MC_JSONDATE_SIZE];
    REQUIRE( clock.toJsonString(t, buf, sizeof(buf)) );
    REQUIRE( !strcmp(buf, BASE_TIME) );

    Timestamp later = t;
    REQUIRE( clock.add(later, 90) );
    int32_t dt;
    REQUIRE( clock.delta(later, t, dt) );
    REQUIRE( dt == 90 );

    REQUIRE( !clock.delta(later, Timestamp(), dt) );
    REQUIRE( !clock.parseString("yesterday", t) );

    //non-ASCII bytes from the charge point are rejected like any other non-digit
    Timestamp parsed;
    REQUIRE( !clock.parseString("2023-01-0\xC3\xA9T00:00:00Z", parsed) );
    REQUIRE( !clock.parseString("\xFF\xFE\xFD\xFC-01-01T00:00:00Z", parsed) );
    REQUIRE( !parsed.isDefined() );
}

TEST_CASE( "Configuration" ) {
    printf("\nRun %s\n",  "Configuration");

    SECTION("Factory defaults and validation") {
        ConfigurationService configuration {nullptr};

        auto callTimeout = configuration.declareConfiguration<int>("CallTimeout", 10);
        configuration.registerValidator("CallTimeout", VALIDATE_UNSIGNED_INT);
        REQUIRE( callTimeout->getInt() == 10 );

        REQUIRE( configuration.setConfiguration("CallTimeout", "30") );
        REQUIRE( callTimeout->getInt() == 30 );

        REQUIRE( !configuration.setConfiguration("CallTimeout", "-1") );
        REQUIRE( !configuration.setConfiguration("CallTimeout", "ten") );
        REQUIRE( callTimeout->getInt() == 30 );

        REQUIRE( !configuration.setConfiguration("UnknownKey", "1") );
    }

    SECTION("Persistency") {
        auto filesystem = makeTestFilesystem();
        REQUIRE( filesystem );

        {
            ConfigurationService configuration {filesystem};
            REQUIRE( configuration.load() );
            configuration.declareConfiguration<int>("StalenessThreshold", 90);
            REQUIRE( configuration.setConfiguration("StalenessThreshold", "120") );
            REQUIRE( configuration.save() );
        }

        ConfigurationService configuration {filesystem};
        REQUIRE( configuration.load() );
        auto threshold = configuration.declareConfiguration<int>("StalenessThreshold", 90);
        REQUIRE( threshold->getInt() == 120 );
    }

    SECTION("Store not accessible") {
        ConfigurationService configuration {std::make_shared<FailingFilesystemAdapter>()};
        REQUIRE( configuration.load() ); //no file yet, continue with defaults
        auto listenPort = configuration.declareConfiguration<int>("ListenPort", 8180);
        REQUIRE( listenPort->getInt() == 8180 );
        REQUIRE( !configuration.save() );
    }
}
