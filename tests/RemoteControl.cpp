// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <thread>
#include <string.h>

#include <MicroCsms.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Debug.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroCsms;

TEST_CASE( "Remote control" ) {
    printf("\nRun %s\n",  "Remote control");

    TestSystem sys;
    sys.chargers->add("CP001");

    auto conn = std::make_shared<TestConnection>();
    auto session = sys.connect("CP001", conn);
    REQUIRE( session );

    RemoteCommandResult res;
    std::thread caller;

    //the test thread plays the charge point: it awaits the Call and then answers with `response`
    auto respond = [&] (Frame& call, const char *response) {
        REQUIRE( conn->awaitSent(1) );
        REQUIRE( conn->decodeSent(0, call) );
        REQUIRE( call.type == MessageType::Call );

        std::string msg = response;
        auto pos = msg.find("$id");
        REQUIRE( pos != std::string::npos );
        msg.replace(pos, 3, call.messageId);
        REQUIRE( session->receiveMessage(msg.c_str(), msg.length()) );
        caller.join();
    };

    Frame call;

    SECTION("RemoteStartTransaction") {
        caller = std::thread([&] () {
            res = sys.csms.remoteStartTransaction("CP001", 1, "TAG0001");
        });
        respond(call, "[3,\"$id\",{\"status\":\"Accepted\"}]");

        REQUIRE( call.action == "RemoteStartTransaction" );
        REQUIRE( ((*call.payload)["connectorId"] | -1) == 1 );
        REQUIRE( !strcmp((*call.payload)["idTag"] | "", "TAG0001") );

        REQUIRE( res.error == CommandError::None );
        REQUIRE( res.status == RemoteStatus::Accepted );
        REQUIRE( res.isAccepted() );
    }

    SECTION("RemoteStartTransaction on any connector, rejected") {
        caller = std::thread([&] () {
            res = sys.csms.remoteStartTransaction("CP001", 0, "TAG0001");
        });
        respond(call, "[3,\"$id\",{\"status\":\"Rejected\"}]");

        REQUIRE( !(*call.payload).containsKey("connectorId") );
        REQUIRE( res.error == CommandError::None );
        REQUIRE( res.status == RemoteStatus::Rejected );
        REQUIRE( !res.isAccepted() );
    }

    SECTION("RemoteStartTransaction with invalid idTag") {
        res = sys.csms.remoteStartTransaction("CP001", 1, "TAG00000000000000000001");
        REQUIRE( res.error == CommandError::CommandRejected );
        REQUIRE( res.errorCode == "PropertyConstraintViolation" );
        REQUIRE( conn->getSentCount() == 0 );
    }

    SECTION("RemoteStopTransaction") {
        caller = std::thread([&] () {
            res = sys.csms.remoteStopTransaction("CP001", 17);
        });
        respond(call, "[3,\"$id\",{\"status\":\"Accepted\"}]");

        REQUIRE( call.action == "RemoteStopTransaction" );
        REQUIRE( ((*call.payload)["transactionId"] | -1) == 17 );
        REQUIRE( res.isAccepted() );
    }

    SECTION("ChangeAvailability") {
        caller = std::thread([&] () {
            res = sys.csms.changeAvailability("CP001", 0, AvailabilityType::Inoperative);
        });
        respond(call, "[3,\"$id\",{\"status\":\"Scheduled\"}]");

        REQUIRE( call.action == "ChangeAvailability" );
        REQUIRE( ((*call.payload)["connectorId"] | -1) == 0 );
        REQUIRE( !strcmp((*call.payload)["type"] | "", "Inoperative") );
        REQUIRE( res.status == RemoteStatus::Scheduled );
        REQUIRE( res.isAccepted() );
    }

    SECTION("Reset rejected with CallError") {
        caller = std::thread([&] () {
            res = sys.csms.reset("CP001", ResetType::Hard);
        });
        respond(call, "[4,\"$id\",\"NotSupported\",\"Hard reset not supported\",{}]");

        REQUIRE( call.action == "Reset" );
        REQUIRE( !strcmp((*call.payload)["type"] | "", "Hard") );
        REQUIRE( res.error == CommandError::CommandRejected );
        REQUIRE( res.errorCode == "NotSupported" );
        REQUIRE( !res.isAccepted() );
    }

    SECTION("Invalid confirmation") {
        caller = std::thread([&] () {
            res = sys.csms.reset("CP001", ResetType::Soft);
        });
        respond(call, "[3,\"$id\",{\"status\":\"Maybe\"}]");

        REQUIRE( res.error == CommandError::None );
        REQUIRE( res.status == RemoteStatus::ERR_INTERNAL );
        REQUIRE( !res.isAccepted() );
    }

    SECTION("Charger not connected") {
        sys.chargers->add("CP002");
        res = sys.csms.remoteStopTransaction("CP002", 1);
        REQUIRE( res.error == CommandError::NotConnected );
        REQUIRE( !res.isAccepted() );
    }

    if (caller.joinable()) {
        caller.join();
    }
}
