// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <chrono>
#include <thread>
#include <string.h>

#include <MicroCsms.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Server/Session.h>
#include <MicroCsms/Server/SessionManager.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Registry/ConnectionRegistry.h>
#include <MicroCsms/Model/Audit/AuditLog.h>
#include <MicroCsms/Debug.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroCsms;

namespace {

//polls until the session manager has released the charge point
bool awaitDisconnected(CentralSystem& csms, const char *chargePointId) {
    for (int i = 0; i < 200 && csms.isConnected(chargePointId); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return !csms.isConnected(chargePointId);
}

} //namespace

TEST_CASE( "Session admission" ) {
    printf("\nRun %s\n",  "Session admission");

    TestSystem sys;
    sys.chargers->add("CP001");

    auto conn = std::make_shared<TestConnection>();

    SECTION("Registered charger") {
        auto session = sys.connect("CP001", conn);
        REQUIRE( session );
        REQUIRE( session->getState() == Session::State::Active );
        REQUIRE( sys.csms.isConnected("CP001") );
        REQUIRE( sys.csms.getContext().getConnectionRegistry()->exists("CP001") );
    }

    SECTION("Unregistered charger") {
        REQUIRE( !sys.connect("CP999", conn) );
        REQUIRE( conn->getCloseCount() == 1 );
        REQUIRE( conn->getCloseCode() == MC_CLOSE_POLICY_VIOLATION );
        REQUIRE( !strcmp(conn->getCloseReason(), "Charger CP999 not registered in system") );
        REQUIRE( !sys.csms.isConnected("CP999") );
        REQUIRE( !sys.csms.getContext().getConnectionRegistry()->exists("CP999") );
    }

    SECTION("Second connection of the same charger") {
        REQUIRE( sys.connect("CP001", conn) );

        auto conn2 = std::make_shared<TestConnection>();
        REQUIRE( !sys.connect("CP001", conn2) );
        REQUIRE( conn2->getCloseCode() == MC_CLOSE_POLICY_VIOLATION );
        REQUIRE( !strcmp(conn2->getCloseReason(), "Charger CP001 is already connected") );

        //the first session is not affected
        REQUIRE( conn->isConnected() );
        REQUIRE( sys.csms.isConnected("CP001") );
    }

    SECTION("Concurrent admission") {
        auto& sessionManager = sys.csms.getContext().getSessionManager();

        std::atomic<int> admitted {0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; i++) {
            threads.emplace_back([&sys, &sessionManager, &admitted] () {
                auto session = std::make_shared<Session>(sys.csms.getContext(), "CP001", std::make_shared<TestConnection>());
                if (sessionManager.admit("CP001", session) == AdmitResult::Admitted) {
                    admitted++;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        REQUIRE( admitted == 1 );
        REQUIRE( sessionManager.size() == 1 );
    }

    SECTION("Disconnect and reconnect") {
        auto session = sys.connect("CP001", conn, true);
        REQUIRE( session );

        conn->closeByPeer();
        REQUIRE( awaitDisconnected(sys.csms, "CP001") );
        REQUIRE( session->getState() == Session::State::Closed );
        REQUIRE( !sys.csms.getContext().getConnectionRegistry()->exists("CP001") );

        auto conn2 = std::make_shared<TestConnection>();
        REQUIRE( sys.connect("CP001", conn2, true) );
        REQUIRE( sys.csms.isConnected("CP001") );
    }

    SECTION("Evict") {
        REQUIRE( sys.connect("CP001", conn, true) );

        REQUIRE( sys.csms.evict("CP001", "maintenance") );
        REQUIRE( conn->getCloseCode() == MC_CLOSE_GOING_AWAY );
        REQUIRE( !strcmp(conn->getCloseReason(), "Server cleanup: maintenance") );
        REQUIRE( awaitDisconnected(sys.csms, "CP001") );

        REQUIRE( !sys.csms.evict("CP001", "maintenance") );
    }
}

TEST_CASE( "Incoming Calls" ) {
    printf("\nRun %s\n",  "Incoming Calls");

    TestSystem sys;
    sys.chargers->add("CP001");

    auto conn = std::make_shared<TestConnection>();
    auto session = sys.connect("CP001", conn);
    REQUIRE( session );

    Frame response;

    SECTION("Heartbeat") {
        REQUIRE( sys.sendCall(*session, *conn, "[2,\"m1\",\"Heartbeat\",{}]", response) );
        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( response.messageId == "m1" );
        REQUIRE( !strcmp((*response.payload)["currentTime"] | "", BASE_TIME) );

        Charger charger;
        REQUIRE( sys.chargers->get("CP001", charger) );
        REQUIRE( charger.lastHeartbeat.toUnixTime() == BASE_TIME_UNIX );
    }

    SECTION("Unknown action is acknowledged") {
        REQUIRE( sys.sendCall(*session, *conn, "[2,\"m2\",\"DataTransfer\",{\"vendorId\":\"x\"}]", response) );
        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( response.messageId == "m2" );
        REQUIRE( response.payload->as<JsonObject>().size() == 0 );
    }

    SECTION("Malformed Call") {
        REQUIRE( sys.sendCall(*session, *conn, "[2,\"m3\",\"Heartbeat\"]", response) );
        REQUIRE( response.type == MessageType::CallError );
        REQUIRE( response.messageId == "m3" );
        REQUIRE( response.errorCode == "FormationViolation" );
    }

    SECTION("Frames without messageId are dropped") {
        const char *notArray = "{\"hello\":\"world\"}";
        REQUIRE( !session->receiveMessage(notArray, strlen(notArray)) );
        const char *notJson = "hello world";
        REQUIRE( !session->receiveMessage(notJson, strlen(notJson)) );
        REQUIRE( conn->getSentCount() == 0 );
        REQUIRE( session->getState() == Session::State::Active );
    }

    SECTION("Handler rejects payload") {
        REQUIRE( sys.sendCall(*session, *conn, "[2,\"m4\",\"BootNotification\",{\"chargePointVendor\":\"VendorX\"}]", response) );
        REQUIRE( response.type == MessageType::CallError );
        REQUIRE( response.errorCode == "FormationViolation" );
    }

    SECTION("Audit log") {
        auto auditLog = static_cast<VolatileAuditLog*>(sys.csms.getContext().getAuditLog());
        auditLog->clear();

        REQUIRE( sys.sendCall(*session, *conn, "[2,\"m5\",\"Heartbeat\",{}]", response) );

        auto records = auditLog->getRecords();
        REQUIRE( records.size() == 2 );
        REQUIRE( records[0].direction == MessageDirection::In );
        REQUIRE( records[0].correlationId == "m5" );
        REQUIRE( records[0].status == "received" );
        REQUIRE( records[0].payload == "[2,\"m5\",\"Heartbeat\",{}]" );
        REQUIRE( records[1].direction == MessageDirection::Out );
        REQUIRE( records[1].correlationId == "m5" );
        REQUIRE( records[1].status == "sent" );
    }
}

TEST_CASE( "Outgoing Calls" ) {
    printf("\nRun %s\n",  "Outgoing Calls");

    TestSystem sys;
    sys.chargers->add("CP001");

    auto conn = std::make_shared<TestConnection>();
    auto session = sys.connect("CP001", conn);
    REQUIRE( session );

    auto payload = initJsonDoc(JSON_OBJECT_SIZE(1));
    payload["requestedMessage"] = "StatusNotification";

    SECTION("Not connected") {
        auto res = sys.csms.sendCommand("CP002", "TriggerMessage", payload);
        REQUIRE( res.error == CommandError::NotConnected );
    }

    SECTION("CallResult") {
        CommandResult res;
        std::thread caller ([&sys, &payload, &res] () {
            res = sys.csms.sendCommand("CP001", "TriggerMessage", payload);
        });

        REQUIRE( conn->awaitSent(1) );
        Frame call;
        REQUIRE( conn->decodeSent(0, call) );
        REQUIRE( call.type == MessageType::Call );
        REQUIRE( call.messageId == "1" );
        REQUIRE( call.action == "TriggerMessage" );
        REQUIRE( !strcmp((*call.payload)["requestedMessage"] | "", "StatusNotification") );

        const char *conf = "[3,\"1\",{\"status\":\"Accepted\"}]";
        REQUIRE( session->receiveMessage(conf, strlen(conf)) );
        caller.join();

        REQUIRE( res.isSuccess() );
        REQUIRE( !strcmp((*res.payload)["status"] | "", "Accepted") );
        REQUIRE( session->getPendingCount() == 0 );
    }

    SECTION("CallError") {
        CommandResult res;
        std::thread caller ([&sys, &payload, &res] () {
            res = sys.csms.sendCommand("CP001", "TriggerMessage", payload);
        });

        REQUIRE( conn->awaitSent(1) );
        const char *err = "[4,\"1\",\"NotSupported\",\"TriggerMessage not supported\",{}]";
        REQUIRE( session->receiveMessage(err, strlen(err)) );
        caller.join();

        REQUIRE( res.error == CommandError::CommandRejected );
        REQUIRE( res.errorCode == "NotSupported" );
        REQUIRE( res.errorDescription == "TriggerMessage not supported" );
    }

    SECTION("Responses in reverse order") {
        auto payload2 = initJsonDoc(JSON_OBJECT_SIZE(1));
        payload2["key"] = "HeartbeatInterval";

        CommandResult resTrigger, resGetConfig;
        std::thread caller1 ([&sys, &payload, &resTrigger] () {
            resTrigger = sys.csms.sendCommand("CP001", "TriggerMessage", payload);
        });
        std::thread caller2 ([&sys, &payload2, &resGetConfig] () {
            resGetConfig = sys.csms.sendCommand("CP001", "GetConfiguration", payload2);
        });

        REQUIRE( conn->awaitSent(2) );

        Frame call1, call2;
        REQUIRE( conn->decodeSent(0, call1) );
        REQUIRE( conn->decodeSent(1, call2) );
        REQUIRE( call1.messageId != call2.messageId );

        //answer the most recent Call first. The responses are correlated by messageId only
        std::string conf2 = "[3,\"" + call2.messageId + "\",{\"action\":\"" + call2.action + "\"}]";
        std::string conf1 = "[3,\"" + call1.messageId + "\",{\"action\":\"" + call1.action + "\"}]";
        REQUIRE( session->receiveMessage(conf2.c_str(), conf2.length()) );
        REQUIRE( session->receiveMessage(conf1.c_str(), conf1.length()) );

        caller1.join();
        caller2.join();

        REQUIRE( resTrigger.isSuccess() );
        REQUIRE( !strcmp((*resTrigger.payload)["action"] | "", "TriggerMessage") );
        REQUIRE( resGetConfig.isSuccess() );
        REQUIRE( !strcmp((*resGetConfig.payload)["action"] | "", "GetConfiguration") );
    }

    SECTION("Timeout and late response") {
        auto res = sys.csms.sendCommand("CP001", "TriggerMessage", payload, 100);
        REQUIRE( res.error == CommandError::CommandTimeout );
        REQUIRE( session->getPendingCount() == 0 );

        //the late response is dropped
        const char *conf = "[3,\"1\",{\"status\":\"Accepted\"}]";
        REQUIRE( session->receiveMessage(conf, strlen(conf)) );
        REQUIRE( session->getPendingCount() == 0 );

        //the session is still usable
        CommandResult res2;
        std::thread caller ([&sys, &payload, &res2] () {
            res2 = sys.csms.sendCommand("CP001", "TriggerMessage", payload);
        });
        REQUIRE( conn->awaitSent(2) );
        Frame call;
        REQUIRE( conn->decodeSent(1, call) );
        REQUIRE( call.messageId == "2" );
        const char *conf2 = "[3,\"2\",{\"status\":\"Rejected\"}]";
        REQUIRE( session->receiveMessage(conf2, strlen(conf2)) );
        caller.join();
        REQUIRE( res2.isSuccess() );
    }

    SECTION("Malformed responses") {
        CommandResult res;
        std::thread caller ([&sys, &payload, &res] () {
            res = sys.csms.sendCommand("CP001", "TriggerMessage", payload);
        });

        REQUIRE( conn->awaitSent(1) );
        const char *shortResult = "[3,\"1\"]";
        REQUIRE( !session->receiveMessage(shortResult, strlen(shortResult)) );
        caller.join();

        //the caller is released at once and the charge point gets no CallError for its response
        REQUIRE( res.error == CommandError::CommandRejected );
        REQUIRE( res.errorCode == "FormationViolation" );
        REQUIRE( session->getPendingCount() == 0 );
        REQUIRE( conn->getSentCount() == 1 );

        CommandResult res2;
        std::thread caller2 ([&sys, &payload, &res2] () {
            res2 = sys.csms.sendCommand("CP001", "TriggerMessage", payload);
        });

        REQUIRE( conn->awaitSent(2) );
        const char *shortError = "[4,\"2\",\"NotSupported\"]";
        REQUIRE( !session->receiveMessage(shortError, strlen(shortError)) );
        caller2.join();

        REQUIRE( res2.error == CommandError::CommandRejected );
        REQUIRE( res2.errorCode == "FormationViolation" );
        REQUIRE( conn->getSentCount() == 2 );
    }

    SECTION("Transport failure") {
        conn->failSend = true;
        auto res = sys.csms.sendCommand("CP001", "TriggerMessage", payload);
        REQUIRE( res.error == CommandError::NotConnected );
        REQUIRE( session->getPendingCount() == 0 );
    }
}

TEST_CASE( "Connection loss releases waiting callers" ) {
    printf("\nRun %s\n",  "Connection loss releases waiting callers");

    TestSystem sys;
    sys.chargers->add("CP001");

    auto conn = std::make_shared<TestConnection>();
    auto session = sys.connect("CP001", conn, true);
    REQUIRE( session );

    auto payload = initJsonDoc(JSON_OBJECT_SIZE(1));
    payload["type"] = "Soft";

    CommandResult res;
    auto start = std::chrono::steady_clock::now();
    std::thread caller ([&sys, &payload, &res] () {
        res = sys.csms.sendCommand("CP001", "Reset", payload);
    });

    REQUIRE( conn->awaitSent(1) );
    conn->closeByPeer();
    caller.join();

    //released right away, not after the call timeout
    REQUIRE( std::chrono::steady_clock::now() - start < std::chrono::seconds(5) );
    REQUIRE( res.error == CommandError::NotConnected );
    REQUIRE( awaitDisconnected(sys.csms, "CP001") );

    //no further Calls on the closed session
    auto res2 = session->call("Reset", payload);
    REQUIRE( res2.error == CommandError::NotConnected );
}

TEST_CASE( "Connection inbox overflow" ) {
    printf("\nRun %s\n",  "Connection inbox overflow");

    TestSystem sys;
    sys.chargers->add("CP001");

    auto conn = std::make_shared<TestConnection>();

    SECTION("Reader falls behind") {
        const char *heartbeat = "[2,\"1\",\"Heartbeat\",{}]";
        for (size_t i = 0; i < MC_CONNECTION_INBOX_MAX; i++) {
            REQUIRE( conn->receiveTXT(heartbeat, strlen(heartbeat)) );
        }
        REQUIRE( conn->isConnected() );

        REQUIRE( !conn->receiveTXT(heartbeat, strlen(heartbeat)) );
        REQUIRE( !conn->isConnected() );
        REQUIRE( conn->getCloseCount() == 1 );
        REQUIRE( conn->getCloseCode() == MC_CLOSE_POLICY_VIOLATION );
        REQUIRE( !strcmp(conn->getCloseReason(), "Message queue overflow") );

        //the buffered frames are discarded with the connection
        std::string msg;
        REQUIRE( !conn->readTXT(msg) );
    }

    SECTION("Session is released") {
        auto session = sys.connect("CP001", conn);
        REQUIRE( session );

        const char *heartbeat = "[2,\"1\",\"Heartbeat\",{}]";
        for (size_t i = 0; i <= MC_CONNECTION_INBOX_MAX; i++) {
            conn->receiveTXT(heartbeat, strlen(heartbeat));
        }
        REQUIRE( !conn->isConnected() );

        session->receiveLoop();
        REQUIRE( !sys.csms.isConnected("CP001") );
        REQUIRE( !sys.csms.getContext().getConnectionRegistry()->exists("CP001") );
    }
}
