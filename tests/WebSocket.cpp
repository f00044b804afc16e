// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string>

#include <MicroCsms/Server/WebSocketServer.h>
#include <catch2/catch.hpp>

using namespace MicroCsms;

TEST_CASE( "WebSocket endpoint" ) {
    printf("\nRun %s\n",  "WebSocket endpoint");

    std::string id;

    SECTION("Request target") {
        REQUIRE( WebSocket::parseChargePointId("/ocpp/CP001", id) );
        REQUIRE( id == "CP001" );

        REQUIRE( WebSocket::parseChargePointId("/ocpp/CP002?token=abc", id) );
        REQUIRE( id == "CP002" );

        id.clear();
        REQUIRE( !WebSocket::parseChargePointId("/ocpp/", id) );
        REQUIRE( !WebSocket::parseChargePointId("/ocpp/a/b", id) );
        REQUIRE( !WebSocket::parseChargePointId("/api/CP001", id) );
        REQUIRE( !WebSocket::parseChargePointId("/ocppCP001", id) );
        REQUIRE( !WebSocket::parseChargePointId("", id) );
        REQUIRE( id.empty() );
    }

    SECTION("Subprotocol") {
        REQUIRE( WebSocket::offersOcppSubprotocol("ocpp1.6") );
        REQUIRE( WebSocket::offersOcppSubprotocol("ocpp2.0, ocpp1.6") );
        REQUIRE( WebSocket::offersOcppSubprotocol(" ocpp1.6 ,ocpp2.0.1") );
        REQUIRE( !WebSocket::offersOcppSubprotocol("ocpp2.0.1") );
        REQUIRE( !WebSocket::offersOcppSubprotocol("ocpp1.6j") );
        REQUIRE( !WebSocket::offersOcppSubprotocol("") );
    }

    SECTION("Idle timeout outlasts the heartbeat interval") {
        REQUIRE( WebSocket::getIdleTimeout(300) > 300 );
        REQUIRE( WebSocket::getIdleTimeout(300) == 600 );
        REQUIRE( WebSocket::getIdleTimeout(3600) == 7200 );
        REQUIRE( WebSocket::getIdleTimeout(0) == 300 );
    }
}
