// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string>
#include <string.h>

#include <MicroCsms.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Model/Transactions/TransactionStore.h>
#include <MicroCsms/Model/Billing/TariffStore.h>
#include <MicroCsms/Model/Billing/WalletStore.h>
#include <MicroCsms/Operations/BootNotification.h>
#include <MicroCsms/Debug.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroCsms;

TEST_CASE( "BootNotification" ) {
    printf("\nRun %s\n",  "BootNotification");

    TestSystem sys;
    sys.chargers->add("CP001");

    SECTION("Registered charger") {
        auto conn = std::make_shared<TestConnection>();
        auto session = sys.connect("CP001", conn);
        REQUIRE( session );

        Frame response;
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"b1\",\"BootNotification\",{\"chargePointVendor\":\"VendorX\",\"chargePointModel\":\"SingleSocketCharger\","
                "\"chargePointSerialNumber\":\"SN-4711\",\"firmwareVersion\":\"1.2.0\"}]", response) );

        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( !strcmp((*response.payload)["status"] | "", "Accepted") );
        REQUIRE( ((*response.payload)["interval"] | -1) == 300 );
        REQUIRE( !strcmp((*response.payload)["currentTime"] | "", BASE_TIME) );

        Charger charger;
        REQUIRE( sys.chargers->get("CP001", charger) );
        REQUIRE( charger.vendor == "VendorX" );
        REQUIRE( charger.model == "SingleSocketCharger" );
        REQUIRE( charger.serialNumber == "SN-4711" );
        REQUIRE( charger.firmwareVersion == "1.2.0" );
        REQUIRE( charger.status == ChargePointStatus::Available );
        REQUIRE( charger.lastHeartbeat.toUnixTime() == BASE_TIME_UNIX );
    }

    SECTION("Configured heartbeat interval") {
        REQUIRE( sys.csms.getContext().getConfiguration().setConfiguration("HeartbeatInterval", "60") );

        auto conn = std::make_shared<TestConnection>();
        auto session = sys.connect("CP001", conn);
        REQUIRE( session );
        Frame response;
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"b2\",\"BootNotification\",{\"chargePointVendor\":\"VendorX\",\"chargePointModel\":\"M\"}]", response) );
        REQUIRE( ((*response.payload)["interval"] | -1) == 60 );
    }

    SECTION("Unregistered charger") {
        BootNotification bootNotification {sys.csms.getContext(), sys.csms.getModel(), "CP999"};

        auto req = initJsonDoc(JSON_OBJECT_SIZE(2));
        req["chargePointVendor"] = "VendorX";
        req["chargePointModel"] = "M";
        bootNotification.processReq(req.as<JsonObject>());

        REQUIRE( bootNotification.getErrorCode() == nullptr );
        auto conf = bootNotification.createConf();
        REQUIRE( !strcmp((*conf)["status"] | "", "Rejected") );
    }
}

TEST_CASE( "Charging session" ) {
    printf("\nRun %s\n",  "Charging session");

    TestSystem sys;
    sys.chargers->add("CP001");
    int userId = sys.users->add("TAG0001");
    sys.wallets->add(userId, 10000);
    sys.tariffs->setGlobalTariff(3500);

    auto& txStore = *sys.csms.getModel().getTransactionStore();

    auto conn = std::make_shared<TestConnection>();
    auto session = sys.connect("CP001", conn);
    REQUIRE( session );

    Frame response;

    auto getBalance = [&] () -> int64_t {
        Wallet wallet;
        REQUIRE( sys.wallets->getByUser(userId, wallet) );
        return wallet.balance;
    };

    auto getCharger = [&] () -> Charger {
        Charger charger;
        REQUIRE( sys.chargers->get("CP001", charger) );
        return charger;
    };

    REQUIRE( sys.sendCall(*session, *conn,
            "[2,\"s1\",\"StartTransaction\",{\"connectorId\":1,\"idTag\":\"TAG0001\",\"meterStart\":1000,\"timestamp\":\"2023-01-01T00:00:00Z\"}]", response) );
    REQUIRE( response.type == MessageType::CallResult );
    REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Accepted") );
    int txId = (*response.payload)["transactionId"] | 0;
    REQUIRE( txId == 1 );

    Transaction tx;
    REQUIRE( txStore.get(txId, tx) );
    REQUIRE( tx.status == TransactionStatus::Running );
    REQUIRE( tx.startMeterWh == 1000 );
    REQUIRE( tx.userId == userId );
    REQUIRE( tx.connectorId == 1 );

    SECTION("Start and stop") {
        mtime += 3600;

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"s2\",\"StopTransaction\",{\"transactionId\":1,\"meterStop\":11005,\"timestamp\":\"2023-01-01T01:00:00Z\",\"reason\":\"EVDisconnected\"}]", response) );
        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Accepted") );

        REQUIRE( txStore.get(txId, tx) );
        REQUIRE( tx.status == TransactionStatus::Completed );
        REQUIRE( tx.energyConsumedWh == 10005 );
        REQUIRE( tx.stopReason == "EVDisconnected" );

        //billed after the confirmation
        REQUIRE( getBalance() == 9650 );

        //the charge point repeats the StopTransaction
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"s3\",\"StopTransaction\",{\"transactionId\":1,\"meterStop\":11005}]", response) );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Accepted") );
        REQUIRE( getBalance() == 9650 );
    }

    SECTION("Start rejections") {
        //the charger is occupied
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r1\",\"StartTransaction\",{\"connectorId\":2,\"idTag\":\"TAG0001\",\"meterStart\":0}]", response) );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "ConcurrentTx") );
        REQUIRE( ((*response.payload)["transactionId"] | -1) == 0 );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r2\",\"StopTransaction\",{\"transactionId\":1,\"meterStop\":1000}]", response) );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r3\",\"StartTransaction\",{\"connectorId\":1,\"idTag\":\"UNKNOWN\",\"meterStart\":0}]", response) );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Invalid") );

        int blockedUser = sys.users->add("TAG0002");
        sys.users->setActive(blockedUser, false);
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r4\",\"StartTransaction\",{\"connectorId\":1,\"idTag\":\"TAG0002\",\"meterStart\":0}]", response) );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Blocked") );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r5\",\"StartTransaction\",{\"connectorId\":1,\"idTag\":\"TAG00000000000000000001\",\"meterStart\":0}]", response) );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Invalid") );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r6\",\"StartTransaction\",{\"connectorId\":1,\"idTag\":\"TAG0001\"}]", response) );
        REQUIRE( response.type == MessageType::CallError );
        REQUIRE( response.errorCode == "FormationViolation" );
    }

    SECTION("Stop of unknown transaction") {
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"u1\",\"StopTransaction\",{\"transactionId\":42,\"meterStop\":100}]", response) );
        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Invalid") );
    }

    SECTION("MeterValues") {
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"m1\",\"MeterValues\",{\"connectorId\":1,\"transactionId\":1,\"meterValue\":["
                    "{\"timestamp\":\"2023-01-01T00:15:00Z\",\"sampledValue\":["
                        "{\"value\":\"2.5\",\"measurand\":\"Energy.Active.Import.Register\",\"unit\":\"kWh\"},"
                        "{\"value\":\"16000\",\"measurand\":\"Current.Import\",\"unit\":\"mA\"},"
                        "{\"value\":\"230\",\"measurand\":\"Voltage\",\"unit\":\"V\"},"
                        "{\"value\":\"3680\",\"measurand\":\"Power.Active.Import\",\"unit\":\"W\"}]},"
                    "{\"timestamp\":\"2023-01-01T00:20:00Z\",\"sampledValue\":["
                        "{\"value\":\"11\",\"measurand\":\"Power.Active.Import\",\"unit\":\"kW\"}]},"
                    "{\"timestamp\":\"2023-01-01T00:30:00Z\",\"sampledValue\":["
                        "{\"value\":4000},"
                        "{\"value\":\"\",\"measurand\":\"Voltage\"}]}"
                "]}]", response) );

        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( response.payload->as<JsonObject>().size() == 0 );

        auto meterValues = txStore.getMeterValues(txId);
        REQUIRE( meterValues.size() == 2 ); //the group without energy reading is skipped

        REQUIRE( meterValues[0].energyWh == 2500 );
        REQUIRE( meterValues[0].currentDefined );
        REQUIRE( meterValues[0].currentA == Approx(16.) );
        REQUIRE( meterValues[0].voltageV == Approx(230.) );
        REQUIRE( meterValues[0].powerKw == Approx(3.68) );
        REQUIRE( meterValues[0].timestamp.toUnixTime() == BASE_TIME_UNIX + 15 * 60 );

        REQUIRE( meterValues[1].energyWh == 4000 );
        REQUIRE( !meterValues[1].voltageDefined );

        //without transaction, the values are discarded
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"m2\",\"MeterValues\",{\"connectorId\":1,\"meterValue\":[{\"timestamp\":\"2023-01-01T00:40:00Z\",\"sampledValue\":[{\"value\":\"5000\"}]}]}]", response) );
        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( txStore.getMeterValues(txId).size() == 2 );
    }

    SECTION("Meter readings out of range") {
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r1\",\"MeterValues\",{\"connectorId\":1,\"transactionId\":1,\"meterValue\":["
                    "{\"sampledValue\":[{\"value\":\"3000000\",\"unit\":\"kWh\"}]},"
                    "{\"sampledValue\":[{\"value\":\"3e9\"}]},"
                    "{\"sampledValue\":[{\"value\":\"-5\"}]},"
                    "{\"sampledValue\":[{\"value\":\"2000000\",\"unit\":\"kWh\"}]}"
                "]}]", response) );
        REQUIRE( response.type == MessageType::CallResult );

        auto meterValues = txStore.getMeterValues(txId);
        REQUIRE( meterValues.size() == 1 );
        REQUIRE( meterValues[0].energyWh == 2000000000 );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r2\",\"StopTransaction\",{\"transactionId\":1,\"meterStop\":3000000000}]", response) );
        REQUIRE( response.type == MessageType::CallError );
        REQUIRE( response.errorCode == "PropertyConstraintViolation" );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r3\",\"StopTransaction\",{\"transactionId\":1,\"meterStop\":-1}]", response) );
        REQUIRE( response.type == MessageType::CallError );
        REQUIRE( response.errorCode == "PropertyConstraintViolation" );

        REQUIRE( txStore.get(txId, tx) );
        REQUIRE( tx.status == TransactionStatus::Running );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"r4\",\"StartTransaction\",{\"connectorId\":2,\"idTag\":\"TAG0001\",\"meterStart\":-2000000000}]", response) );
        REQUIRE( response.type == MessageType::CallError );
        REQUIRE( response.errorCode == "PropertyConstraintViolation" );
    }

    SECTION("Fault during transaction") {
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"f1\",\"MeterValues\",{\"connectorId\":1,\"transactionId\":1,\"meterValue\":[{\"timestamp\":\"2023-01-01T00:15:00Z\",\"sampledValue\":[{\"value\":\"11005\"}]}]}]", response) );

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"f2\",\"StatusNotification\",{\"connectorId\":1,\"errorCode\":\"NoError\",\"status\":\"Charging\"}]", response) );
        REQUIRE( getCharger().status == ChargePointStatus::Charging );
        REQUIRE( txStore.get(txId, tx) );
        REQUIRE( tx.status == TransactionStatus::Running );

        mtime += 60;

        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"f3\",\"StatusNotification\",{\"connectorId\":1,\"errorCode\":\"GroundFailure\",\"status\":\"Faulted\"}]", response) );
        REQUIRE( response.type == MessageType::CallResult );
        REQUIRE( response.payload->as<JsonObject>().size() == 0 );

        auto charger = getCharger();
        REQUIRE( charger.status == ChargePointStatus::Faulted );
        REQUIRE( charger.lastHeartbeat.toUnixTime() == BASE_TIME_UNIX + 60 );

        REQUIRE( txStore.get(txId, tx) );
        REQUIRE( tx.status == TransactionStatus::Failed );
        REQUIRE( tx.stopReason == "STATUS_CHANGE_TO_Faulted" );
        REQUIRE( tx.endMeterWh == 11005 );
        REQUIRE( tx.energyConsumedWh == 10005 );

        //the energy up to the fault is billed
        REQUIRE( getBalance() == 9650 );

        //the charger is free again
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"f4\",\"StartTransaction\",{\"connectorId\":1,\"idTag\":\"TAG0001\",\"meterStart\":11005}]", response) );
        REQUIRE( !strcmp((*response.payload)["idTagInfo"]["status"] | "", "Accepted") );
    }

    SECTION("Fault without meter values") {
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"g1\",\"StatusNotification\",{\"connectorId\":1,\"errorCode\":\"NoError\",\"status\":\"Unavailable\"}]", response) );

        REQUIRE( txStore.get(txId, tx) );
        REQUIRE( tx.status == TransactionStatus::Failed );
        REQUIRE( tx.stopReason == "STATUS_CHANGE_TO_Unavailable" );
        REQUIRE( !tx.energyDefined );
        REQUIRE( getBalance() == 10000 );
    }

    SECTION("Invalid status") {
        REQUIRE( sys.sendCall(*session, *conn,
                "[2,\"i1\",\"StatusNotification\",{\"connectorId\":1,\"errorCode\":\"NoError\",\"status\":\"Exploded\"}]", response) );
        REQUIRE( response.type == MessageType::CallResult );

        REQUIRE( txStore.get(txId, tx) );
        REQUIRE( tx.status == TransactionStatus::Running );
    }
}
