// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

//
// Standalone OCPP 1.6 central system. Charge points connect to
//
//     ws://<host>:8180/ocpp/<chargePointId>
//
// Settings and records are kept in ./csms_store/. The chargers, users and tariffs are seeded from
// ./csms_store/csms-seed.jsn, e.g.
//
//     {
//       "chargers": ["CP001", "CP002"],
//       "users": [{"idTag": "TAG0001", "balance": "50.00"}],
//       "globalRate": "0.35",
//       "chargerRates": [{"chargePointId": "CP002", "rate": "0.29"}]
//     }
//

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

#include <MicroCsms.h>
#include <MicroCsms/Core/FilesystemUtils.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Model/Billing/BillingUtils.h>
#include <MicroCsms/Model/Billing/TariffStore.h>
#include <MicroCsms/Model/Billing/WalletStore.h>
#include <MicroCsms/Server/WebSocketServer.h>
#include <MicroCsms/Debug.h>

#define SEED_FN "csms-seed.jsn"

using namespace MicroCsms;

std::atomic<bool> terminateRequested {false};

void onSignal(int) {
    terminateRequested = true;
}

bool loadSeed(std::shared_ptr<FilesystemAdapter> filesystem,
            VolatileChargerStore& chargers, VolatileUserStore& users, VolatileWalletStore& wallets, VolatileTariffStore& tariffs) {

    auto seed = FilesystemUtils::loadJson(filesystem, SEED_FN);
    if (!seed) {
        MC_DBG_WARN("no %s found. No charger can connect", SEED_FN);
        return false;
    }

    for (JsonVariant chargePointId : (*seed)["chargers"].as<JsonArray>()) {
        if (!chargers.add(chargePointId | "")) {
            MC_DBG_ERR("invalid charger entry");
        }
    }

    for (JsonObject user : (*seed)["users"].as<JsonArray>()) {
        int userId = users.add(user["idTag"] | "", user["active"] | true);
        if (userId <= 0) {
            MC_DBG_ERR("invalid user entry");
            continue;
        }
        int64_t balance = 0;
        bool balanceDefined = BillingUtils::parseDecimal(user["balance"] | "", 2, balance);
        wallets.add(userId, balance, balanceDefined);
    }

    int64_t rate;
    if (BillingUtils::parseDecimal((*seed)["globalRate"] | "", 4, rate)) {
        tariffs.setGlobalTariff((int32_t) rate);
    }

    for (JsonObject chargerRate : (*seed)["chargerRates"].as<JsonArray>()) {
        Charger charger;
        if (!chargers.get(chargerRate["chargePointId"] | "", charger) ||
                !BillingUtils::parseDecimal(chargerRate["rate"] | "", 4, rate)) {
            MC_DBG_ERR("invalid charger rate entry");
            continue;
        }
        tariffs.setChargerTariff(charger.id, (int32_t) rate);
    }

    return true;
}

int main() {

    auto filesystem = makeDefaultFilesystemAdapter(MC_FILENAME_PREFIX);
    if (!filesystem) {
        MC_DBG_ERR("cannot access %s", MC_FILENAME_PREFIX);
        return 1;
    }

    CentralSystem csms {filesystem};

    auto chargers = new VolatileChargerStore();
    auto users = new VolatileUserStore();
    auto wallets = new VolatileWalletStore();
    auto tariffs = new VolatileTariffStore();
    csms.getModel().setChargerStore(std::unique_ptr<ChargerStore>(chargers));
    csms.getModel().setUserStore(std::unique_ptr<UserStore>(users));
    csms.getModel().setWalletStore(std::unique_ptr<WalletStore>(wallets));
    csms.getModel().setTariffStore(std::unique_ptr<TariffStore>(tariffs));

    loadSeed(filesystem, *chargers, *users, *wallets, *tariffs);

    WebSocketServer server {csms};

    if (!csms.setup()) {
        return 1;
    }

    if (!server.start()) {
        return 1;
    }

    csms.startTasks();

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    while (!terminateRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    MC_DBG_INFO("shutting down");
    server.stop();
    csms.shutdown();
    return 0;
}
