// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Billing/TariffStore.h>

using namespace MicroCsms;

void VolatileTariffStore::setChargerTariff(int chargerId, int32_t rateE4) {
    std::lock_guard<std::mutex> lock(mutex);
    Tariff tariff;
    tariff.chargerId = chargerId;
    tariff.rateE4 = rateE4;
    tariffs[chargerId] = tariff;
}

void VolatileTariffStore::setGlobalTariff(int32_t rateE4) {
    setChargerTariff(0, rateE4);
}

void VolatileTariffStore::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    tariffs.clear();
}

bool VolatileTariffStore::getChargerTariff(int chargerId, Tariff& out) {
    if (chargerId == 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = tariffs.find(chargerId);
    if (entry == tariffs.end()) {
        return false;
    }
    out = entry->second;
    return true;
}

bool VolatileTariffStore::getGlobalTariff(Tariff& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = tariffs.find(0);
    if (entry == tariffs.end()) {
        return false;
    }
    out = entry->second;
    return true;
}
