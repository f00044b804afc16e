// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_TARIFFSTORE_H
#define MC_TARIFFSTORE_H

#include <map>
#include <mutex>
#include <stdint.h>

namespace MicroCsms {

struct Tariff {
    int chargerId = 0; //0 for the global tariff
    int32_t rateE4 = 0; //rate per kWh, scaled by MC_RATE_SCALE
};

class TariffStore {
public:
    virtual ~TariffStore() = default;

    /*
     * Charger-specific tariff. Returns false if the charger has none
     */
    virtual bool getChargerTariff(int chargerId, Tariff& out) = 0;

    virtual bool getGlobalTariff(Tariff& out) = 0;
};

class VolatileTariffStore : public TariffStore {
private:
    std::map<int, Tariff> tariffs; //key 0 is the global tariff
    std::mutex mutex;
public:
    void setChargerTariff(int chargerId, int32_t rateE4);
    void setGlobalTariff(int32_t rateE4);
    void clear();

    bool getChargerTariff(int chargerId, Tariff& out) override;
    bool getGlobalTariff(Tariff& out) override;
};

} //namespace MicroCsms

#endif
