// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_BILLINGUTILS_H
#define MC_BILLINGUTILS_H

#include <stddef.h>
#include <stdint.h>

#define MC_RATE_SCALE 10000 //rates have 4 decimal places, e.g. 0.35 / kWh = 3500
#define MC_CURRENCY_SCALE 100 //amounts have 2 decimal places (minor units)

namespace MicroCsms {
namespace BillingUtils {

/*
 * Amount in minor units for `energyWh` at `rateE4` (rate per kWh, scaled by MC_RATE_SCALE). Rounds
 * half-up to 2 decimal places, e.g. 10.005 kWh x 0.35 = 3.50175 -> 350. Returns 0 if energyWh <= 0
 */
int64_t calculateAmount(int32_t energyWh, int32_t rateE4);

/*
 * Parses a non-negative decimal like "0.35" into a scaled integer with `decimals` digits after the
 * point. Rejects excess digits instead of rounding them
 */
bool parseDecimal(const char *src, unsigned int decimals, int64_t& out);

/*
 * Prints the scaled integer `value` with `decimals` digits after the point, e.g. (-350, 2) -> "-3.50"
 */
bool printDecimal(char *dst, size_t size, int64_t value, unsigned int decimals);

} //namespace BillingUtils
} //namespace MicroCsms

#endif
