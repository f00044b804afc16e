// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <stdio.h>
#include <inttypes.h>

#include <MicroCsms/Model/Billing/BillingUtils.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {
namespace BillingUtils {

int64_t calculateAmount(int32_t energyWh, int32_t rateE4) {
    if (energyWh <= 0 || rateE4 <= 0) {
        return 0;
    }

    //Wh * rateE4 has 3 + 4 decimal places. Minor units have 2, so 5 decimal places are rounded away
    const int64_t divisor = 1000LL * MC_RATE_SCALE / MC_CURRENCY_SCALE;

    int64_t product = (int64_t) energyWh * (int64_t) rateE4;
    return (product + divisor / 2) / divisor;
}

bool parseDecimal(const char *src, unsigned int decimals, int64_t& out) {
    if (!src || *src == '\0') {
        return false;
    }

    int64_t integral = 0;
    size_t i = 0;
    for (; src[i] >= '0' && src[i] <= '9'; i++) {
        integral *= 10;
        integral += src[i] - '0';
        if (integral > INT32_MAX) {
            MC_DBG_ERR("decimal overflow");
            return false;
        }
    }

    if (i == 0) {
        return false;
    }

    int64_t fraction = 0;
    unsigned int fractionDigits = 0;
    if (src[i] == '.') {
        i++;
        for (; src[i] >= '0' && src[i] <= '9'; i++) {
            if (fractionDigits >= decimals) {
                if (src[i] != '0') {
                    MC_DBG_ERR("too many decimal places: %s", src);
                    return false;
                }
                continue;
            }
            fraction *= 10;
            fraction += src[i] - '0';
            fractionDigits++;
        }
    }

    if (src[i] != '\0') {
        return false;
    }

    for (; fractionDigits < decimals; fractionDigits++) {
        fraction *= 10;
    }

    int64_t scale = 1;
    for (unsigned int d = 0; d < decimals; d++) {
        scale *= 10;
    }

    out = integral * scale + fraction;
    return true;
}

bool printDecimal(char *dst, size_t size, int64_t value, unsigned int decimals) {
    int64_t scale = 1;
    for (unsigned int d = 0; d < decimals; d++) {
        scale *= 10;
    }

    bool negative = value < 0;
    uint64_t absValue = negative ? (uint64_t) (-(value + 1)) + 1 : (uint64_t) value;

    int ret;
    if (decimals == 0) {
        ret = snprintf(dst, size, "%s%" PRIu64, negative ? "-" : "", absValue);
    } else {
        ret = snprintf(dst, size, "%s%" PRIu64 ".%0*" PRIu64, negative ? "-" : "",
                absValue / (uint64_t) scale, (int) decimals, absValue % (uint64_t) scale);
    }

    return ret >= 0 && (size_t)ret < size;
}

} //namespace BillingUtils
} //namespace MicroCsms
