// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <stdint.h>
#include <stdlib.h>
#include <string.h>

#include <MicroCsms/Operations/MeterValues.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Model/Transactions/TransactionService.h>
#include <MicroCsms/Debug.h>

#define MC_MEASURAND_ENERGY "Energy.Active.Import.Register"
#define MC_MEASURAND_CURRENT "Current.Import"
#define MC_MEASURAND_VOLTAGE "Voltage"
#define MC_MEASURAND_POWER "Power.Active.Import"

using namespace MicroCsms;

namespace MicroCsms {
namespace MeterValuesUtils {

bool parseValue(const char *src, double& out) {
    if (!src || !*src) {
        return false;
    }
    char *end = nullptr;
    out = strtod(src, &end);
    return end && end != src && *end == '\0';
}

} //namespace MeterValuesUtils
} //namespace MicroCsms

MeterValues::MeterValues(Context& context, Model& model, const char *chargePointId) : context(context), model(model), chargePointId(chargePointId) {

}

const char* MeterValues::getOperationType(){
    return "MeterValues";
}

bool MeterValues::parseMeterValue(JsonObject meterValueJson, MeterValue& out) {

    bool energyDefined = false;

    JsonArray sampledValues = meterValueJson["sampledValue"];
    for (JsonObject sample : sampledValues) {
        const char *measurand = sample["measurand"] | MC_MEASURAND_ENERGY;
        const char *unit = sample["unit"] | "";
        const char *valueCstr = sample["value"] | "";

        double value;
        if (sample["value"].is<double>()) {
            value = sample["value"].as<double>(); //tolerate numbers instead of strings
        } else if (!MeterValuesUtils::parseValue(valueCstr, value)) {
            MC_DBG_WARN("empty or invalid value for %s. Skip", measurand);
            continue;
        }

        if (!strcmp(measurand, MC_MEASURAND_ENERGY)) {
            if (!strcmp(unit, "kWh")) {
                value *= 1000.;
            }
            if (!(value >= 0. && value <= (double) INT32_MAX)) {
                MC_DBG_WARN("energy reading %s %s out of range. Skip", valueCstr, unit);
                continue;
            }
            out.energyWh = (int32_t) (value + 0.5);
            energyDefined = true;
        } else if (!strcmp(measurand, MC_MEASURAND_CURRENT)) {
            if (!strcmp(unit, "mA")) {
                value /= 1000.;
            }
            out.currentA = value;
            out.currentDefined = true;
        } else if (!strcmp(measurand, MC_MEASURAND_VOLTAGE)) {
            if (!strcmp(unit, "mV")) {
                value /= 1000.;
            }
            out.voltageV = value;
            out.voltageDefined = true;
        } else if (!strcmp(measurand, MC_MEASURAND_POWER)) {
            if (strcmp(unit, "kW")) {
                value /= 1000.; //W
            }
            out.powerKw = value;
            out.powerDefined = true;
        } else {
            MC_DBG_DEBUG("measurand %s not recorded", measurand);
        }
    }

    if (!context.getClock().parseString(meterValueJson["timestamp"] | "", out.timestamp)) {
        out.timestamp = context.getClock().now();
    }

    return energyDefined;
}

void MeterValues::processReq(JsonObject payload) {

    int connectorId = payload["connectorId"] | -1;
    int transactionId = payload["transactionId"] | 0;

    MC_DBG_DEBUG("MeterValues from %s: connectorId=%i, transactionId=%i", chargePointId.c_str(), connectorId, transactionId);

    if (transactionId <= 0) {
        MC_DBG_WARN("no transactionId in MeterValues from %s. Discard", chargePointId.c_str());
        return;
    }

    auto transactionService = model.getTransactionService();
    if (!transactionService) {
        return;
    }

    unsigned int stored = 0;

    JsonArray meterValueArray = payload["meterValue"];
    for (JsonObject meterValueJson : meterValueArray) {
        MeterValue meterValue;
        meterValue.transactionId = transactionId;
        if (!parseMeterValue(meterValueJson, meterValue)) {
            MC_DBG_DEBUG("no energy reading in meter value. Skip");
            continue;
        }
        if (!transactionService->addMeterValue(meterValue)) {
            break; //transaction unknown
        }
        stored++;
    }

    MC_DBG_DEBUG("stored %u meter values for transaction %i", stored, transactionId);
}

std::unique_ptr<JsonDoc> MeterValues::createConf(){
    return createEmptyDocument();
}
