// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_OCPPERROR_H
#define MC_OCPPERROR_H

#include <string>

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {

/*
 * Answers actions without a registered handler with an empty CallResult. Charge points treat a CallError
 * for some of their notifications as a reason to retry them, so the server acknowledges them instead
 */
class UnsupportedAction : public Operation {
private:
    std::string action;
public:
    UnsupportedAction(const char *action) : action(action) { }

    const char *getOperationType() override {
        return action.c_str();
    }

    void processReq(JsonObject payload) override {
        MC_DBG_WARN("no handler for action %s. Reply with empty confirmation", action.c_str());
    }

    std::unique_ptr<JsonDoc> createConf() override {
        return createEmptyDocument();
    }
};

class FormationViolation : public Operation {
private:
    std::string description;
public:
    FormationViolation(const char *description) : description(description) { }

    const char *getErrorCode() override {
        return "FormationViolation";
    }

    const char *getErrorDescription() override {
        return description.c_str();
    }
};

class InternalError : public Operation {
private:
    std::string description;
public:
    InternalError(const char *description) : description(description) { }

    const char *getErrorCode() override {
        return "InternalError";
    }

    const char *getErrorDescription() override {
        return description.c_str();
    }
};

} //namespace MicroCsms

#endif
