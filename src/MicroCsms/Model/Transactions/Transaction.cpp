// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Transactions/Transaction.h>

namespace MicroCsms {

const char *serializeTransactionStatus(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::Started:
            return "STARTED";
        case TransactionStatus::PendingStart:
            return "PENDING_START";
        case TransactionStatus::Running:
            return "RUNNING";
        case TransactionStatus::PendingStop:
            return "PENDING_STOP";
        case TransactionStatus::Stopped:
            return "STOPPED";
        case TransactionStatus::Completed:
            return "COMPLETED";
        case TransactionStatus::Cancelled:
            return "CANCELLED";
        case TransactionStatus::Failed:
            return "FAILED";
        case TransactionStatus::BillingFailed:
            return "BILLING_FAILED";
    }
    return "_Undefined";
}

bool isActiveStatus(TransactionStatus status) {
    return status == TransactionStatus::Started ||
           status == TransactionStatus::PendingStart ||
           status == TransactionStatus::Running;
}

bool isOngoingStatus(TransactionStatus status) {
    return isActiveStatus(status) || status == TransactionStatus::PendingStop;
}

} //namespace MicroCsms
