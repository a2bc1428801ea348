#include "status.hpp"
using namespace std;

string executionStatusAsString(ExecutionStatus status) {
    switch(status) {
        case SUCCESS:
            return "SUCCESS";
        case INVALID_AMOUNT:
            return "INVALID_AMOUNT";
        case EMPTY_PARTICIPANTS:
            return "EMPTY_PARTICIPANTS";
        case TOO_MANY_PARTICIPANTS:
            return "TOO_MANY_PARTICIPANTS";
        case DUPLICATE_PARTICIPANT:
            return "DUPLICATE_PARTICIPANT";
        case PAYER_NOT_PARTICIPANT:
            return "PAYER_NOT_PARTICIPANT";
        case NOT_A_MEMBER:
            return "NOT_A_MEMBER";
        case SAME_PARTIES:
            return "SAME_PARTIES";
        case NOT_AUTHORIZED:
            return "NOT_AUTHORIZED";
        case NOT_FOUND:
            return "NOT_FOUND";
        case ALREADY_EXECUTED:
            return "ALREADY_EXECUTED";
        case SETTLEMENT_CANCELLED:
            return "SETTLEMENT_CANCELLED";
        case SETTLEMENT_EXPIRED:
            return "SETTLEMENT_EXPIRED";
        case NOT_EXPIRED:
            return "NOT_EXPIRED";
        case SETTLEMENT_BUSY:
            return "SETTLEMENT_BUSY";
        case TRANSFER_MISMATCH:
            return "TRANSFER_MISMATCH";
        case TRANSFER_FAILED:
            return "TRANSFER_FAILED";
        case TRANSFER_TIMEOUT:
            return "TRANSFER_TIMEOUT";
        case INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
    }
    return "UNKNOWN_ERROR";
}

bool isValidationError(ExecutionStatus status) {
    return status >= INVALID_AMOUNT && status <= SAME_PARTIES;
}
