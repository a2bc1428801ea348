#pragma once
#include <string>
#include <stdexcept>

enum ExecutionStatus {
    SUCCESS,
    // validation
    INVALID_AMOUNT,
    EMPTY_PARTICIPANTS,
    TOO_MANY_PARTICIPANTS,
    DUPLICATE_PARTICIPANT,
    PAYER_NOT_PARTICIPANT,
    NOT_A_MEMBER,
    SAME_PARTIES,
    // settlement
    NOT_AUTHORIZED,
    NOT_FOUND,
    ALREADY_EXECUTED,
    SETTLEMENT_CANCELLED,
    SETTLEMENT_EXPIRED,
    NOT_EXPIRED,
    SETTLEMENT_BUSY,
    // transfer
    TRANSFER_MISMATCH,
    TRANSFER_FAILED,
    TRANSFER_TIMEOUT,
    INSUFFICIENT_FUNDS
};

std::string executionStatusAsString(ExecutionStatus status);

// INVALID_AMOUNT .. SAME_PARTIES: rejected before any mutation
bool isValidationError(ExecutionStatus status);

// Raised when the zero-sum invariant or the encoded balance bounds are
// violated. Indicates a logic bug, never a user error.
class LedgerCorruption : public std::runtime_error {
    public:
        explicit LedgerCorruption(const std::string& what) : std::runtime_error("Ledger corruption: " + what) {}
};
