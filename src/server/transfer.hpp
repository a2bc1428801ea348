#pragma once
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../core/common.hpp"
#include "../core/settlement.hpp"

struct TransferRequest {
    MemberId from;
    MemberId to;
    TransactionAmount amount;
    // idempotency key, a second submission with the same reference never moves funds twice
    std::string reference;
};

enum TransferStatus {
    TRANSFER_CONFIRMED,
    TRANSFER_ALREADY_CONFIRMED,
    TRANSFER_PENDING,
    TRANSFER_REJECTED,
    TRANSFER_NO_FUNDS,
    TRANSFER_ERROR
};

std::string transferStatusAsString(TransferStatus status);

struct TransferOutcome {
    TransferStatus status;
    TransferProof proof;
};

// Runs inside the transfer's unit of work. Returning false reverts the transfer.
typedef std::function<bool(const TransferProof&)> CommitHook;

class TransferPrimitive {
    public:
        virtual ~TransferPrimitive() {}
        // Moves funds and runs commit as one indivisible unit. TRANSFER_PENDING
        // means confirmation did not arrive within timeout; the bundle may
        // still land later, in which case commit runs then.
        virtual TransferOutcome transfer(const TransferRequest& request, const CommitHook& commit, std::chrono::milliseconds timeout) = 0;
        virtual bool findConfirmed(const std::string& reference, TransferProof& proof) const = 0;
        // blocks until every submitted bundle has landed or been reverted
        virtual void waitForPending() = 0;
};

/*
    In-process account ledger implementing the transfer primitive.
    With a confirmation delay the bundle runs on a worker thread and the
    caller stops waiting after its timeout.
*/
class LocalTransferNetwork : public TransferPrimitive {
    public:
        explicit LocalTransferNetwork(TimeSource clock);
        ~LocalTransferNetwork();
        void loadAccounts(const json& accounts);
        void setAccountBalance(const MemberId& member, TransactionAmount amount);
        TransactionAmount getAccountBalance(const MemberId& member) const;
        void setConfirmationDelay(std::chrono::milliseconds delay);
        TransferOutcome transfer(const TransferRequest& request, const CommitHook& commit, std::chrono::milliseconds timeout) override;
        bool findConfirmed(const std::string& reference, TransferProof& proof) const override;
        size_t confirmedCount() const;
        void waitForPending() override;
    protected:
        TransferOutcome settle(const TransferRequest& request, const CommitHook& commit);
        void withdraw(const MemberId& wallet, TransactionAmount amt);
        void deposit(const MemberId& wallet, TransactionAmount amt);
        void pruneFinished();
        TimeSource clock;
        std::map<MemberId, TransactionAmount> accounts;
        std::map<std::string, TransferProof> confirmed;
        std::map<std::string, std::shared_future<TransferOutcome>> inFlight;
        std::chrono::milliseconds confirmationDelay;
        uint64_t transferCounter;
        mutable std::mutex lock;
        std::mutex inFlightLock;
};
