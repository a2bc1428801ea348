#include <thread>
#include <stdexcept>
#include "../core/logger.hpp"
#include "transfer.hpp"
using namespace std;

string transferStatusAsString(TransferStatus status) {
    switch(status) {
        case TRANSFER_CONFIRMED:
            return "TRANSFER_CONFIRMED";
        case TRANSFER_ALREADY_CONFIRMED:
            return "TRANSFER_ALREADY_CONFIRMED";
        case TRANSFER_PENDING:
            return "TRANSFER_PENDING";
        case TRANSFER_REJECTED:
            return "TRANSFER_REJECTED";
        case TRANSFER_NO_FUNDS:
            return "TRANSFER_NO_FUNDS";
        case TRANSFER_ERROR:
            return "TRANSFER_ERROR";
    }
    return "UNKNOWN";
}

LocalTransferNetwork::LocalTransferNetwork(TimeSource clock) : clock(clock), confirmationDelay(0), transferCounter(0) {
}

LocalTransferNetwork::~LocalTransferNetwork() {
    waitForPending();
}

void LocalTransferNetwork::loadAccounts(const json& config) {
    for (auto it = config.begin(); it != config.end(); ++it) {
        setAccountBalance(it.key(), it.value().get<TransactionAmount>());
    }
}

void LocalTransferNetwork::setAccountBalance(const MemberId& member, TransactionAmount amount) {
    std::lock_guard<std::mutex> guard(lock);
    accounts[member] = amount;
}

TransactionAmount LocalTransferNetwork::getAccountBalance(const MemberId& member) const {
    std::lock_guard<std::mutex> guard(lock);
    auto it = accounts.find(member);
    if (it == accounts.end()) return 0;
    return it->second;
}

void LocalTransferNetwork::setConfirmationDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> guard(lock);
    confirmationDelay = delay;
}

void LocalTransferNetwork::withdraw(const MemberId& wallet, TransactionAmount amt) {
    TransactionAmount value = accounts[wallet];
    if (amt > value) {
        throw std::runtime_error("Insufficient balance");
    }
    accounts[wallet] = value - amt;
}

void LocalTransferNetwork::deposit(const MemberId& wallet, TransactionAmount amt) {
    TransactionAmount value = accounts[wallet];
    if (value + amt < value) {
        throw std::runtime_error("Balance overflow");
    }
    accounts[wallet] = value + amt;
}

TransferOutcome LocalTransferNetwork::settle(const TransferRequest& request, const CommitHook& commit) {
    std::lock_guard<std::mutex> guard(lock);
    TransferOutcome outcome;
    outcome.status = TRANSFER_ERROR;

    auto existing = confirmed.find(request.reference);
    if (existing != confirmed.end()) {
        outcome.status = TRANSFER_ALREADY_CONFIRMED;
        outcome.proof = existing->second;
        return outcome;
    }
    if (accounts[request.from] < request.amount) {
        outcome.status = TRANSFER_NO_FUNDS;
        return outcome;
    }

    withdraw(request.from, request.amount);
    try {
        deposit(request.to, request.amount);
    } catch (const std::exception& e) {
        deposit(request.from, request.amount);
        Logger::logError(RED + "[ERROR]" + RESET, "Transfer " + request.reference + " failed: " + e.what());
        return outcome;
    }

    TransferProof proof;
    proof.transferId = "tx-" + std::to_string(++transferCounter);
    proof.reference = request.reference;
    proof.from = request.from;
    proof.to = request.to;
    proof.amount = request.amount;
    proof.confirmedAt = clock();

    bool committed = false;
    try {
        committed = commit(proof);
    } catch (...) {
        // revert before the commit failure propagates
        withdraw(request.to, request.amount);
        deposit(request.from, request.amount);
        throw;
    }
    if (!committed) {
        withdraw(request.to, request.amount);
        deposit(request.from, request.amount);
        outcome.status = TRANSFER_REJECTED;
        outcome.proof = proof;
        return outcome;
    }

    confirmed[request.reference] = proof;
    outcome.status = TRANSFER_CONFIRMED;
    outcome.proof = proof;
    return outcome;
}

void LocalTransferNetwork::pruneFinished() {
    for (auto it = inFlight.begin(); it != inFlight.end();) {
        if (it->second.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            it = inFlight.erase(it);
        } else {
            ++it;
        }
    }
}

TransferOutcome LocalTransferNetwork::transfer(const TransferRequest& request, const CommitHook& commit, std::chrono::milliseconds timeout) {
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> guard(lock);
        delay = confirmationDelay;
    }
    if (delay.count() == 0) {
        return settle(request, commit);
    }

    std::shared_future<TransferOutcome> pending;
    {
        std::lock_guard<std::mutex> guard(inFlightLock);
        pruneFinished();
        auto it = inFlight.find(request.reference);
        if (it != inFlight.end()) {
            // same reference already submitted, wait on that bundle instead of sending another
            pending = it->second;
        } else {
            pending = std::async(std::launch::async, [this, request, commit, delay]() {
                std::this_thread::sleep_for(delay);
                return settle(request, commit);
            }).share();
            inFlight[request.reference] = pending;
        }
    }

    if (pending.wait_for(timeout) != std::future_status::ready) {
        Logger::logWarning("Transfer " + request.reference + " not confirmed within " + std::to_string(timeout.count()) + "ms");
        TransferOutcome outcome;
        outcome.status = TRANSFER_PENDING;
        return outcome;
    }
    return pending.get();
}

bool LocalTransferNetwork::findConfirmed(const string& reference, TransferProof& proof) const {
    std::lock_guard<std::mutex> guard(lock);
    auto it = confirmed.find(reference);
    if (it == confirmed.end()) return false;
    proof = it->second;
    return true;
}

size_t LocalTransferNetwork::confirmedCount() const {
    std::lock_guard<std::mutex> guard(lock);
    return confirmed.size();
}

void LocalTransferNetwork::waitForPending() {
    std::map<std::string, std::shared_future<TransferOutcome>> waiting;
    {
        std::lock_guard<std::mutex> guard(inFlightLock);
        waiting.swap(inFlight);
    }
    for (auto& entry : waiting) {
        entry.second.wait();
    }
}
