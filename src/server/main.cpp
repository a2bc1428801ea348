#include <iostream>
#include <stdexcept>
#include "../core/config.hpp"
#include "../core/constants.hpp"
#include "../core/helpers.hpp"
#include "../core/logger.hpp"
#include "membership.hpp"
#include "split_node.hpp"
#include "transfer.hpp"
using namespace std;

static void usage() {
    cerr << "splitledger " << SPLITLEDGER_VERSION << endl
         << "usage: splitledger [--config file] [--data-path dir] [--quiet] <command> ..." << endl
         << "  expense <group> <payer> <amount> <m1,m2,...>" << endl
         << "  balance <group> <member>" << endl
         << "  balances <group>" << endl
         << "  plan <group>" << endl
         << "  expenses <group>" << endl
         << "  settle <debtor> <creditor> <amount> [ttl]" << endl
         << "  execute <id> <caller>" << endl
         << "  cancel <id> <caller>" << endl
         << "  reclaim <id>" << endl
         << "  settlement <id>" << endl
         << "  rebuild <group>" << endl;
}

static json statusJson(ExecutionStatus status) {
    json result;
    result["status"] = executionStatusAsString(status);
    return result;
}

static json runCommand(SplitNode& node, const vector<string>& args) {
    const string& cmd = args[0];
    auto need = [&](size_t n) {
        if (args.size() < n + 1) throw std::invalid_argument(cmd + " expects " + std::to_string(n) + " arguments");
    };

    if (cmd == "expense") {
        need(4);
        SignedAmount amount = std::stoll(args[3]);
        Expense expense;
        ExecutionStatus status = amount <= 0 ? INVALID_AMOUNT :
            node.applyExpense(std::stoull(args[1]), args[2], (TransactionAmount) amount, splitString(args[4], ','), expense);
        json result = statusJson(status);
        if (status == SUCCESS) result["expense"] = expense.toJson();
        return result;
    } else if (cmd == "balance") {
        need(2);
        SignedAmount balance = node.getBalance(std::stoull(args[1]), args[2]);
        json result;
        result["balance"] = balance;
        result["status"] = balanceStatus(balance);
        return result;
    } else if (cmd == "balances") {
        need(1);
        json result = json::object();
        for (const auto& entry : node.getGroupBalances(std::stoull(args[1]))) {
            result[entry.first] = entry.second;
        }
        return result;
    } else if (cmd == "plan") {
        need(1);
        json result = json::array();
        for (const auto& t : node.computePlan(std::stoull(args[1]))) {
            result.push_back(t.toJson());
        }
        return result;
    } else if (cmd == "expenses") {
        need(1);
        json result = json::array();
        for (const auto& e : node.listGroupExpenses(std::stoull(args[1]))) {
            json item = e.toJson();
            item["settled"] = node.isExpenseSettled(e.getId());
            result.push_back(item);
        }
        return result;
    } else if (cmd == "settle") {
        need(3);
        SignedAmount amount = std::stoll(args[3]);
        SettlementRequest request;
        request.debtor = args[1];
        request.creditor = args[2];
        request.amount = amount > 0 ? (TransactionAmount) amount : 0;
        request.ttl = args.size() > 4 ? std::stoull(args[4]) : 0;
        Settlement settlement;
        ExecutionStatus status = node.initiateSettlement(args[1], request, settlement);
        json result = statusJson(status);
        if (status == SUCCESS) result["settlement"] = settlement.toJson();
        return result;
    } else if (cmd == "execute" || cmd == "cancel") {
        need(2);
        Settlement settlement;
        ExecutionStatus status = cmd == "execute" ?
            node.executeSettlement(std::stoull(args[1]), args[2], settlement) :
            node.cancelSettlement(std::stoull(args[1]), args[2], settlement);
        json result = statusJson(status);
        if (settlement.getId() != NULL_SETTLEMENT) result["settlement"] = settlement.toJson();
        return result;
    } else if (cmd == "reclaim") {
        need(1);
        Settlement settlement;
        ExecutionStatus status = node.reclaimSettlement(std::stoull(args[1]), settlement);
        return statusJson(status);
    } else if (cmd == "settlement") {
        need(1);
        Settlement settlement;
        ExecutionStatus status = node.getSettlement(std::stoull(args[1]), settlement);
        json result = statusJson(status);
        if (status == SUCCESS) result["settlement"] = settlement.toJson();
        return result;
    } else if (cmd == "rebuild") {
        need(1);
        json result;
        result["drifted"] = node.rebuildBalances(std::stoull(args[1]));
        return result;
    }
    throw std::invalid_argument("unknown command " + cmd);
}

int main(int argc, char** argv) {
    json config;
    try {
        config = getConfig(argc, argv);
    } catch (const std::exception& e) {
        Logger::logError(RED + "[ERROR]" + RESET, e.what());
        return 1;
    }
    vector<string> args = config["command"].get<vector<string>>();
    if (args.empty()) {
        usage();
        return 1;
    }
    Logger::setQuiet(config["quiet"].get<bool>());

    try {
        StaticMembership membership(config["groups"]);
        LocalTransferNetwork network(getCurrentTime);
        network.loadAccounts(config["accounts"]);
        SplitNode node(config, membership, network, getCurrentTime);
        node.init();
        json result = runCommand(node, args);
        cout << result.dump(4) << endl;
        node.shutdown();
    } catch (const LedgerCorruption& e) {
        Logger::logError(RED + "[FATAL]" + RESET, e.what());
        return 2;
    } catch (const std::exception& e) {
        Logger::logError(RED + "[ERROR]" + RESET, e.what());
        usage();
        return 1;
    }
    return 0;
}
