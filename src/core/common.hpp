#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Members are opaque account / wallet identifiers
typedef std::string MemberId;
typedef uint64_t GroupId;
typedef uint64_t ExpenseId;
typedef uint64_t SettlementId;

// Amounts are counted in the smallest currency unit
typedef uint64_t TransactionAmount;
typedef int64_t SignedAmount;

// Seconds since epoch
typedef uint64_t Timestamp;
typedef std::function<Timestamp()> TimeSource;

#define NULL_GROUP 0
#define NULL_EXPENSE 0
#define NULL_SETTLEMENT 0
