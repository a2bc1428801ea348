#pragma once
#include <string>
#include <cstdint>

// System
#define TIMEOUT_TRANSFER_MS 5000
#define TRANSFER_RETRIES 3
#define RETRY_BACKOFF_MS 1000
#define RETRY_BACKOFF_MULTIPLIER 2

// Include generated version
#include "version.h"

// Files
#define DEFAULT_DATA_PATH "./data"
#define LEDGER_DIR_NAME "ledger"
#define SETTLEMENTS_DIR_NAME "settlements"

// Splits
#define MAX_SPLIT_PARTICIPANTS 100

// Settlements
#define DEFAULT_SETTLEMENT_TTL_SEC 86400

// Encoded balances: values >= BALANCE_SIGN_OFFSET are negative,
// magnitudes must stay below BALANCE_MAX_MAGNITUDE
#define BALANCE_SIGN_OFFSET (1ULL << 63)
#define BALANCE_MAX_MAGNITUDE (1ULL << 62)

// Listing
#define DEFAULT_LIST_LIMIT 50
