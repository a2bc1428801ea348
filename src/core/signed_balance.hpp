#pragma once
#include "common.hpp"

// Signed balances persisted in an unsigned 64 bit field.
// 0 .. 2^63-1 are non-negative balances, 2^63 .. 2^64-1 are negative
// balances of magnitude (value - 2^63). Magnitudes must stay below 2^62,
// anything larger is reported as LedgerCorruption.
typedef uint64_t EncodedBalance;

EncodedBalance encodeBalance(SignedAmount value);
SignedAmount decodeBalance(EncodedBalance encoded);
EncodedBalance applyBalanceDelta(EncodedBalance current, TransactionAmount delta, bool isCredit);
