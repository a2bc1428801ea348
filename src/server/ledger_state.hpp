#pragma once
#include <map>
#include "../core/common.hpp"

// LedgerState represents a snapshot of member balances (or balance deltas) within one group
using LedgerState = std::map<MemberId, SignedAmount>;
