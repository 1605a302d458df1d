#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace quantcode {

// Daily bars carry real-valued prices (equities, not exchange ticks)
using Price = double;
using Volume = double;
using Shares = int64_t;
using PnL = double;

// Milliseconds since Unix epoch, UTC. Daily bars sit at 00:00 UTC.
using Timestamp = uint64_t;

constexpr Timestamp MS_PER_DAY = 24ULL * 60 * 60 * 1000;

constexpr Price INVALID_PRICE = std::numeric_limits<Price>::quiet_NaN();

// Number of voting indicators feeding the consensus engine
constexpr size_t VOTING_INDICATORS = 4;

} // namespace quantcode
