// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Sealed-bid auction over encrypted bids
//
// Lifecycle: Collecting -> Ready -> Evaluating -> Complete
// A failed evaluation leaves the circuit in Failed; rebuild it from fresh
// bids to try again.

#ifndef FHEAUCTION_AUCTION_CIRCUIT_H
#define FHEAUCTION_AUCTION_CIRCUIT_H

#include "backend/gate_backend.h"
#include "circuit/encrypted_int.h"
#include "circuit/reducer.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace fheauction {
namespace circuit {

// The only recognised auction configuration. params must equal the
// backend's own parameter set.
struct AuctionConfig {
    uint32_t bidders = 0;                             // n
    uint32_t bidWidth = 0;                            // k
    backend::GateParams params;
    std::shared_ptr<const backend::GateBackend> backend;
};

class AuctionCircuit {
public:
    enum class State {
        Collecting,
        Ready,
        Evaluating,
        Complete,
        Failed
    };

    // gates is the change in the backend's counters across evaluate(). The
    // counters belong to the backend, so circuits evaluating concurrently on
    // one backend each see the other's gates too.
    struct Stats {
        backend::GateStats gates;
        uint64_t comparisons = 0;
        size_t stages = 0;
        std::chrono::microseconds elapsed{0};
    };

    // Validates config; throws ConfigurationError on zero sizes, missing
    // backend, missing evaluation key or parameter mismatch.
    explicit AuctionCircuit(AuctionConfig config, Reducer::Options reducer = Reducer::Options());

    AuctionCircuit(const AuctionCircuit&) = delete;
    AuctionCircuit& operator=(const AuctionCircuit&) = delete;

    // Appends the next bid and returns its bidder index. Submission order is
    // tie-break priority.
    uint32_t submit(EncryptedInt value);

    // Collecting -> Ready, only once exactly n bids are present
    void seal();

    // Ready -> Evaluating -> Complete. Runs the reduction exactly once.
    const AuctionResult& evaluate();

    // Complete only
    const AuctionResult& result() const;

    State state() const { return state_; }
    uint32_t bidCount() const { return static_cast<uint32_t>(bids_.size()); }
    const AuctionConfig& config() const { return config_; }
    const Stats& stats() const { return stats_; }

private:
    void requireState(State expected, const char* op) const;

    AuctionConfig config_;
    Reducer::Options reducerOptions_;
    std::vector<Bid> bids_;
    State state_ = State::Collecting;
    std::unique_ptr<AuctionResult> result_;
    Stats stats_;
};

const char* stateName(AuctionCircuit::State state);

} // namespace circuit
} // namespace fheauction

#endif // FHEAUCTION_AUCTION_CIRCUIT_H
