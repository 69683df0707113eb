// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Reduction of n sealed bids to (winning bid, ownership mask)
//
// All strategies produce the same plaintext outcome: the maximum bid and a
// one-hot mask at the lowest bidder index holding it.
// - SequentialFold:     left fold, depth O(n*k)
// - BalancedTree:       ordered binary tree on a worker pool, depth O(log n * k)
// - BitwiseElimination: MSB-first survivor scan plus first-one selection

#ifndef FHEAUCTION_REDUCER_H
#define FHEAUCTION_REDUCER_H

#include "backend/gate_backend.h"
#include "circuit/comparator.h"
#include "circuit/encrypted_int.h"

#include <atomic>
#include <cstdint>
#include <vector>

namespace fheauction {
namespace circuit {

class Reducer {
public:
    enum class Strategy {
        SequentialFold,
        BalancedTree,
        BitwiseElimination
    };

    struct Options {
        Strategy strategy = Strategy::BalancedTree;
        unsigned workers = 0;  // 0 = hardware concurrency
    };

    explicit Reducer(const backend::GateBackend& backend) : Reducer(backend, Options()) {}
    Reducer(const backend::GateBackend& backend, Options options);

    // bids[i].bidder must equal i and every value must share one width.
    // Throws ConfigurationError before evaluating any gate otherwise.
    AuctionResult reduce(const std::vector<Bid>& bids);

    const Options& options() const { return options_; }

    // Comparator calls made by the last reduce()
    uint64_t comparisons() const { return comparisons_.load(); }

    // Circuit depth of the last reduce(), in comparison stages
    size_t stages() const { return stages_; }

private:
    // Partial result over a contiguous run of bidders
    struct Partial {
        EncryptedInt best;
        OwnershipMask mask;
    };

    AuctionResult fold(const std::vector<Bid>& bids);
    AuctionResult tree(const std::vector<Bid>& bids);
    AuctionResult eliminate(const std::vector<Bid>& bids);

    // Left covers lower bidder indices than right; ties keep left
    Partial combine(const Partial& left, const Partial& right);

    Ciphertext orReduce(std::vector<Ciphertext> bits) const;

    const backend::GateBackend& backend_;
    Comparator comparator_;
    Options options_;
    std::atomic<uint64_t> comparisons_{0};
    size_t stages_ = 0;
};

const char* strategyName(Reducer::Strategy strategy);

} // namespace circuit
} // namespace fheauction

#endif // FHEAUCTION_REDUCER_H
