// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Oblivious maximum-with-owner over sealed bids

#include "circuit/reducer.h"

#include "circuit/task_graph.h"
#include "errors.h"

#include <functional>
#include <string>
#include <utility>

namespace fheauction {
namespace circuit {

const char* strategyName(Reducer::Strategy strategy) {
    switch (strategy) {
        case Reducer::Strategy::SequentialFold:     return "sequential-fold";
        case Reducer::Strategy::BalancedTree:       return "balanced-tree";
        case Reducer::Strategy::BitwiseElimination: return "bitwise-elimination";
    }
    return "unknown";
}

Reducer::Reducer(const backend::GateBackend& backend, Options options)
    : backend_(backend), comparator_(backend), options_(options) {}

AuctionResult Reducer::reduce(const std::vector<Bid>& bids) {
    if (bids.empty()) {
        throw ConfigurationError("no bids to reduce");
    }
    const uint32_t width = bids[0].value.width();
    for (size_t i = 0; i < bids.size(); ++i) {
        if (bids[i].bidder != i) {
            throw ConfigurationError("bid at position " + std::to_string(i) + " carries bidder index " +
                                     std::to_string(bids[i].bidder));
        }
        if (bids[i].value.width() != width) {
            throw ConfigurationError("bid width mismatch for bidder " + std::to_string(i));
        }
        if (!bids[i].value.isWellFormed()) {
            throw ConfigurationError("bid of bidder " + std::to_string(i) + " has missing ciphertext bits");
        }
    }

    comparisons_ = 0;
    stages_ = 0;

    switch (options_.strategy) {
        case Strategy::SequentialFold:     return fold(bids);
        case Strategy::BalancedTree:       return tree(bids);
        case Strategy::BitwiseElimination: return eliminate(bids);
    }
    throw ConfigurationError("unknown reduction strategy");
}

// =============================================================================
// Sequential Fold
// =============================================================================

/*
 * best = bids[0], mask = [1]
 * for i in 1..n-1:
 *   gt      = bids[i] > best          // strict: ties keep the earlier bidder
 *   best    = gt ? bids[i] : best
 *   mask[j] = mask[j] AND (NOT gt)    for j < i
 *   mask[i] = gt
 */
AuctionResult Reducer::fold(const std::vector<Bid>& bids) {
    EncryptedInt best = bids[0].value;
    OwnershipMask mask;
    mask.reserve(bids.size());
    mask.push_back(backend_.constant(true));

    for (size_t i = 1; i < bids.size(); ++i) {
        const EncryptedInt& challenger = bids[i].value;

        auto gt = comparator_.greater(challenger, best);
        ++comparisons_;

        best = comparator_.select(gt, challenger, best);

        auto notGt = backend_.NOT(gt);
        for (size_t j = 0; j < i; ++j) {
            mask[j] = backend_.AND(mask[j], notGt);
        }
        mask.push_back(gt);
    }

    stages_ = bids.size() - 1;
    return AuctionResult{std::move(best), std::move(mask)};
}

// =============================================================================
// Balanced Tree
// =============================================================================

/*
 * Ordered reduction tree: the left subtree always covers lower bidder
 * indices, so combine() resolving ties to the left reproduces the fold's
 * earliest-bidder rule. Independent subtrees run concurrently.
 */
AuctionResult Reducer::tree(const std::vector<Bid>& bids) {
    const size_t n = bids.size();

    // One slot per tree node, each written by exactly one task
    std::vector<Partial> slots(2 * n - 1);
    size_t nextSlot = 0;
    TaskGraph graph;

    std::function<std::pair<TaskGraph::TaskId, size_t>(size_t, size_t)> build =
        [&](size_t lo, size_t hi) -> std::pair<TaskGraph::TaskId, size_t> {
        const size_t slot = nextSlot++;
        if (hi - lo == 1) {
            auto id = graph.add([this, &slots, &bids, lo, slot] {
                slots[slot] = Partial{bids[lo].value, {backend_.constant(true)}};
            });
            return {id, slot};
        }

        const size_t mid = lo + (hi - lo) / 2;
        auto left = build(lo, mid);
        auto right = build(mid, hi);

        auto id = graph.add(
            [this, &slots, slot, l = left.second, r = right.second] {
                slots[slot] = combine(slots[l], slots[r]);
                slots[l] = Partial();
                slots[r] = Partial();
            },
            {left.first, right.first});
        return {id, slot};
    };

    auto root = build(0, n);
    stages_ = graph.depth() - 1;
    graph.run(options_.workers);

    Partial& result = slots[root.second];
    return AuctionResult{std::move(result.best), std::move(result.mask)};
}

Reducer::Partial Reducer::combine(const Partial& left, const Partial& right) {
    auto gt = comparator_.greater(right.best, left.best);
    ++comparisons_;

    Partial merged;
    merged.best = comparator_.select(gt, right.best, left.best);

    auto notGt = backend_.NOT(gt);
    merged.mask.reserve(left.mask.size() + right.mask.size());
    for (const auto& m : left.mask) {
        merged.mask.push_back(backend_.AND(m, notGt));
    }
    for (const auto& m : right.mask) {
        merged.mask.push_back(backend_.AND(m, gt));
    }
    return merged;
}

// =============================================================================
// Bitwise Elimination
// =============================================================================

/*
 * Survivor scan, MSB first, over all bidders at once:
 *
 *   w[j] = 1
 *   for i in 0..k-1:
 *     s[j]       = w[j] AND bid[j][i]
 *     b          = OR over j of s[j]      // some survivor has a 1 here
 *     winning[i] = b
 *     w[j]       = b ? s[j] : w[j]
 *
 * Survivors w can hold several tied bidders; the first-one pass keeps only
 * the lowest index:
 *
 *   seen = 0
 *   for j: mask[j] = w[j] AND (NOT seen); seen = seen OR w[j]
 */
AuctionResult Reducer::eliminate(const std::vector<Bid>& bids) {
    const size_t n = bids.size();
    const uint32_t width = bids[0].value.width();

    std::vector<Ciphertext> survivors;
    survivors.reserve(n);
    for (size_t j = 0; j < n; ++j) {
        survivors.push_back(backend_.constant(true));
    }

    std::vector<Ciphertext> winning;
    winning.reserve(width);

    for (uint32_t i = 0; i < width; ++i) {
        std::vector<Ciphertext> s;
        s.reserve(n);
        for (size_t j = 0; j < n; ++j) {
            s.push_back(backend_.AND(survivors[j], bids[j].value.bit(i)));
        }

        auto b = orReduce(s);
        for (size_t j = 0; j < n; ++j) {
            survivors[j] = backend_.MUX(b, s[j], survivors[j]);
        }
        winning.push_back(std::move(b));
    }

    OwnershipMask mask;
    mask.reserve(n);
    Ciphertext seen = backend_.constant(false);
    for (size_t j = 0; j < n; ++j) {
        auto notSeen = backend_.NOT(seen);
        mask.push_back(backend_.AND(survivors[j], notSeen));
        if (j + 1 < n) {
            seen = backend_.OR(seen, survivors[j]);
        }
    }

    stages_ = width;
    return AuctionResult{EncryptedInt(std::move(winning), width), std::move(mask)};
}

Ciphertext Reducer::orReduce(std::vector<Ciphertext> bits) const {
    while (bits.size() > 1) {
        std::vector<Ciphertext> reduced;
        reduced.reserve((bits.size() + 1) / 2);

        for (size_t i = 0; i + 1 < bits.size(); i += 2) {
            reduced.push_back(backend_.OR(bits[i], bits[i + 1]));
        }

        // Handle odd element
        if (bits.size() % 2 == 1) {
            reduced.push_back(bits.back());
        }

        bits = std::move(reduced);
    }
    return bits[0];
}

} // namespace circuit
} // namespace fheauction
