// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Unit tests for the bid reduction strategies

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

#include "circuit/client.h"
#include "circuit/reducer.h"
#include "errors.h"
#include "plain_gate_backend.h"

using namespace fheauction;
using namespace fheauction::circuit;
using fheauction::backend::GateStats;
using fheauction::test::PlainGateBackend;

namespace {

std::vector<Bid> sealBids(const PlainGateBackend& backend, const std::vector<uint64_t>& plain, uint32_t width) {
    std::vector<Bid> bids;
    for (size_t i = 0; i < plain.size(); ++i) {
        bids.push_back(Bid{encryptBid(backend, plain[i], width), static_cast<uint32_t>(i)});
    }
    return bids;
}

uint32_t expectedWinner(const std::vector<uint64_t>& plain) {
    return static_cast<uint32_t>(std::max_element(plain.begin(), plain.end()) - plain.begin());
}

std::vector<bool> oneHot(size_t n, size_t at) {
    std::vector<bool> mask(n, false);
    mask[at] = true;
    return mask;
}

}  // namespace

class ReducerTest : public ::testing::TestWithParam<Reducer::Strategy> {
protected:
    PlainGateBackend backend_;

    Reducer makeReducer(unsigned workers = 0) const {
        Reducer::Options options;
        options.strategy = GetParam();
        options.workers = workers;
        return Reducer(backend_, options);
    }

    void expectOutcome(const std::vector<uint64_t>& plain, uint32_t width) {
        Reducer::Options options;
        options.strategy = GetParam();
        Reducer reducer(backend_, options);

        auto result = reducer.reduce(sealBids(backend_, plain, width));
        const auto winner = expectedWinner(plain);

        EXPECT_EQ(result.winningBid.width(), width);
        EXPECT_EQ(decryptBid(backend_, result.winningBid), plain[winner]);
        EXPECT_EQ(decryptMask(backend_, result.ownership), oneHot(plain.size(), winner));
    }
};

TEST_P(ReducerTest, TieGoesToEarliestBidder) {
    // 0101, 1001, 1001
    expectOutcome({5, 9, 9}, 4);
}

TEST_P(ReducerTest, SingleBidder) {
    expectOutcome({11}, 4);
    expectOutcome({0}, 1);
}

TEST_P(ReducerTest, SingleBitBids) {
    expectOutcome({0, 0}, 1);
    expectOutcome({0, 1}, 1);
    expectOutcome({1, 0}, 1);
    expectOutcome({1, 1}, 1);
}

TEST_P(ReducerTest, AllEqualBids) {
    expectOutcome({7, 7, 7, 7, 7}, 3);
    expectOutcome({0, 0, 0}, 3);
}

TEST_P(ReducerTest, MaximumAtEitherEnd) {
    expectOutcome({200, 3, 17, 199}, 8);
    expectOutcome({1, 2, 3, 4, 5, 6, 7}, 8);
    expectOutcome({7, 6, 5, 4, 3, 2, 1}, 8);
}

TEST_P(ReducerTest, RandomAuctions) {
    std::mt19937_64 rng(0xA11C7105ULL);
    for (int round = 0; round < 25; ++round) {
        const size_t n = 1 + rng() % 9;
        const uint32_t width = 1 + static_cast<uint32_t>(rng() % 6);
        std::vector<uint64_t> plain(n);
        for (auto& v : plain) {
            v = rng() & ((1ull << width) - 1);
        }
        expectOutcome(plain, width);
    }
}

TEST_P(ReducerTest, GateCountIsDataIndependent) {
    std::vector<std::vector<uint64_t>> auctions = {
        {0, 0, 0, 0, 0},
        {31, 31, 31, 31, 31},
        {1, 30, 7, 30, 2},
        {31, 0, 0, 0, 0},
        {0, 0, 0, 0, 31},
    };

    GateStats reference;
    for (size_t i = 0; i < auctions.size(); ++i) {
        auto bids = sealBids(backend_, auctions[i], 5);
        auto reducer = makeReducer();

        backend_.resetStats();
        reducer.reduce(bids);
        if (i == 0) {
            reference = backend_.stats();
        } else {
            EXPECT_EQ(backend_.stats(), reference) << "auction " << i;
        }
    }
}

TEST_P(ReducerTest, WorkerCountDoesNotChangeOutcome) {
    const std::vector<uint64_t> plain = {3, 14, 15, 9, 2, 6, 5, 3, 5, 8, 9, 7, 9, 3, 15};
    auto bids = sealBids(backend_, plain, 4);

    for (unsigned workers : {1u, 2u, 8u}) {
        auto reducer = makeReducer(workers);
        auto result = reducer.reduce(bids);
        EXPECT_EQ(decryptBid(backend_, result.winningBid), 15u);
        EXPECT_EQ(decryptMask(backend_, result.ownership), oneHot(plain.size(), 2));
    }
}

TEST_P(ReducerTest, MalformedBidsAreRejectedBeforeAnyGate) {
    auto reducer = makeReducer();

    auto mixed = sealBids(backend_, {1, 2}, 3);
    mixed[1].value = encryptBid(backend_, 2, 4);

    auto misnumbered = sealBids(backend_, {1, 2}, 3);
    misnumbered[1].bidder = 5;

    backend_.resetStats();
    EXPECT_THROW(reducer.reduce({}), ConfigurationError);
    EXPECT_THROW(reducer.reduce(mixed), ConfigurationError);
    EXPECT_THROW(reducer.reduce(misnumbered), ConfigurationError);
    EXPECT_EQ(backend_.stats().gates(), 0u);
}

INSTANTIATE_TEST_SUITE_P(Strategies, ReducerTest,
                         ::testing::Values(Reducer::Strategy::SequentialFold,
                                           Reducer::Strategy::BalancedTree,
                                           Reducer::Strategy::BitwiseElimination),
                         [](const ::testing::TestParamInfo<Reducer::Strategy>& info) {
                             switch (info.param) {
                                 case Reducer::Strategy::SequentialFold:     return "SequentialFold";
                                 case Reducer::Strategy::BalancedTree:       return "BalancedTree";
                                 case Reducer::Strategy::BitwiseElimination: return "BitwiseElimination";
                             }
                             return "Unknown";
                         });

// ============================================================================
// Strategy-specific shape
// ============================================================================

TEST(ReducerShapeTest, ComparisonsAndStages) {
    PlainGateBackend backend;
    auto bids = sealBids(backend, {1, 2, 3, 4, 5, 6, 7, 8}, 4);

    Reducer::Options fold;
    fold.strategy = Reducer::Strategy::SequentialFold;
    Reducer folder(backend, fold);
    folder.reduce(bids);
    EXPECT_EQ(folder.comparisons(), 7u);
    EXPECT_EQ(folder.stages(), 7u);

    Reducer::Options tree;
    tree.strategy = Reducer::Strategy::BalancedTree;
    Reducer treeReducer(backend, tree);
    treeReducer.reduce(bids);
    EXPECT_EQ(treeReducer.comparisons(), 7u);
    EXPECT_EQ(treeReducer.stages(), 3u);

    Reducer::Options bitwise;
    bitwise.strategy = Reducer::Strategy::BitwiseElimination;
    Reducer eliminator(backend, bitwise);
    eliminator.reduce(bids);
    EXPECT_EQ(eliminator.comparisons(), 0u);
    EXPECT_EQ(eliminator.stages(), 4u);
}

TEST(ReducerShapeTest, StrategyNames) {
    EXPECT_STREQ(strategyName(Reducer::Strategy::SequentialFold), "sequential-fold");
    EXPECT_STREQ(strategyName(Reducer::Strategy::BalancedTree), "balanced-tree");
    EXPECT_STREQ(strategyName(Reducer::Strategy::BitwiseElimination), "bitwise-elimination");
}
