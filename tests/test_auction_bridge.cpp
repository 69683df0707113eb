// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Tests for the C bridge used by the Go bindings

#include <gtest/gtest.h>
#include <cstdint>
#include <string>

#include "auction_bridge.h"

class AuctionBridgeTest : public ::testing::Test {
protected:
    static inline FheAuctionBackend backend_ = nullptr;

    static void SetUpTestSuite() {
        if (backend_) {
            return;
        }
        backend_ = fheauction_backend_new(FHEAUCTION_TOY, FHEAUCTION_METHOD_GINX);
        ASSERT_NE(backend_, nullptr) << fheauction_last_error_message();
        ASSERT_EQ(fheauction_backend_keygen(backend_), FHEAUCTION_OK) << fheauction_last_error_message();
    }

    static void TearDownTestSuite() {
        fheauction_backend_free(backend_);
        backend_ = nullptr;
    }
};

TEST_F(AuctionBridgeTest, Version) {
    EXPECT_EQ(fheauction_version(), 0x00010000u);
}

TEST_F(AuctionBridgeTest, BitRoundTrip) {
    ASSERT_TRUE(fheauction_backend_has_keys(backend_));

    FheAuctionCiphertext one = fheauction_encrypt_bit(backend_, 1);
    FheAuctionCiphertext zero = fheauction_encrypt_bit(backend_, 0);
    ASSERT_NE(one, nullptr);
    ASSERT_NE(zero, nullptr);

    EXPECT_EQ(fheauction_decrypt_bit(backend_, one), 1);
    EXPECT_EQ(fheauction_decrypt_bit(backend_, zero), 0);

    fheauction_ciphertext_free(one);
    fheauction_ciphertext_free(zero);
}

TEST_F(AuctionBridgeTest, FullAuction) {
    FheAuction auction = fheauction_auction_new(backend_, 3, 4, FHEAUCTION_REDUCE_TREE);
    ASSERT_NE(auction, nullptr) << fheauction_last_error_message();
    EXPECT_EQ(fheauction_auction_state(auction), FHEAUCTION_STATE_COLLECTING);

    const uint64_t values[] = {5, 9, 9};
    for (uint32_t i = 0; i < 3; ++i) {
        FheAuctionBid bid = fheauction_bid_encrypt(backend_, values[i], 4);
        ASSERT_NE(bid, nullptr);
        EXPECT_EQ(fheauction_bid_width(bid), 4u);

        uint32_t index = 99;
        EXPECT_EQ(fheauction_auction_submit(auction, bid, &index), FHEAUCTION_OK);
        EXPECT_EQ(index, i);
        fheauction_bid_free(bid);
    }

    ASSERT_EQ(fheauction_auction_seal(auction), FHEAUCTION_OK);
    ASSERT_EQ(fheauction_auction_evaluate(auction), FHEAUCTION_OK) << fheauction_last_error_message();
    EXPECT_EQ(fheauction_auction_state(auction), FHEAUCTION_STATE_COMPLETE);

    uint64_t amount = 0;
    uint32_t winner = 99;
    ASSERT_EQ(fheauction_auction_open(backend_, auction, &amount, &winner), FHEAUCTION_OK);
    EXPECT_EQ(amount, 9u);
    EXPECT_EQ(winner, 1u);

    FheAuctionBid winning = fheauction_auction_winning_bid(auction);
    ASSERT_NE(winning, nullptr);
    uint64_t decrypted = 0;
    EXPECT_EQ(fheauction_bid_decrypt(backend_, winning, &decrypted), FHEAUCTION_OK);
    EXPECT_EQ(decrypted, 9u);
    fheauction_bid_free(winning);

    FheAuctionCiphertext owner = fheauction_auction_ownership_bit(auction, 2);
    ASSERT_NE(owner, nullptr);
    EXPECT_EQ(fheauction_decrypt_bit(backend_, owner), 0);
    fheauction_ciphertext_free(owner);

    FheAuctionStats stats = {};
    ASSERT_EQ(fheauction_auction_stats(auction, &stats), FHEAUCTION_OK);
    EXPECT_EQ(stats.comparisons, 2u);
    EXPECT_GT(stats.gates, 0u);

    EXPECT_EQ(fheauction_auction_evaluate(auction), FHEAUCTION_ERR_CONFIGURATION);
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_ERR_CONFIGURATION);

    fheauction_auction_free(auction);
}

TEST_F(AuctionBridgeTest, ErrorsAreReported) {
    EXPECT_EQ(fheauction_auction_new(backend_, 0, 4, FHEAUCTION_REDUCE_FOLD), nullptr);
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_ERR_CONFIGURATION);
    EXPECT_FALSE(std::string(fheauction_last_error_message()).empty());

    EXPECT_EQ(fheauction_bid_encrypt(backend_, 16, 4), nullptr);
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_ERR_CONFIGURATION);

    EXPECT_EQ(fheauction_auction_seal(nullptr), FHEAUCTION_ERR_NULL_POINTER);
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_ERR_NULL_POINTER);

    FheAuction auction = fheauction_auction_new(backend_, 2, 4, FHEAUCTION_REDUCE_FOLD);
    ASSERT_NE(auction, nullptr);
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_OK);

    FheAuctionBid narrow = fheauction_bid_encrypt(backend_, 3, 2);
    ASSERT_NE(narrow, nullptr);
    EXPECT_EQ(fheauction_auction_submit(auction, narrow, nullptr), FHEAUCTION_ERR_CONFIGURATION);
    EXPECT_EQ(fheauction_auction_seal(auction), FHEAUCTION_ERR_CONFIGURATION);
    EXPECT_EQ(fheauction_auction_winning_bid(auction), nullptr);

    fheauction_bid_free(narrow);
    fheauction_auction_free(auction);
}

TEST(AuctionBridgeNullTest, AccessorsReportNullHandles) {
    EXPECT_FALSE(fheauction_backend_has_keys(nullptr));
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_ERR_NULL_POINTER);

    EXPECT_EQ(fheauction_bid_width(nullptr), 0u);
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_ERR_NULL_POINTER);
    EXPECT_STREQ(fheauction_last_error_message(), "bid is NULL");

    EXPECT_EQ(fheauction_auction_state(nullptr), FHEAUCTION_STATE_FAILED);
    EXPECT_EQ(fheauction_last_error(), FHEAUCTION_ERR_NULL_POINTER);
    EXPECT_STREQ(fheauction_last_error_message(), "auction is NULL");
}
