// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// End-to-end tests on OpenFHE BinFHE with TOY parameters

#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <vector>

#include "backend/openfhe_backend.h"
#include "circuit/auction_circuit.h"
#include "circuit/client.h"
#include "circuit/comparator.h"
#include "errors.h"

using namespace fheauction;
using namespace fheauction::circuit;
using fheauction::backend::BootstrapMethod;
using fheauction::backend::Ciphertext;
using fheauction::backend::GateParams;
using fheauction::backend::OpenFHEGateBackend;
using fheauction::backend::SecurityLevel;

namespace {

GateParams toyParams() {
    GateParams params;
    params.level = SecurityLevel::Toy;
    params.method = BootstrapMethod::GINX;
    return params;
}

}  // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class OpenFHEBackendTest : public ::testing::Test {
protected:
    static inline std::shared_ptr<OpenFHEGateBackend> shared_backend_;

    static void SetUpTestSuite() {
        if (shared_backend_) {
            return;
        }
        shared_backend_ = std::make_shared<OpenFHEGateBackend>(toyParams());
        shared_backend_->generateKeys();
    }

    static void TearDownTestSuite() {
        shared_backend_.reset();
    }

    void SetUp() override {
        backend_ = shared_backend_.get();
    }

    OpenFHEGateBackend* backend_ = nullptr;
};

// ============================================================================
// Gates
// ============================================================================

TEST_F(OpenFHEBackendTest, EncryptDecrypt) {
    EXPECT_TRUE(backend_->decrypt(backend_->encrypt(true)));
    EXPECT_FALSE(backend_->decrypt(backend_->encrypt(false)));
}

TEST_F(OpenFHEBackendTest, GateTruthTables) {
    for (int x = 0; x < 2; ++x) {
        for (int y = 0; y < 2; ++y) {
            auto a = backend_->encrypt(x != 0);
            auto b = backend_->encrypt(y != 0);

            EXPECT_EQ(backend_->decrypt(backend_->AND(a, b)), (x && y)) << x << y;
            EXPECT_EQ(backend_->decrypt(backend_->OR(a, b)), (x || y)) << x << y;
            EXPECT_EQ(backend_->decrypt(backend_->XOR(a, b)), (x != y)) << x << y;
            EXPECT_EQ(backend_->decrypt(backend_->XNOR(a, b)), (x == y)) << x << y;
        }
        auto a = backend_->encrypt(x != 0);
        EXPECT_EQ(backend_->decrypt(backend_->NOT(a)), x == 0);
    }
}

TEST_F(OpenFHEBackendTest, MuxSelects) {
    auto one = backend_->encrypt(true);
    auto zero = backend_->encrypt(false);

    EXPECT_TRUE(backend_->decrypt(backend_->MUX(one, one, zero)));
    EXPECT_FALSE(backend_->decrypt(backend_->MUX(one, zero, one)));
    EXPECT_FALSE(backend_->decrypt(backend_->MUX(zero, one, zero)));
    EXPECT_TRUE(backend_->decrypt(backend_->MUX(zero, zero, one)));
}

TEST_F(OpenFHEBackendTest, ReportsParameterSet) {
    EXPECT_EQ(backend_->params(), toyParams());
    EXPECT_TRUE(backend_->hasSecretKey());
    EXPECT_TRUE(backend_->hasEvaluationKey());
}

TEST(OpenFHEBackendKeysTest, GatesRequireKeys) {
    OpenFHEGateBackend backend(toyParams());
    EXPECT_FALSE(backend.hasEvaluationKey());
    EXPECT_THROW(backend.encrypt(true), BackendError);
}

// ============================================================================
// Circuit
// ============================================================================

TEST_F(OpenFHEBackendTest, ConstantsDecrypt) {
    EXPECT_TRUE(backend_->decrypt(backend_->constant(true)));
    EXPECT_FALSE(backend_->decrypt(backend_->constant(false)));
    EXPECT_TRUE(backend_->decrypt(backend_->AND(backend_->constant(true), backend_->encrypt(true))));
}

TEST(OpenFHEEvaluatorTest, ComparesWithBootstrappingKeyOnly) {
    OpenFHEGateBackend evaluator(toyParams());
    evaluator.generateKeys();

    auto a = encryptBid(evaluator, 2, 2);
    auto b = encryptBid(evaluator, 1, 2);
    evaluator.discardSecretKey();

    ASSERT_FALSE(evaluator.hasSecretKey());
    ASSERT_TRUE(evaluator.hasEvaluationKey());
    EXPECT_THROW(evaluator.encrypt(true), BackendError);

    Comparator comparator(evaluator);
    Ciphertext gt;
    EXPECT_NO_THROW(gt = comparator.greater(a, b));
    EXPECT_TRUE(gt.isValid());
    EXPECT_THROW(evaluator.decrypt(gt), BackendError);
}

TEST_F(OpenFHEBackendTest, ComparatorTwoBit) {
    Comparator comparator(*backend_);
    for (uint64_t a = 0; a < 4; ++a) {
        for (uint64_t b = 0; b < 4; ++b) {
            auto ea = encryptBid(*backend_, a, 2);
            auto eb = encryptBid(*backend_, b, 2);
            EXPECT_EQ(backend_->decrypt(comparator.greater(ea, eb)), a > b) << a << " > " << b;
        }
    }
}

TEST_F(OpenFHEBackendTest, TieScenario) {
    for (auto strategy : {Reducer::Strategy::SequentialFold, Reducer::Strategy::BalancedTree,
                          Reducer::Strategy::BitwiseElimination}) {
        AuctionConfig config;
        config.bidders = 3;
        config.bidWidth = 4;
        config.params = toyParams();
        config.backend = shared_backend_;

        Reducer::Options options;
        options.strategy = strategy;
        AuctionCircuit circuit(std::move(config), options);

        for (uint64_t v : {5u, 9u, 9u}) {
            circuit.submit(encryptBid(*backend_, v, 4));
        }
        circuit.seal();
        const auto& result = circuit.evaluate();

        EXPECT_EQ(decryptBid(*backend_, result.winningBid), 9u) << strategyName(strategy);
        EXPECT_EQ(decryptMask(*backend_, result.ownership), (std::vector<bool>{false, true, false}))
            << strategyName(strategy);
    }
}
