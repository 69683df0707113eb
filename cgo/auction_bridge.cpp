// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// C++ bridge implementation for the encrypted sealed-bid auction
// This bridges Go's CGO calls to the circuit and the OpenFHE backend

#include "auction_bridge.h"

#include "backend/openfhe_backend.h"
#include "circuit/auction_circuit.h"
#include "circuit/client.h"
#include "errors.h"

#include <cstring>
#include <memory>
#include <new>
#include <vector>

using namespace fheauction;
using namespace fheauction::backend;
using namespace fheauction::circuit;

// Version
#define FHEAUCTION_BRIDGE_VERSION 0x00010000 // 1.0.0

// =============================================================================
// Thread-local error handling
// =============================================================================

static thread_local FheAuctionError g_last_error = FHEAUCTION_OK;
static thread_local char g_error_message[256] = "";

static int set_error(FheAuctionError err, const char* msg) {
    g_last_error = err;
    strncpy(g_error_message, msg, sizeof(g_error_message) - 1);
    g_error_message[sizeof(g_error_message) - 1] = '\0';
    return err;
}

static void clear_error() {
    g_last_error = FHEAUCTION_OK;
    g_error_message[0] = '\0';
}

// Runs fn, mapping exceptions onto status codes
template <typename Fn>
static int guarded(Fn&& fn) {
    try {
        fn();
        clear_error();
        return FHEAUCTION_OK;
    } catch (const ConfigurationError& e) {
        return set_error(FHEAUCTION_ERR_CONFIGURATION, e.what());
    } catch (const BackendError& e) {
        return set_error(FHEAUCTION_ERR_BACKEND, e.what());
    } catch (const std::bad_alloc&) {
        return set_error(FHEAUCTION_ERR_INTERNAL, "allocation failed");
    } catch (const std::exception& e) {
        return set_error(FHEAUCTION_ERR_INTERNAL, e.what());
    }
}

// =============================================================================
// Internal wrapper types
// =============================================================================

struct BackendWrapper {
    std::shared_ptr<OpenFHEGateBackend> backend;
};

struct CiphertextWrapper {
    Ciphertext ct;
};

struct BidWrapper {
    EncryptedInt value;
};

struct AuctionWrapper {
    std::unique_ptr<AuctionCircuit> circuit;
};

static GateParams mapParams(FheAuctionSecurityLevel level, FheAuctionMethod method) {
    GateParams params;
    switch (level) {
        case FHEAUCTION_TOY:            params.level = SecurityLevel::Toy; break;
        case FHEAUCTION_STD128:         params.level = SecurityLevel::Std128; break;
        case FHEAUCTION_STD128_AP:      params.level = SecurityLevel::Std128AP; break;
        case FHEAUCTION_STD128_LMKCDEY: params.level = SecurityLevel::Std128LMKCDEY; break;
        case FHEAUCTION_STD192:         params.level = SecurityLevel::Std192; break;
        case FHEAUCTION_STD256:         params.level = SecurityLevel::Std256; break;
        default:
            throw ConfigurationError("unknown security level");
    }
    switch (method) {
        case FHEAUCTION_METHOD_GINX:    params.method = BootstrapMethod::GINX; break;
        case FHEAUCTION_METHOD_AP:      params.method = BootstrapMethod::AP; break;
        case FHEAUCTION_METHOD_LMKCDEY: params.method = BootstrapMethod::LMKCDEY; break;
        default:
            throw ConfigurationError("unknown bootstrapping method");
    }
    return params;
}

static Reducer::Strategy mapStrategy(FheAuctionStrategy strategy) {
    switch (strategy) {
        case FHEAUCTION_REDUCE_TREE:    return Reducer::Strategy::BalancedTree;
        case FHEAUCTION_REDUCE_FOLD:    return Reducer::Strategy::SequentialFold;
        case FHEAUCTION_REDUCE_BITWISE: return Reducer::Strategy::BitwiseElimination;
    }
    throw ConfigurationError("unknown reduction strategy");
}

static FheAuctionState mapState(AuctionCircuit::State state) {
    switch (state) {
        case AuctionCircuit::State::Collecting: return FHEAUCTION_STATE_COLLECTING;
        case AuctionCircuit::State::Ready:      return FHEAUCTION_STATE_READY;
        case AuctionCircuit::State::Evaluating: return FHEAUCTION_STATE_EVALUATING;
        case AuctionCircuit::State::Complete:   return FHEAUCTION_STATE_COMPLETE;
        case AuctionCircuit::State::Failed:     return FHEAUCTION_STATE_FAILED;
    }
    return FHEAUCTION_STATE_FAILED;
}

// =============================================================================
// Version and Errors
// =============================================================================

extern "C" uint32_t fheauction_version(void) {
    return FHEAUCTION_BRIDGE_VERSION;
}

extern "C" FheAuctionError fheauction_last_error(void) {
    return g_last_error;
}

extern "C" const char* fheauction_last_error_message(void) {
    return g_error_message;
}

// =============================================================================
// Backend Management
// =============================================================================

extern "C" FheAuctionBackend fheauction_backend_new(FheAuctionSecurityLevel level, FheAuctionMethod method) {
    BackendWrapper* wrapper = nullptr;
    guarded([&] {
        auto backend = std::make_shared<OpenFHEGateBackend>(mapParams(level, method));
        wrapper = new BackendWrapper{std::move(backend)};
    });
    return static_cast<FheAuctionBackend>(wrapper);
}

extern "C" void fheauction_backend_free(FheAuctionBackend backend) {
    if (backend) {
        delete static_cast<BackendWrapper*>(backend);
    }
}

extern "C" int fheauction_backend_keygen(FheAuctionBackend backend) {
    if (!backend) return set_error(FHEAUCTION_ERR_NULL_POINTER, "backend is NULL");

    return guarded([&] {
        static_cast<BackendWrapper*>(backend)->backend->generateKeys();
    });
}

extern "C" bool fheauction_backend_has_keys(FheAuctionBackend backend) {
    if (!backend) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "backend is NULL");
        return false;
    }
    auto* wrapper = static_cast<BackendWrapper*>(backend);
    clear_error();
    return wrapper->backend->hasSecretKey() && wrapper->backend->hasEvaluationKey();
}

// =============================================================================
// Encryption / Decryption
// =============================================================================

extern "C" FheAuctionCiphertext fheauction_encrypt_bit(FheAuctionBackend backend, int value) {
    if (!backend) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "backend is NULL");
        return nullptr;
    }

    CiphertextWrapper* wrapper = nullptr;
    guarded([&] {
        auto ct = static_cast<BackendWrapper*>(backend)->backend->encrypt(value != 0);
        wrapper = new CiphertextWrapper{std::move(ct)};
    });
    return static_cast<FheAuctionCiphertext>(wrapper);
}

extern "C" int fheauction_decrypt_bit(FheAuctionBackend backend, FheAuctionCiphertext ct) {
    if (!backend || !ct) return set_error(FHEAUCTION_ERR_NULL_POINTER, "backend or ciphertext is NULL");

    bool bit = false;
    int status = guarded([&] {
        bit = static_cast<BackendWrapper*>(backend)->backend->decrypt(
            static_cast<CiphertextWrapper*>(ct)->ct);
    });
    return status == FHEAUCTION_OK ? (bit ? 1 : 0) : status;
}

extern "C" void fheauction_ciphertext_free(FheAuctionCiphertext ct) {
    if (ct) {
        delete static_cast<CiphertextWrapper*>(ct);
    }
}

extern "C" FheAuctionBid fheauction_bid_encrypt(FheAuctionBackend backend, uint64_t value, uint32_t width) {
    if (!backend) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "backend is NULL");
        return nullptr;
    }

    BidWrapper* wrapper = nullptr;
    guarded([&] {
        auto bid = encryptBid(*static_cast<BackendWrapper*>(backend)->backend, value, width);
        wrapper = new BidWrapper{std::move(bid)};
    });
    return static_cast<FheAuctionBid>(wrapper);
}

extern "C" int fheauction_bid_decrypt(FheAuctionBackend backend, FheAuctionBid bid, uint64_t* out) {
    if (!backend || !bid || !out) return set_error(FHEAUCTION_ERR_NULL_POINTER, "NULL argument");

    return guarded([&] {
        *out = decryptBid(*static_cast<BackendWrapper*>(backend)->backend,
                          static_cast<BidWrapper*>(bid)->value);
    });
}

extern "C" uint32_t fheauction_bid_width(FheAuctionBid bid) {
    if (!bid) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "bid is NULL");
        return 0;
    }
    clear_error();
    return static_cast<BidWrapper*>(bid)->value.width();
}

extern "C" void fheauction_bid_free(FheAuctionBid bid) {
    if (bid) {
        delete static_cast<BidWrapper*>(bid);
    }
}

// =============================================================================
// Auction
// =============================================================================

extern "C" FheAuction fheauction_auction_new(FheAuctionBackend backend, uint32_t bidders, uint32_t width,
                                             FheAuctionStrategy strategy) {
    if (!backend) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "backend is NULL");
        return nullptr;
    }

    AuctionWrapper* wrapper = nullptr;
    guarded([&] {
        const auto& shared = static_cast<BackendWrapper*>(backend)->backend;

        AuctionConfig config;
        config.bidders = bidders;
        config.bidWidth = width;
        config.params = shared->params();
        config.backend = shared;

        Reducer::Options options;
        options.strategy = mapStrategy(strategy);

        auto circuit = std::make_unique<AuctionCircuit>(std::move(config), options);
        wrapper = new AuctionWrapper{std::move(circuit)};
    });
    return static_cast<FheAuction>(wrapper);
}

extern "C" void fheauction_auction_free(FheAuction auction) {
    if (auction) {
        delete static_cast<AuctionWrapper*>(auction);
    }
}

extern "C" int fheauction_auction_submit(FheAuction auction, FheAuctionBid bid, uint32_t* index) {
    if (!auction || !bid) return set_error(FHEAUCTION_ERR_NULL_POINTER, "auction or bid is NULL");

    return guarded([&] {
        auto assigned = static_cast<AuctionWrapper*>(auction)->circuit->submit(
            static_cast<BidWrapper*>(bid)->value);
        if (index) *index = assigned;
    });
}

extern "C" int fheauction_auction_seal(FheAuction auction) {
    if (!auction) return set_error(FHEAUCTION_ERR_NULL_POINTER, "auction is NULL");

    return guarded([&] { static_cast<AuctionWrapper*>(auction)->circuit->seal(); });
}

extern "C" int fheauction_auction_evaluate(FheAuction auction) {
    if (!auction) return set_error(FHEAUCTION_ERR_NULL_POINTER, "auction is NULL");

    return guarded([&] { static_cast<AuctionWrapper*>(auction)->circuit->evaluate(); });
}

extern "C" FheAuctionState fheauction_auction_state(FheAuction auction) {
    if (!auction) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "auction is NULL");
        return FHEAUCTION_STATE_FAILED;
    }
    clear_error();
    return mapState(static_cast<AuctionWrapper*>(auction)->circuit->state());
}

extern "C" FheAuctionBid fheauction_auction_winning_bid(FheAuction auction) {
    if (!auction) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "auction is NULL");
        return nullptr;
    }

    BidWrapper* wrapper = nullptr;
    guarded([&] {
        const auto& result = static_cast<AuctionWrapper*>(auction)->circuit->result();
        wrapper = new BidWrapper{result.winningBid};
    });
    return static_cast<FheAuctionBid>(wrapper);
}

extern "C" FheAuctionCiphertext fheauction_auction_ownership_bit(FheAuction auction, uint32_t bidder) {
    if (!auction) {
        set_error(FHEAUCTION_ERR_NULL_POINTER, "auction is NULL");
        return nullptr;
    }

    CiphertextWrapper* wrapper = nullptr;
    guarded([&] {
        const auto& result = static_cast<AuctionWrapper*>(auction)->circuit->result();
        if (bidder >= result.ownership.size()) {
            throw ConfigurationError("bidder index out of range");
        }
        wrapper = new CiphertextWrapper{result.ownership[bidder]};
    });
    return static_cast<FheAuctionCiphertext>(wrapper);
}

extern "C" int fheauction_auction_open(FheAuctionBackend backend, FheAuction auction,
                                       uint64_t* amount, uint32_t* winner) {
    if (!backend || !auction || !amount || !winner) {
        return set_error(FHEAUCTION_ERR_NULL_POINTER, "NULL argument");
    }

    return guarded([&] {
        const auto& result = static_cast<AuctionWrapper*>(auction)->circuit->result();
        auto outcome = openResult(*static_cast<BackendWrapper*>(backend)->backend, result);
        *amount = outcome.amount;
        *winner = outcome.winner;
    });
}

extern "C" int fheauction_auction_stats(FheAuction auction, FheAuctionStats* out) {
    if (!auction || !out) return set_error(FHEAUCTION_ERR_NULL_POINTER, "auction or output is NULL");

    const auto& stats = static_cast<AuctionWrapper*>(auction)->circuit->stats();
    out->gates = stats.gates.gates();
    out->constants = stats.gates.count(GateKind::Constant);
    out->comparisons = stats.comparisons;
    out->stages = stats.stages;
    out->elapsed_us = static_cast<uint64_t>(stats.elapsed.count());
    clear_error();
    return FHEAUCTION_OK;
}
