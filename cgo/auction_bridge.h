// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// C bridge header for the encrypted sealed-bid auction
// This header defines the C interface that Go calls via CGO

#ifndef FHEAUCTION_BRIDGE_H
#define FHEAUCTION_BRIDGE_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

// Opaque handle types
typedef void* FheAuctionBackend;
typedef void* FheAuctionCiphertext;
typedef void* FheAuctionBid;
typedef void* FheAuction;

// Status codes. Functions returning int return one of these; functions
// returning a handle return NULL on failure. Either way the cause is
// available from fheauction_last_error() on the calling thread.
typedef enum {
    FHEAUCTION_OK = 0,
    FHEAUCTION_ERR_NULL_POINTER = -1,
    FHEAUCTION_ERR_CONFIGURATION = -2,
    FHEAUCTION_ERR_BACKEND = -3,
    FHEAUCTION_ERR_INTERNAL = -4
} FheAuctionError;

// Security levels matching OpenFHE BINFHE_PARAMSET
typedef enum {
    FHEAUCTION_TOY = 0,            // testing only
    FHEAUCTION_STD128 = 1,         // 128-bit security (CGGI/GINX)
    FHEAUCTION_STD128_AP = 2,      // 128-bit security (AP variant)
    FHEAUCTION_STD128_LMKCDEY = 3, // 128-bit security (LMKCDEY)
    FHEAUCTION_STD192 = 4,         // 192-bit security
    FHEAUCTION_STD256 = 5          // 256-bit security
} FheAuctionSecurityLevel;

// Bootstrapping method
typedef enum {
    FHEAUCTION_METHOD_GINX = 0,
    FHEAUCTION_METHOD_AP = 1,
    FHEAUCTION_METHOD_LMKCDEY = 2
} FheAuctionMethod;

// Reduction strategy used by fheauction_auction_evaluate
typedef enum {
    FHEAUCTION_REDUCE_TREE = 0,    // balanced tree on a worker pool (default)
    FHEAUCTION_REDUCE_FOLD = 1,    // sequential left fold
    FHEAUCTION_REDUCE_BITWISE = 2  // MSB-first survivor elimination
} FheAuctionStrategy;

typedef enum {
    FHEAUCTION_STATE_COLLECTING = 0,
    FHEAUCTION_STATE_READY = 1,
    FHEAUCTION_STATE_EVALUATING = 2,
    FHEAUCTION_STATE_COMPLETE = 3,
    FHEAUCTION_STATE_FAILED = 4
} FheAuctionState;

typedef struct {
    uint64_t gates;          // homomorphic gates evaluated
    uint64_t constants;      // key-free constant bits inside the circuit
    uint64_t comparisons;    // greater-than evaluations
    uint64_t stages;         // sequential reduction stages
    uint64_t elapsed_us;     // evaluation wall time
} FheAuctionStats;

// =============================================================================
// Version and Errors
// =============================================================================

uint32_t fheauction_version(void);

FheAuctionError fheauction_last_error(void);
const char* fheauction_last_error_message(void);

// =============================================================================
// Backend Management
// =============================================================================

// Create a gate backend with the specified security level and method
FheAuctionBackend fheauction_backend_new(FheAuctionSecurityLevel level, FheAuctionMethod method);

void fheauction_backend_free(FheAuctionBackend backend);

// Generate secret and bootstrapping keys (required before any gate)
int fheauction_backend_keygen(FheAuctionBackend backend);

bool fheauction_backend_has_keys(FheAuctionBackend backend);

// =============================================================================
// Encryption / Decryption
// =============================================================================

FheAuctionCiphertext fheauction_encrypt_bit(FheAuctionBackend backend, int value);

// Returns 0 or 1, or a negative status code
int fheauction_decrypt_bit(FheAuctionBackend backend, FheAuctionCiphertext ct);

void fheauction_ciphertext_free(FheAuctionCiphertext ct);

// Encrypt value as a width-bit bid, MSB first (1 <= width <= 64)
FheAuctionBid fheauction_bid_encrypt(FheAuctionBackend backend, uint64_t value, uint32_t width);

int fheauction_bid_decrypt(FheAuctionBackend backend, FheAuctionBid bid, uint64_t* out);

uint32_t fheauction_bid_width(FheAuctionBid bid);

void fheauction_bid_free(FheAuctionBid bid);

// =============================================================================
// Auction
// =============================================================================

// The auction shares ownership of the backend; freeing the backend handle
// first is allowed.
FheAuction fheauction_auction_new(FheAuctionBackend backend, uint32_t bidders, uint32_t width,
                                  FheAuctionStrategy strategy);

void fheauction_auction_free(FheAuction auction);

// Submit the next bid; *index receives the bidder index (may be NULL)
int fheauction_auction_submit(FheAuction auction, FheAuctionBid bid, uint32_t* index);

int fheauction_auction_seal(FheAuction auction);

int fheauction_auction_evaluate(FheAuction auction);

FheAuctionState fheauction_auction_state(FheAuction auction);

// Result accessors (complete auctions only). Returned handles are owned by
// the caller.
FheAuctionBid fheauction_auction_winning_bid(FheAuction auction);
FheAuctionCiphertext fheauction_auction_ownership_bit(FheAuction auction, uint32_t bidder);

// Decrypt the result with the backend's secret key
int fheauction_auction_open(FheAuctionBackend backend, FheAuction auction,
                            uint64_t* amount, uint32_t* winner);

int fheauction_auction_stats(FheAuction auction, FheAuctionStats* out);

#ifdef __cplusplus
}
#endif

#endif // FHEAUCTION_BRIDGE_H
