// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Bidder and decryption-holder helpers. Nothing in the circuit calls these.

#ifndef FHEAUCTION_CLIENT_H
#define FHEAUCTION_CLIENT_H

#include "backend/gate_backend.h"
#include "circuit/encrypted_int.h"

#include <cstdint>
#include <vector>

namespace fheauction {
namespace circuit {

constexpr uint32_t kMaxPlainWidth = 64;

// Encrypts value as width bits, MSB first. Throws ConfigurationError if
// width is 0 or above 64, or value does not fit in width bits.
EncryptedInt encryptBid(const backend::GateBackend& backend, uint64_t value, uint32_t width);

uint64_t decryptBid(const backend::GateBackend& backend, const EncryptedInt& bid);

std::vector<bool> decryptMask(const backend::GateBackend& backend, const OwnershipMask& mask);

// Position of the single set entry. A mask that is not one-hot means the
// result was corrupted in evaluation; throws BackendError.
uint32_t winnerIndex(const std::vector<bool>& mask);

struct AuctionOutcome {
    uint32_t winner = 0;
    uint64_t amount = 0;
};

AuctionOutcome openResult(const backend::GateBackend& backend, const AuctionResult& result);

} // namespace circuit
} // namespace fheauction

#endif // FHEAUCTION_CLIENT_H
