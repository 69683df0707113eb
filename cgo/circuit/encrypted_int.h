// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Fixed-width encrypted unsigned integers and the auction result bundles

#ifndef FHEAUCTION_ENCRYPTED_INT_H
#define FHEAUCTION_ENCRYPTED_INT_H

#include "backend/gate_backend.h"

#include <cstdint>
#include <vector>

namespace fheauction {
namespace circuit {

using backend::Ciphertext;

// =============================================================================
// EncryptedInt - Vector of encrypted bits (MSB at index 0)
// =============================================================================

class EncryptedInt {
public:
    EncryptedInt() = default;

    // Throws ConfigurationError unless bits.size() == width and width > 0
    EncryptedInt(std::vector<Ciphertext> bits, uint32_t width);

    uint32_t width() const { return static_cast<uint32_t>(bits_.size()); }
    bool empty() const { return bits_.empty(); }

    // i = 0 is the most significant bit
    const Ciphertext& bit(uint32_t i) const;
    const std::vector<Ciphertext>& bits() const { return bits_; }

    // Every bit carries a backend handle
    bool isWellFormed() const;

private:
    std::vector<Ciphertext> bits_;
};

// One bidder's sealed bid. bidder is the submission index and doubles as
// the tie-break priority (lower wins).
struct Bid {
    EncryptedInt value;
    uint32_t bidder = 0;
};

// Encrypted one-hot vector over bidders
using OwnershipMask = std::vector<Ciphertext>;

struct AuctionResult {
    EncryptedInt winningBid;
    OwnershipMask ownership;
};

} // namespace circuit
} // namespace fheauction

#endif // FHEAUCTION_ENCRYPTED_INT_H
