// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "circuit/client.h"

#include "errors.h"

#include <string>

namespace fheauction {
namespace circuit {

EncryptedInt encryptBid(const backend::GateBackend& backend, uint64_t value, uint32_t width) {
    if (width == 0 || width > kMaxPlainWidth) {
        throw ConfigurationError("bid width must be in [1, 64], got " + std::to_string(width));
    }
    if (width < kMaxPlainWidth && (value >> width) != 0) {
        throw ConfigurationError("bid " + std::to_string(value) + " does not fit in " +
                                 std::to_string(width) + " bits");
    }

    std::vector<Ciphertext> bits;
    bits.reserve(width);
    for (uint32_t i = 0; i < width; ++i) {
        const bool bit = (value >> (width - 1 - i)) & 1;
        bits.push_back(backend.encrypt(bit));
    }
    return EncryptedInt(std::move(bits), width);
}

uint64_t decryptBid(const backend::GateBackend& backend, const EncryptedInt& bid) {
    if (bid.width() > kMaxPlainWidth) {
        throw ConfigurationError("cannot decrypt " + std::to_string(bid.width()) + "-bit bid into 64 bits");
    }

    uint64_t result = 0;
    for (uint32_t i = 0; i < bid.width(); ++i) {
        result = (result << 1) | (backend.decrypt(bid.bit(i)) ? 1u : 0u);
    }
    return result;
}

std::vector<bool> decryptMask(const backend::GateBackend& backend, const OwnershipMask& mask) {
    std::vector<bool> plain;
    plain.reserve(mask.size());
    for (const auto& ct : mask) {
        plain.push_back(backend.decrypt(ct));
    }
    return plain;
}

uint32_t winnerIndex(const std::vector<bool>& mask) {
    uint32_t winner = 0;
    size_t set = 0;
    for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) {
            winner = static_cast<uint32_t>(i);
            ++set;
        }
    }
    if (set != 1) {
        throw BackendError("ownership mask is not one-hot: " + std::to_string(set) + " entries set");
    }
    return winner;
}

AuctionOutcome openResult(const backend::GateBackend& backend, const AuctionResult& result) {
    AuctionOutcome outcome;
    outcome.winner = winnerIndex(decryptMask(backend, result.ownership));
    outcome.amount = decryptBid(backend, result.winningBid);
    return outcome;
}

} // namespace circuit
} // namespace fheauction
