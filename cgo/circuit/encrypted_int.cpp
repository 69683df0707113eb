// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "circuit/encrypted_int.h"

#include "errors.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace fheauction {
namespace circuit {

EncryptedInt::EncryptedInt(std::vector<Ciphertext> bits, uint32_t width)
    : bits_(std::move(bits)) {
    if (width == 0) {
        throw ConfigurationError("bid width must be positive");
    }
    if (bits_.size() != width) {
        throw ConfigurationError("bid width mismatch: expected " + std::to_string(width) +
                                 " bits, got " + std::to_string(bits_.size()));
    }
}

const Ciphertext& EncryptedInt::bit(uint32_t i) const {
    if (i >= bits_.size()) {
        throw std::out_of_range("bit index " + std::to_string(i) + " out of range for width " +
                                std::to_string(bits_.size()));
    }
    return bits_[i];
}

bool EncryptedInt::isWellFormed() const {
    return !bits_.empty() &&
           std::all_of(bits_.begin(), bits_.end(), [](const Ciphertext& ct) { return ct.isValid(); });
}

} // namespace circuit
} // namespace fheauction
