// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Oblivious comparison of encrypted unsigned integers
//
// Bit-slice comparison from MSB to LSB with an equality prefix:
// - Gate sequence depends only on the operand width
// - Serial eq_prefix chain of length k (critical path of one comparison)

#ifndef FHEAUCTION_COMPARATOR_H
#define FHEAUCTION_COMPARATOR_H

#include "backend/gate_backend.h"
#include "circuit/encrypted_int.h"

namespace fheauction {
namespace circuit {

class Comparator {
public:
    explicit Comparator(const backend::GateBackend& backend) : backend_(backend) {}

    // Encrypted a > b. Throws ConfigurationError on width mismatch.
    Ciphertext greater(const EncryptedInt& a, const EncryptedInt& b) const;

    // Oblivious selection: cond ? a : b, one MUX per bit
    EncryptedInt select(const Ciphertext& cond, const EncryptedInt& a, const EncryptedInt& b) const;

    // Exact gate profile of one greater() call for the given width
    static backend::GateStats greaterCost(uint32_t width);

private:
    const backend::GateBackend& backend_;
};

} // namespace circuit
} // namespace fheauction

#endif // FHEAUCTION_COMPARATOR_H
