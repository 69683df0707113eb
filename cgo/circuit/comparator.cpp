// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Bit-slice greater-than over homomorphic gates

#include "circuit/comparator.h"

#include "errors.h"

#include <string>
#include <vector>

namespace fheauction {
namespace circuit {

using backend::GateKind;
using backend::GateStats;

namespace {

void requireSameWidth(const EncryptedInt& a, const EncryptedInt& b) {
    if (a.empty() || b.empty()) {
        throw ConfigurationError("cannot compare empty encrypted integers");
    }
    if (a.width() != b.width()) {
        throw ConfigurationError("bit width mismatch: " + std::to_string(a.width()) + " vs " +
                                 std::to_string(b.width()));
    }
}

} // anonymous namespace

/*
 * Serial Prefix Comparison
 *
 * For a > b with k-bit integers, scanning from the MSB:
 *
 *   eq_prefix = 1, result = 0
 *   for i in 0..k-1:
 *     gt_i      = a[i] AND (NOT b[i])      // a wins at position i
 *     win_i     = gt_i AND eq_prefix       // ... and all higher bits tied
 *     result    = result OR win_i
 *     eq_prefix = eq_prefix AND (a[i] XNOR b[i])
 *
 * eq_prefix is advanced only after win_i has consumed it. Every gate runs for
 * every position, even after the result is settled.
 */
Ciphertext Comparator::greater(const EncryptedInt& a, const EncryptedInt& b) const {
    requireSameWidth(a, b);

    Ciphertext eqPrefix = backend_.constant(true);
    Ciphertext result = backend_.constant(false);

    for (uint32_t i = 0; i < a.width(); ++i) {
        const Ciphertext& ai = a.bit(i);
        const Ciphertext& bi = b.bit(i);

        auto notB = backend_.NOT(bi);
        auto gt = backend_.AND(ai, notB);
        auto win = backend_.AND(gt, eqPrefix);
        result = backend_.OR(result, win);

        auto same = backend_.XNOR(ai, bi);
        eqPrefix = backend_.AND(eqPrefix, same);
    }

    return result;
}

EncryptedInt Comparator::select(const Ciphertext& cond, const EncryptedInt& a, const EncryptedInt& b) const {
    requireSameWidth(a, b);

    const uint32_t n = a.width();
    std::vector<Ciphertext> resultBits;
    resultBits.reserve(n);

    for (uint32_t i = 0; i < n; ++i) {
        resultBits.push_back(backend_.MUX(cond, a.bit(i), b.bit(i)));
    }

    return EncryptedInt(std::move(resultBits), n);
}

GateStats Comparator::greaterCost(uint32_t width) {
    GateStats cost;
    cost.count(GateKind::Constant) = 2;
    cost.count(GateKind::Not) = width;
    cost.count(GateKind::And) = 3ull * width;
    cost.count(GateKind::Or) = width;
    cost.count(GateKind::Xnor) = width;
    return cost;
}

} // namespace circuit
} // namespace fheauction
