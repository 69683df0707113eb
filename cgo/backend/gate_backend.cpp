// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Gate dispatch, handle checks and accounting shared by every backend

#include "backend/gate_backend.h"

#include "errors.h"

#include <exception>
#include <string>

namespace fheauction {
namespace backend {

const char* gateName(GateKind kind) {
    switch (kind) {
        case GateKind::Encrypt:  return "ENCRYPT";
        case GateKind::Constant: return "CONSTANT";
        case GateKind::Not:      return "NOT";
        case GateKind::And:      return "AND";
        case GateKind::Or:       return "OR";
        case GateKind::Xor:      return "XOR";
        case GateKind::Xnor:     return "XNOR";
        case GateKind::Mux:      return "MUX";
    }
    return "UNKNOWN";
}

uint64_t GateStats::gates() const {
    uint64_t total = 0;
    for (size_t i = 0; i < kGateKindCount; ++i) {
        if (i != static_cast<size_t>(GateKind::Encrypt) && i != static_cast<size_t>(GateKind::Constant)) {
            total += counts[i];
        }
    }
    return total;
}

GateStats GateStats::operator-(const GateStats& other) const {
    GateStats diff;
    for (size_t i = 0; i < kGateKindCount; ++i) {
        diff.counts[i] = counts[i] - other.counts[i];
    }
    return diff;
}

namespace {

void requireHandle(GateKind kind, const Ciphertext& ct) {
    if (!ct.isValid()) {
        throw BackendError(std::string(gateName(kind)) + ": invalid ciphertext handle");
    }
}

// Runs one backend call, rewrapping library failures so callers only ever
// see BackendError out of a gate.
template <typename Fn>
auto evaluate(GateKind kind, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const BackendError&) {
        throw;
    } catch (const std::exception& e) {
        throw BackendError(std::string(gateName(kind)) + ": " + e.what());
    }
}

} // anonymous namespace

GateBackend::GateBackend(GateParams params) : params_(params) {
    for (auto& counter : counters_) {
        counter.store(0, std::memory_order_relaxed);
    }
}

Ciphertext GateBackend::encrypt(bool bit) const {
    auto ct = evaluate(GateKind::Encrypt, [&] { return doEncrypt(bit); });
    requireHandle(GateKind::Encrypt, ct);
    record(GateKind::Encrypt);
    return ct;
}

Ciphertext GateBackend::constant(bool bit) const {
    auto ct = evaluate(GateKind::Constant, [&] { return doConstant(bit); });
    requireHandle(GateKind::Constant, ct);
    record(GateKind::Constant);
    return ct;
}

bool GateBackend::decrypt(const Ciphertext& ct) const {
    if (!ct.isValid()) {
        throw BackendError("DECRYPT: invalid ciphertext handle");
    }
    try {
        return doDecrypt(ct);
    } catch (const BackendError&) {
        throw;
    } catch (const std::exception& e) {
        throw BackendError(std::string("DECRYPT: ") + e.what());
    }
}

Ciphertext GateBackend::NOT(const Ciphertext& a) const {
    requireHandle(GateKind::Not, a);
    auto ct = evaluate(GateKind::Not, [&] { return doNot(a); });
    requireHandle(GateKind::Not, ct);
    record(GateKind::Not);
    return ct;
}

Ciphertext GateBackend::AND(const Ciphertext& a, const Ciphertext& b) const {
    return binary(GateKind::And, a, b);
}

Ciphertext GateBackend::OR(const Ciphertext& a, const Ciphertext& b) const {
    return binary(GateKind::Or, a, b);
}

Ciphertext GateBackend::XOR(const Ciphertext& a, const Ciphertext& b) const {
    return binary(GateKind::Xor, a, b);
}

Ciphertext GateBackend::XNOR(const Ciphertext& a, const Ciphertext& b) const {
    return binary(GateKind::Xnor, a, b);
}

Ciphertext GateBackend::MUX(const Ciphertext& sel, const Ciphertext& a, const Ciphertext& b) const {
    requireHandle(GateKind::Mux, sel);
    requireHandle(GateKind::Mux, a);
    requireHandle(GateKind::Mux, b);
    auto ct = evaluate(GateKind::Mux, [&] { return doMux(sel, a, b); });
    requireHandle(GateKind::Mux, ct);
    record(GateKind::Mux);
    return ct;
}

GateStats GateBackend::stats() const {
    GateStats snapshot;
    for (size_t i = 0; i < kGateKindCount; ++i) {
        snapshot.counts[i] = counters_[i].load(std::memory_order_relaxed);
    }
    return snapshot;
}

void GateBackend::resetStats() {
    for (auto& counter : counters_) {
        counter.store(0, std::memory_order_relaxed);
    }
}

Ciphertext GateBackend::doMux(const Ciphertext& sel, const Ciphertext& a, const Ciphertext& b) const {
    auto notSel = doNot(sel);
    auto branch1 = doBinary(GateKind::And, sel, a);
    auto branch2 = doBinary(GateKind::And, notSel, b);
    return doBinary(GateKind::Or, branch1, branch2);
}

Ciphertext GateBackend::binary(GateKind kind, const Ciphertext& a, const Ciphertext& b) const {
    requireHandle(kind, a);
    requireHandle(kind, b);
    auto ct = evaluate(kind, [&] { return doBinary(kind, a, b); });
    requireHandle(kind, ct);
    record(kind);
    return ct;
}

void GateBackend::record(GateKind kind) const {
    counters_[static_cast<size_t>(kind)].fetch_add(1, std::memory_order_relaxed);
}

} // namespace backend
} // namespace fheauction
