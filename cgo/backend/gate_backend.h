// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Boolean gate capability consumed by the auction circuit
//
// The circuit never touches key material or ciphertext internals. It sees
// a backend that can produce constant bits and evaluate NOT/AND/OR/XOR/XNOR/MUX
// on opaque ciphertext handles, under one fixed parameter set. Evaluation
// needs only the evaluation key; encrypt and decrypt belong to the key holder.

#ifndef FHEAUCTION_GATE_BACKEND_H
#define FHEAUCTION_GATE_BACKEND_H

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>

namespace fheauction {
namespace backend {

// =============================================================================
// Parameter Set
// =============================================================================

// Security levels matching OpenFHE BINFHE_PARAMSET
enum class SecurityLevel {
    Toy = 0,            // testing only, no real security
    Std128 = 1,         // 128-bit security (CGGI/GINX)
    Std128AP = 2,       // 128-bit security (AP variant)
    Std128LMKCDEY = 3,  // 128-bit security (LMKCDEY)
    Std192 = 4,         // 192-bit security
    Std256 = 5          // 256-bit security
};

// Bootstrapping method
enum class BootstrapMethod {
    GINX = 0,
    AP = 1,
    LMKCDEY = 2
};

// Encryption parameter set negotiated outside the circuit. Passed by value
// into backend and circuit construction; there is no process-wide default.
struct GateParams {
    SecurityLevel level = SecurityLevel::Std128;
    BootstrapMethod method = BootstrapMethod::GINX;

    bool operator==(const GateParams& other) const {
        return level == other.level && method == other.method;
    }
    bool operator!=(const GateParams& other) const { return !(*this == other); }
};

// =============================================================================
// Gate Accounting
// =============================================================================

enum class GateKind : uint8_t {
    Encrypt = 0,
    Constant,
    Not,
    And,
    Or,
    Xor,
    Xnor,
    Mux,
};

constexpr size_t kGateKindCount = 8;

const char* gateName(GateKind kind);

// Snapshot of gate invocations by kind
struct GateStats {
    std::array<uint64_t, kGateKindCount> counts{};

    uint64_t count(GateKind kind) const { return counts[static_cast<size_t>(kind)]; }
    uint64_t& count(GateKind kind) { return counts[static_cast<size_t>(kind)]; }

    // All evaluated gates, fresh encryptions and constants excluded
    uint64_t gates() const;

    GateStats operator-(const GateStats& other) const;
    bool operator==(const GateStats& other) const { return counts == other.counts; }
    bool operator!=(const GateStats& other) const { return counts != other.counts; }
};

// =============================================================================
// Ciphertext Handle
// =============================================================================

// Opaque encrypted bit. The payload type belongs to the backend that
// produced it; copies share the same immutable payload.
class Ciphertext {
public:
    Ciphertext() = default;
    explicit Ciphertext(std::shared_ptr<const void> handle) : handle_(std::move(handle)) {}

    bool isValid() const { return handle_ != nullptr; }

    template <typename T>
    std::shared_ptr<const T> as() const {
        return std::static_pointer_cast<const T>(handle_);
    }

private:
    std::shared_ptr<const void> handle_;
};

// =============================================================================
// GateBackend
// =============================================================================

// All gate entry points are const and may be called concurrently from
// worker threads. Failures of the underlying library surface as
// fheauction::BackendError naming the gate.
class GateBackend {
public:
    explicit GateBackend(GateParams params);
    virtual ~GateBackend() = default;

    GateBackend(const GateBackend&) = delete;
    GateBackend& operator=(const GateBackend&) = delete;

    const GateParams& params() const { return params_; }

    // True once the evaluation (bootstrapping) key is available
    virtual bool hasEvaluationKey() const = 0;

    // Secret key holder only
    Ciphertext encrypt(bool bit) const;

    // Noiseless encryption of a public constant; needs no key
    Ciphertext constant(bool bit) const;

    // Decryption holder only; the circuit never calls this
    bool decrypt(const Ciphertext& ct) const;

    Ciphertext NOT(const Ciphertext& a) const;
    Ciphertext AND(const Ciphertext& a, const Ciphertext& b) const;
    Ciphertext OR(const Ciphertext& a, const Ciphertext& b) const;
    Ciphertext XOR(const Ciphertext& a, const Ciphertext& b) const;
    Ciphertext XNOR(const Ciphertext& a, const Ciphertext& b) const;

    // sel ? a : b
    Ciphertext MUX(const Ciphertext& sel, const Ciphertext& a, const Ciphertext& b) const;

    GateStats stats() const;
    void resetStats();

protected:
    virtual Ciphertext doEncrypt(bool bit) const = 0;
    virtual Ciphertext doConstant(bool bit) const = 0;
    virtual bool doDecrypt(const Ciphertext& ct) const = 0;
    virtual Ciphertext doNot(const Ciphertext& a) const = 0;

    // kind is one of And, Or, Xor, Xnor
    virtual Ciphertext doBinary(GateKind kind, const Ciphertext& a, const Ciphertext& b) const = 0;

    // Default: (sel AND a) OR ((NOT sel) AND b)
    virtual Ciphertext doMux(const Ciphertext& sel, const Ciphertext& a, const Ciphertext& b) const;

private:
    Ciphertext binary(GateKind kind, const Ciphertext& a, const Ciphertext& b) const;
    void record(GateKind kind) const;

    GateParams params_;
    mutable std::array<std::atomic<uint64_t>, kGateKindCount> counters_;
};

} // namespace backend
} // namespace fheauction

#endif // FHEAUCTION_GATE_BACKEND_H
