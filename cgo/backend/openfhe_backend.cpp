// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// OpenFHE BinFHE implementation of the gate capability

#include "backend/openfhe_backend.h"

#include "errors.h"

#include <binfhecontext.h>

#include <string>

using namespace lbcrypto;

namespace fheauction {
namespace backend {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

BINFHE_PARAMSET mapSecurityLevel(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::Toy:           return TOY;
        case SecurityLevel::Std128:        return STD128;
        case SecurityLevel::Std128AP:      return STD128_AP;
        case SecurityLevel::Std128LMKCDEY: return STD128_LMKCDEY;
        case SecurityLevel::Std192:        return STD192;
        case SecurityLevel::Std256:        return STD256;
    }
    throw ConfigurationError("unknown security level");
}

BINFHE_METHOD mapMethod(BootstrapMethod method) {
    switch (method) {
        case BootstrapMethod::GINX:    return GINX;
        case BootstrapMethod::AP:      return AP;
        case BootstrapMethod::LMKCDEY: return LMKCDEY;
    }
    throw ConfigurationError("unknown bootstrapping method");
}

BINGATE mapGate(GateKind kind) {
    switch (kind) {
        case GateKind::And:  return AND;
        case GateKind::Or:   return OR;
        case GateKind::Xor:  return XOR;
        case GateKind::Xnor: return XNOR;
        default:
            break;
    }
    throw BackendError(std::string(gateName(kind)) + ": not a binary gate");
}

std::shared_ptr<const LWECiphertextImpl> unwrap(const Ciphertext& ct) {
    return ct.as<LWECiphertextImpl>();
}

Ciphertext wrap(LWECiphertext ct) {
    return Ciphertext(std::shared_ptr<const void>(std::move(ct)));
}

} // anonymous namespace

// =============================================================================
// Internal Context Wrapper
// =============================================================================

class OpenFHEGateBackend::Impl {
public:
    BinFHEContext context;
    LWEPrivateKey secretKey;
    bool hasSecretKey = false;
    bool hasBootstrapKey = false;

    explicit Impl(const GateParams& params) {
        auto paramset = mapSecurityLevel(params.level);
        auto method = mapMethod(params.method);
        try {
            context.GenerateBinFHEContext(paramset, method);
        } catch (const std::exception& e) {
            throw BackendError(std::string("context generation failed: ") + e.what());
        }
    }

    void requireSecretKey(const char* op) const {
        if (!hasSecretKey) {
            throw BackendError(std::string(op) + ": secret key not generated");
        }
    }

    void requireBootstrapKey(GateKind kind) const {
        if (!hasBootstrapKey) {
            throw BackendError(std::string(gateName(kind)) + ": bootstrapping key not generated");
        }
    }
};

OpenFHEGateBackend::OpenFHEGateBackend(GateParams params)
    : GateBackend(params), impl_(std::make_unique<Impl>(params)) {}

OpenFHEGateBackend::~OpenFHEGateBackend() = default;

void OpenFHEGateBackend::generateKeys() {
    try {
        impl_->secretKey = impl_->context.KeyGen();
        impl_->hasSecretKey = true;
        // BTKeyGen includes key switching
        impl_->context.BTKeyGen(impl_->secretKey);
        impl_->hasBootstrapKey = true;
    } catch (const std::exception& e) {
        throw BackendError(std::string("key generation failed: ") + e.what());
    }
}

void OpenFHEGateBackend::discardSecretKey() {
    impl_->secretKey = nullptr;
    impl_->hasSecretKey = false;
}

bool OpenFHEGateBackend::hasSecretKey() const {
    return impl_->hasSecretKey;
}

bool OpenFHEGateBackend::hasEvaluationKey() const {
    return impl_->hasBootstrapKey;
}

// =============================================================================
// Encryption / Decryption
// =============================================================================

Ciphertext OpenFHEGateBackend::doEncrypt(bool bit) const {
    impl_->requireSecretKey("ENCRYPT");
    return wrap(impl_->context.Encrypt(impl_->secretKey, bit ? 1 : 0));
}

Ciphertext OpenFHEGateBackend::doConstant(bool bit) const {
    return wrap(impl_->context.EvalConstant(bit));
}

bool OpenFHEGateBackend::doDecrypt(const Ciphertext& ct) const {
    impl_->requireSecretKey("DECRYPT");
    LWEPlaintext result;
    impl_->context.Decrypt(impl_->secretKey, unwrap(ct), &result);
    return result != 0;
}

// =============================================================================
// Boolean Gates (with bootstrapping)
// =============================================================================

Ciphertext OpenFHEGateBackend::doNot(const Ciphertext& a) const {
    return wrap(impl_->context.EvalNOT(unwrap(a)));
}

Ciphertext OpenFHEGateBackend::doBinary(GateKind kind, const Ciphertext& a, const Ciphertext& b) const {
    impl_->requireBootstrapKey(kind);
    return wrap(impl_->context.EvalBinGate(mapGate(kind), unwrap(a), unwrap(b)));
}

} // namespace backend
} // namespace fheauction
