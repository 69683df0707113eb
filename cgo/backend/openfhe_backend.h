// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// GateBackend over OpenFHE BinFHE (TFHE/FHEW bootstrapped gates)

#ifndef FHEAUCTION_OPENFHE_BACKEND_H
#define FHEAUCTION_OPENFHE_BACKEND_H

#include "backend/gate_backend.h"

#include <memory>

namespace fheauction {
namespace backend {

class OpenFHEGateBackend : public GateBackend {
public:
    // Builds the BinFHE context for params. No keys exist yet.
    explicit OpenFHEGateBackend(GateParams params);
    ~OpenFHEGateBackend() override;

    // Generates the secret key and the bootstrapping/key switching keys.
    // Must run before any gate is evaluated.
    void generateKeys();

    // Leaves only the bootstrapping key, as held by the evaluating party.
    // encrypt() and decrypt() fail afterwards; constants and gates still work.
    void discardSecretKey();

    bool hasSecretKey() const;
    bool hasEvaluationKey() const override;

protected:
    Ciphertext doEncrypt(bool bit) const override;
    Ciphertext doConstant(bool bit) const override;
    bool doDecrypt(const Ciphertext& ct) const override;
    Ciphertext doNot(const Ciphertext& a) const override;
    Ciphertext doBinary(GateKind kind, const Ciphertext& a, const Ciphertext& b) const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace backend
} // namespace fheauction

#endif // FHEAUCTION_OPENFHE_BACKEND_H
