// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Error types shared by the auction circuit and its gate backends

#ifndef FHEAUCTION_ERRORS_H
#define FHEAUCTION_ERRORS_H

#include <stdexcept>
#include <string>

namespace fheauction {

// Raised for malformed auctions: width or count mismatches, zero sizes,
// calls made in the wrong circuit state. Always thrown before any gate
// has been evaluated for the call that raised it.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Raised when the cryptographic backend fails to evaluate a gate.
// Intermediate ciphertexts of the failed pass must be discarded.
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace fheauction

#endif // FHEAUCTION_ERRORS_H
