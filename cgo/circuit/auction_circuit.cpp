// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "circuit/auction_circuit.h"

#include "errors.h"

#include <string>

namespace fheauction {
namespace circuit {

const char* stateName(AuctionCircuit::State state) {
    switch (state) {
        case AuctionCircuit::State::Collecting: return "Collecting";
        case AuctionCircuit::State::Ready:      return "Ready";
        case AuctionCircuit::State::Evaluating: return "Evaluating";
        case AuctionCircuit::State::Complete:   return "Complete";
        case AuctionCircuit::State::Failed:     return "Failed";
    }
    return "Unknown";
}

AuctionCircuit::AuctionCircuit(AuctionConfig config, Reducer::Options reducer)
    : config_(std::move(config)), reducerOptions_(reducer) {
    if (config_.bidders == 0) {
        throw ConfigurationError("bidder count must be positive");
    }
    if (config_.bidWidth == 0) {
        throw ConfigurationError("bid width must be positive");
    }
    if (!config_.backend) {
        throw ConfigurationError("gate backend required");
    }
    if (config_.backend->params() != config_.params) {
        throw ConfigurationError("gate backend was built for a different parameter set");
    }
    if (!config_.backend->hasEvaluationKey()) {
        throw ConfigurationError("gate backend has no evaluation key");
    }
    bids_.reserve(config_.bidders);
}

void AuctionCircuit::requireState(State expected, const char* op) const {
    if (state_ != expected) {
        throw ConfigurationError(std::string(op) + " requires state " + stateName(expected) +
                                 ", circuit is " + stateName(state_));
    }
}

uint32_t AuctionCircuit::submit(EncryptedInt value) {
    requireState(State::Collecting, "submit");
    if (bids_.size() >= config_.bidders) {
        throw ConfigurationError("auction already holds " + std::to_string(config_.bidders) + " bids");
    }
    if (value.width() != config_.bidWidth) {
        throw ConfigurationError("bid width mismatch: expected " + std::to_string(config_.bidWidth) +
                                 " bits, got " + std::to_string(value.width()));
    }
    if (!value.isWellFormed()) {
        throw ConfigurationError("bid has missing ciphertext bits");
    }

    const auto index = static_cast<uint32_t>(bids_.size());
    bids_.push_back(Bid{std::move(value), index});
    return index;
}

void AuctionCircuit::seal() {
    requireState(State::Collecting, "seal");
    if (bids_.size() != config_.bidders) {
        throw ConfigurationError("expected " + std::to_string(config_.bidders) + " bids, have " +
                                 std::to_string(bids_.size()));
    }
    state_ = State::Ready;
}

const AuctionResult& AuctionCircuit::evaluate() {
    requireState(State::Ready, "evaluate");
    state_ = State::Evaluating;

    const auto& backend = *config_.backend;
    const auto gatesBefore = backend.stats();
    const auto start = std::chrono::steady_clock::now();

    try {
        Reducer reducer(backend, reducerOptions_);
        auto result = reducer.reduce(bids_);

        stats_.comparisons = reducer.comparisons();
        stats_.stages = reducer.stages();
        result_ = std::make_unique<AuctionResult>(std::move(result));
    } catch (...) {
        state_ = State::Failed;
        throw;
    }

    stats_.gates = backend.stats() - gatesBefore;
    stats_.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    state_ = State::Complete;
    return *result_;
}

const AuctionResult& AuctionCircuit::result() const {
    requireState(State::Complete, "result");
    return *result_;
}

} // namespace circuit
} // namespace fheauction
