// ATTESTOR - Operation Status Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/core/status.h"

namespace attestor {

const char* StatusCodeToString(Status::Code code) {
    switch (code) {
        case Status::OK: return "OK";
        case Status::AUTHORIZATION_ERROR: return "AuthorizationError";
        case Status::NOT_FOUND: return "NotFoundError";
        case Status::VALIDATION_ERROR: return "ValidationError";
        case Status::REPLAY_ERROR: return "ReplayError";
        case Status::DUPLICATE_ERROR: return "DuplicateError";
        case Status::STATE_ERROR: return "StateError";
        case Status::TIMING_ERROR: return "TimingError";
        case Status::CONSENSUS_ERROR: return "ConsensusError";
        case Status::DISPUTED_ERROR: return "DisputedError";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::string result = StatusCodeToString(code_);
    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }
    return result;
}

} // namespace attestor
