// ATTESTOR - Operation Status
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Every protocol operation reports its outcome as a Status. A non-OK status
// guarantees that the operation changed nothing.

#ifndef ATTESTOR_CORE_STATUS_H
#define ATTESTOR_CORE_STATUS_H

#include <string>

namespace attestor {

class Status {
public:
    enum Code {
        OK = 0,
        AUTHORIZATION_ERROR = 1,   // caller lacks the required role
        NOT_FOUND = 2,             // unknown account, record or dispute
        VALIDATION_ERROR = 3,      // malformed or inconsistent input
        REPLAY_ERROR = 4,          // proof or commitment already used
        DUPLICATE_ERROR = 5,       // caller already acted on this item
        STATE_ERROR = 6,           // item is in the wrong lifecycle state
        TIMING_ERROR = 7,          // deadline not reached or already passed
        CONSENSUS_ERROR = 8,       // not enough distinct confirmations
        DISPUTED_ERROR = 9,        // finalization blocked by a dispute
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Authorization(const std::string& msg = "") { return Status(AUTHORIZATION_ERROR, msg); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Validation(const std::string& msg = "") { return Status(VALIDATION_ERROR, msg); }
    static Status Replay(const std::string& msg = "") { return Status(REPLAY_ERROR, msg); }
    static Status Duplicate(const std::string& msg = "") { return Status(DUPLICATE_ERROR, msg); }
    static Status State(const std::string& msg = "") { return Status(STATE_ERROR, msg); }
    static Status Timing(const std::string& msg = "") { return Status(TIMING_ERROR, msg); }
    static Status Consensus(const std::string& msg = "") { return Status(CONSENSUS_ERROR, msg); }
    static Status Disputed(const std::string& msg = "") { return Status(DISPUTED_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsAuthorization() const { return code_ == AUTHORIZATION_ERROR; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsValidation() const { return code_ == VALIDATION_ERROR; }
    bool IsReplay() const { return code_ == REPLAY_ERROR; }
    bool IsDuplicate() const { return code_ == DUPLICATE_ERROR; }
    bool IsState() const { return code_ == STATE_ERROR; }
    bool IsTiming() const { return code_ == TIMING_ERROR; }
    bool IsConsensus() const { return code_ == CONSENSUS_ERROR; }
    bool IsDisputed() const { return code_ == DISPUTED_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "Name: message", or "OK"
    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

/// Short name of a status code (e.g. "ReplayError")
const char* StatusCodeToString(Status::Code code);

} // namespace attestor

#endif // ATTESTOR_CORE_STATUS_H
