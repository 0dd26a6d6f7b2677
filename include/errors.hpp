#pragma once

#include <stdexcept>
#include <string>

namespace pricemesh
{

    // Outcome of a single store write. Everything except Accepted is a local,
    // non-fatal rejection; the caller keeps running with the data it has.
    enum class WriteStatus
    {
        Accepted,
        NonFinitePrice,
        StaleTimestamp,
        ConflictLost,
        InvalidKey,
        CapacityExceeded
    };

    inline const char *toString(WriteStatus status)
    {
        switch (status)
        {
        case WriteStatus::Accepted:
            return "accepted";
        case WriteStatus::NonFinitePrice:
            return "non_finite_price";
        case WriteStatus::StaleTimestamp:
            return "stale_timestamp";
        case WriteStatus::ConflictLost:
            return "conflict_lost";
        case WriteStatus::InvalidKey:
            return "invalid_key";
        case WriteStatus::CapacityExceeded:
            return "capacity_exceeded";
        }
        return "unknown";
    }

    // Malformed wire data. Always recoverable by dropping the message.
    class DecodeError : public std::runtime_error
    {
    public:
        explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
    };

    // Missing or invalid message signature.
    class AuthError : public std::runtime_error
    {
    public:
        explicit AuthError(const std::string &what) : std::runtime_error(what) {}
    };

    class CapacityExceeded : public std::runtime_error
    {
    public:
        explicit CapacityExceeded(const std::string &what) : std::runtime_error(what) {}
    };

    // A broken internal assumption (seqlock retry bound, index collision).
    // Treat as a bug report, not as routine input handling.
    class InvariantViolation : public std::logic_error
    {
    public:
        explicit InvariantViolation(const std::string &what) : std::logic_error(what) {}
    };

} // namespace pricemesh
