#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace fa {

enum class ErrorKind {
    InvalidAmount,
    AmountOutOfBounds,
    InvalidOutcome,
    InvalidMarketDefinition,
    InvalidVote,
    MarketNotFound,
    MarketNotActive,
    MarketEnded,
    MarketNotEnded,
    MarketHalted,
    MarketFinalized,
    InsufficientVotes,
    MarketBusy,
    OracleUnavailable,
    ResolutionTied
};

enum class ErrorCategory { Validation, StateConflict, ResourceBusy, ResolutionTied };

const char* toString(ErrorKind kind);
const char* toString(ErrorCategory category);
ErrorCategory categoryOf(ErrorKind kind);
bool isRetryable(ErrorKind kind);

struct EngineError {
    ErrorKind kind;
    std::string message;

    ErrorCategory category() const { return categoryOf(kind); }
    std::string describe() const;
};

// Value-or-error return for every expected failure. Callers must inspect ok() before value().
template <typename T>
class Result {
public:
    static Result success(T value) { return Result(std::move(value)); }
    static Result failure(ErrorKind kind, std::string message) {
        return Result(EngineError{ kind, std::move(message) });
    }
    static Result failure(EngineError error) { return Result(std::move(error)); }

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("Result::value() on failure: " + error().describe());
        }
        return std::get<T>(state_);
    }
    T& value() {
        if (!ok()) {
            throw std::logic_error("Result::value() on failure: " + error().describe());
        }
        return std::get<T>(state_);
    }

    const EngineError& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() on success");
        }
        return std::get<EngineError>(state_);
    }

    ErrorKind kind() const { return error().kind; }

private:
    explicit Result(T value) : state_(std::move(value)) {}
    explicit Result(EngineError error) : state_(std::move(error)) {}

    std::variant<T, EngineError> state_;
};

// Pool reserves drifted outside rounding tolerance. Never returned as a Result: the in-flight
// operation is aborted and the market is halted for manual remediation.
class InvariantViolationError : public std::logic_error {
public:
    InvariantViolationError(std::string marketId, std::string outcome, const std::string& detail)
        : std::logic_error("invariant violation on market " + marketId + " outcome " + outcome +
                           ": " + detail),
          marketId_(std::move(marketId)),
          outcome_(std::move(outcome)) {}

    const std::string& marketId() const { return marketId_; }
    const std::string& outcome() const { return outcome_; }

private:
    std::string marketId_;
    std::string outcome_;
};

} // namespace fa
