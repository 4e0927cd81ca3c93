#include "errors.hpp"

namespace fa {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidAmount:
        return "InvalidAmount";
    case ErrorKind::AmountOutOfBounds:
        return "AmountOutOfBounds";
    case ErrorKind::InvalidOutcome:
        return "InvalidOutcome";
    case ErrorKind::InvalidMarketDefinition:
        return "InvalidMarketDefinition";
    case ErrorKind::InvalidVote:
        return "InvalidVote";
    case ErrorKind::MarketNotFound:
        return "MarketNotFound";
    case ErrorKind::MarketNotActive:
        return "MarketNotActive";
    case ErrorKind::MarketEnded:
        return "MarketEnded";
    case ErrorKind::MarketNotEnded:
        return "MarketNotEnded";
    case ErrorKind::MarketHalted:
        return "MarketHalted";
    case ErrorKind::MarketFinalized:
        return "MarketFinalized";
    case ErrorKind::InsufficientVotes:
        return "InsufficientVotes";
    case ErrorKind::MarketBusy:
        return "MarketBusy";
    case ErrorKind::OracleUnavailable:
        return "OracleUnavailable";
    case ErrorKind::ResolutionTied:
        return "ResolutionTied";
    }
    return "Unknown";
}

const char* toString(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Validation:
        return "ValidationError";
    case ErrorCategory::StateConflict:
        return "StateConflictError";
    case ErrorCategory::ResourceBusy:
        return "ResourceBusyError";
    case ErrorCategory::ResolutionTied:
        return "ResolutionTied";
    }
    return "Unknown";
}

ErrorCategory categoryOf(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidAmount:
    case ErrorKind::AmountOutOfBounds:
    case ErrorKind::InvalidOutcome:
    case ErrorKind::InvalidMarketDefinition:
    case ErrorKind::InvalidVote:
        return ErrorCategory::Validation;
    case ErrorKind::MarketNotFound:
    case ErrorKind::MarketNotActive:
    case ErrorKind::MarketEnded:
    case ErrorKind::MarketNotEnded:
    case ErrorKind::MarketHalted:
    case ErrorKind::MarketFinalized:
    case ErrorKind::InsufficientVotes:
        return ErrorCategory::StateConflict;
    case ErrorKind::MarketBusy:
    case ErrorKind::OracleUnavailable:
        return ErrorCategory::ResourceBusy;
    case ErrorKind::ResolutionTied:
        return ErrorCategory::ResolutionTied;
    }
    return ErrorCategory::Validation;
}

bool isRetryable(ErrorKind kind) {
    return categoryOf(kind) == ErrorCategory::ResourceBusy;
}

std::string EngineError::describe() const {
    std::string out = std::string(toString(category())) + "/" + toString(kind);
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

} // namespace fa
