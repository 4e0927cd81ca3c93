#include "records.hpp"

namespace fa {

const char* toString(PositionStatus status) {
    switch (status) {
    case PositionStatus::Open:
        return "open";
    case PositionStatus::Settled:
        return "settled";
    case PositionStatus::Voided:
        return "voided";
    }
    return "unknown";
}

const char* toString(ResolutionMethod method) {
    switch (method) {
    case ResolutionMethod::AdminDecision:
        return "admin";
    case ResolutionMethod::VoteConsensus:
        return "consensus";
    case ResolutionMethod::Oracle:
        return "oracle";
    case ResolutionMethod::AutoRefund:
        return "automatic";
    }
    return "unknown";
}

const char* toString(PayoutKind kind) {
    return kind == PayoutKind::Refund ? "refund" : "winning";
}

} // namespace fa
