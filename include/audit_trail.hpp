#pragma once

#include "transcript_log.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace fa {

enum class AuditKind : std::uint8_t {
    MarketCreated = 1,
    TradeExecuted = 2,
    StatusChanged = 3,
    Settled = 4,
    InvariantViolation = 5
};

struct AuditRecord {
    AuditKind kind = AuditKind::TradeExecuted;
    std::uint64_t timestampMs = 0;
    std::uint64_t sequence = 0;
    std::int64_t amountRaw = 0;
    std::int64_t sharesRaw = 0;
    std::int64_t feeRaw = 0;
    std::string marketId;
    std::string actor;
    std::string outcome;
    std::string status;
    std::string liabilityRoot;
    std::string detail;
};

// Canonical little-endian layout:
// | kind u8 | timestampMs u64 | sequence u64 | amount i64 | shares i64 | fee i64 |
// | len-prefixed strings: marketId, actor, outcome, status, liabilityRoot, detail |
std::string encodeAuditRecord(const AuditRecord& record);
bool decodeAuditRecord(const std::string& wire, AuditRecord& out);

// Thread-safe front of the transcript shared by every engine component.
class AuditTrail {
public:
    void record(const AuditRecord& record);

    std::string root() const;
    std::size_t size() const;
    std::vector<std::string> leaves() const;
    std::vector<std::string> proof(std::size_t index) const;

private:
    mutable std::mutex mutex_;
    TranscriptLog log_;
};

} // namespace fa
