#include "audit_trail.hpp"

#include <utility>

namespace fa {

namespace {

void writeU64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeString(std::string& out, const std::string& s) {
    writeU64(out, static_cast<std::uint64_t>(s.size()));
    out.append(s);
}

bool readU64(const std::string& in, std::size_t& pos, std::uint64_t& v) {
    if (in.size() < pos + 8) {
        return false;
    }
    v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<std::uint64_t>(static_cast<unsigned char>(in[pos + i])) << (8 * i);
    }
    pos += 8;
    return true;
}

bool readString(const std::string& in, std::size_t& pos, std::string& s) {
    std::uint64_t len = 0;
    if (!readU64(in, pos, len) || in.size() - pos < len) {
        return false;
    }
    s = in.substr(pos, static_cast<std::size_t>(len));
    pos += static_cast<std::size_t>(len);
    return true;
}

} // namespace

std::string encodeAuditRecord(const AuditRecord& record) {
    std::string out;
    out.reserve(128);
    out.push_back(static_cast<char>(record.kind));
    writeU64(out, record.timestampMs);
    writeU64(out, record.sequence);
    writeU64(out, static_cast<std::uint64_t>(record.amountRaw));
    writeU64(out, static_cast<std::uint64_t>(record.sharesRaw));
    writeU64(out, static_cast<std::uint64_t>(record.feeRaw));
    writeString(out, record.marketId);
    writeString(out, record.actor);
    writeString(out, record.outcome);
    writeString(out, record.status);
    writeString(out, record.liabilityRoot);
    writeString(out, record.detail);
    return out;
}

bool decodeAuditRecord(const std::string& wire, AuditRecord& out) {
    if (wire.empty()) {
        return false;
    }
    std::size_t pos = 0;
    auto kind = static_cast<std::uint8_t>(wire[pos++]);
    if (kind < static_cast<std::uint8_t>(AuditKind::MarketCreated) ||
        kind > static_cast<std::uint8_t>(AuditKind::InvariantViolation)) {
        return false;
    }
    AuditRecord record;
    record.kind = static_cast<AuditKind>(kind);
    std::uint64_t amount = 0;
    std::uint64_t shares = 0;
    std::uint64_t fee = 0;
    if (!readU64(wire, pos, record.timestampMs) || !readU64(wire, pos, record.sequence) ||
        !readU64(wire, pos, amount) || !readU64(wire, pos, shares) || !readU64(wire, pos, fee)) {
        return false;
    }
    record.amountRaw = static_cast<std::int64_t>(amount);
    record.sharesRaw = static_cast<std::int64_t>(shares);
    record.feeRaw = static_cast<std::int64_t>(fee);
    if (!readString(wire, pos, record.marketId) || !readString(wire, pos, record.actor) ||
        !readString(wire, pos, record.outcome) || !readString(wire, pos, record.status) ||
        !readString(wire, pos, record.liabilityRoot) || !readString(wire, pos, record.detail)) {
        return false;
    }
    if (pos != wire.size()) {
        return false;
    }
    out = std::move(record);
    return true;
}

void AuditTrail::record(const AuditRecord& record) {
    std::string wire = encodeAuditRecord(record);
    std::lock_guard<std::mutex> lock(mutex_);
    log_.append(wire);
}

std::string AuditTrail::root() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.merkleRoot();
}

std::size_t AuditTrail::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

std::vector<std::string> AuditTrail::leaves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.getLeaves();
}

std::vector<std::string> AuditTrail::proof(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.merkleProof(index);
}

} // namespace fa
