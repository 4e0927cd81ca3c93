#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fa {

std::string sha256Hex(const std::string& data);

// Append-only audit transcript. Each event is stored as its SHA-256 leaf; the Merkle root commits
// to the whole history and inclusion proofs let a third party check a single record.
// Every tree level is kept, so an append rehashes one leaf-to-root path and the root and proofs
// are read without rehashing.
class TranscriptLog {
public:
    TranscriptLog();

    void append(const std::string& event);
    const std::vector<std::string>& getLeaves() const { return levels_.front(); }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leaf,
                            std::size_t leafIndex,
                            std::size_t leafCount,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    std::size_t size() const { return levels_.front().size(); }

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    // levels_[0] holds the leaves, levels_.back() the root. An odd node at the end of a level is
    // paired with itself.
    std::vector<std::vector<std::string>> levels_;
};

} // namespace fa
