#include "transcript_log.hpp"

#include "picosha2.h"

#include <utility>
#include <vector>

namespace fa {

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

TranscriptLog::TranscriptLog() : levels_(1) {}

void TranscriptLog::append(const std::string& event) {
    levels_.front().push_back(sha256Hex(event));

    std::size_t index = levels_.front().size() - 1;
    for (std::size_t level = 0; levels_[level].size() > 1; ++level) {
        if (level + 1 == levels_.size()) {
            levels_.emplace_back();
        }
        const std::vector<std::string>& layer = levels_[level];
        const std::size_t parent = index / 2;
        const std::string& left = layer[parent * 2];
        const std::string& right = (parent * 2 + 1 < layer.size()) ? layer[parent * 2 + 1] : left;
        std::string hash = hashPair(left, right);

        std::vector<std::string>& above = levels_[level + 1];
        if (parent < above.size()) {
            above[parent] = std::move(hash);
        } else {
            above.push_back(std::move(hash));
        }
        index = parent;
    }
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

std::string TranscriptLog::merkleRoot() const {
    if (levels_.front().empty()) {
        return {};
    }
    return levels_.back().front();
}

std::vector<std::string> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= levels_.front().size()) {
        return proof;
    }

    std::size_t index = leafIndex;
    for (std::size_t level = 0; level + 1 < levels_.size(); ++level) {
        const std::vector<std::string>& layer = levels_[level];
        if (index % 2 == 0) {
            proof.push_back((index + 1 < layer.size()) ? layer[index + 1] : layer[index]);
        } else {
            proof.push_back(layer[index - 1]);
        }
        index /= 2;
    }
    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leaf,
                                std::size_t leafIndex,
                                std::size_t leafCount,
                                const std::vector<std::string>& proof,
                                const std::string& root) {
    if (leafIndex >= leafCount) {
        return false;
    }
    std::string current = leaf;
    std::size_t index = leafIndex;
    std::size_t width = leafCount;
    std::size_t step = 0;
    while (width > 1) {
        if (step >= proof.size()) {
            return false;
        }
        const std::string& sibling = proof[step++];
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
        width = (width + 1) / 2;
    }
    return step == proof.size() && current == root;
}

} // namespace fa
