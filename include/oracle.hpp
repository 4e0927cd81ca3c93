#pragma once

#include <memory>
#include <string>

namespace fa {

struct OracleObservation {
    std::string winningOutcome;
    std::string evidence;
    std::string signature;
};

// External outcome source. fetchObservation may throw when the source is unreachable.
class OracleBackend {
public:
    virtual ~OracleBackend() = default;
    virtual OracleObservation fetchObservation(const std::string& marketId) = 0;
};

using OraclePtr = std::shared_ptr<OracleBackend>;

} // namespace fa
