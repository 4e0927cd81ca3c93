#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fa {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);

// 128-bit random identifier for markets, positions and payouts.
std::string newRecordId();

} // namespace fa
