#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Ferret {
namespace Utils {
namespace Crypto {

constexpr size_t SHA256_SIZE = 32;

using Sha256Digest = std::array<uint8_t, SHA256_SIZE>;

Sha256Digest sha256(const uint8_t* data, size_t length);
Sha256Digest sha256(const std::vector<uint8_t>& data);
std::string  sha256_hex(const std::string& data);

}  // namespace Crypto
}  // namespace Utils
}  // namespace Ferret
