#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace graphvc::util {

std::string NewId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char               kHex[] = "0123456789abcdef";

  std::array<uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    const uint64_t word = rng();
    for (std::size_t j = 0; j < 8; ++j) bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
  }
  bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
  bytes[8] = (bytes[8] & 0x3F) | 0x80; // RFC4122 variant

  std::string id;
  id.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) id.push_back('-');
    id.push_back(kHex[bytes[i] >> 4]);
    id.push_back(kHex[bytes[i] & 0x0F]);
  }
  return id;
}

} // namespace graphvc::util
