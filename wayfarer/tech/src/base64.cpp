#include "wayfarer/base64.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "wayfarer/ascii.hpp"

namespace wayfarer {

namespace {

constexpr char kB64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr unsigned char kInvalidSextet = 64;

constexpr auto kReverseTable = []() {
  struct {
    unsigned char values[256];
  } table{};
  for (auto &val : table.values) {
    val = kInvalidSextet;
  }
  for (unsigned char pos = 0; pos < 64; ++pos) {
    table.values[static_cast<unsigned char>(kB64Table[pos])] = pos;
  }
  return table;
}();

}  // namespace

std::string B64Encode(std::string_view binData) {
  static constexpr int kB64NbBits = 6;
  static constexpr uint32_t kMask6 = (1U << kB64NbBits) - 1U;

  std::string ret;
  ret.reserve(B64EncodedLen(binData.size()));

  int bitsCollected = 0;
  uint32_t accumulator = 0;
  for (char ch : binData) {
    accumulator = (accumulator << 8) | static_cast<uint8_t>(ch);
    bitsCollected += 8;
    while (bitsCollected >= kB64NbBits) {
      bitsCollected -= kB64NbBits;
      ret.push_back(kB64Table[(accumulator >> bitsCollected) & kMask6]);
    }
  }
  if (bitsCollected > 0) {
    accumulator <<= kB64NbBits - bitsCollected;
    ret.push_back(kB64Table[accumulator & kMask6]);
  }
  while (ret.size() % 4U != 0) {
    ret.push_back('=');
  }
  return ret;
}

std::optional<std::string> B64Decode(std::string_view ascData) {
  std::string ret;
  ret.reserve((ascData.size() * 3) / 4);

  int bitsCollected = 0;
  unsigned int accumulator = 0;
  std::size_t nbSextets = 0;

  for (char ch : ascData) {
    if (isspace(ch) || ch == '=') {
      continue;
    }
    const unsigned char sextet = kReverseTable.values[static_cast<unsigned char>(ch)];
    if (sextet == kInvalidSextet) {
      return std::nullopt;
    }
    ++nbSextets;
    accumulator = (accumulator << 6) | sextet;
    bitsCollected += 6;
    if (bitsCollected >= 8) {
      bitsCollected -= 8;
      ret.push_back(static_cast<char>((accumulator >> bitsCollected) & 0xFFU));
    }
  }
  // A single trailing sextet cannot encode a full byte.
  if (nbSextets % 4U == 1U) {
    return std::nullopt;
  }
  return ret;
}

}  // namespace wayfarer
