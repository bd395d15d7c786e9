#include "execbridge/internal/session_id.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace execbridge::internal {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

std::mt19937_64& generator() {
  thread_local std::mt19937_64 gen([] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }());
  return gen;
}

}  // namespace

std::string new_session_id() {
  std::array<std::uint8_t, 16> bytes{};
  auto& gen = generator();
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    std::uint64_t word = gen();
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
    }
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  std::string id;
  id.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      id.push_back('-');
    }
    id.push_back(kHexDigits[bytes[i] >> 4]);
    id.push_back(kHexDigits[bytes[i] & 0x0F]);
  }
  return id;
}

bool looks_like_session_id(std::string_view text) {
  if (text.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    bool dash_position = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_position) {
      if (text[i] != '-') {
        return false;
      }
    } else if (kHexDigits.find(text[i]) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

}  // namespace execbridge::internal
