#include "execbridge/utf8.hpp"

#include <cstdint>

namespace execbridge {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// Total length of a sequence that starts with lead, or 0 if lead cannot start one.
std::size_t sequence_length(std::uint8_t lead) {
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 2;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    return 4;
  }
  return 0;
}

// The second byte has a narrower range for a few leads (overlongs, surrogates, > U+10FFFF).
bool valid_second(std::uint8_t lead, std::uint8_t byte) {
  switch (lead) {
    case 0xE0:
      return byte >= 0xA0 && byte <= 0xBF;
    case 0xED:
      return byte >= 0x80 && byte <= 0x9F;
    case 0xF0:
      return byte >= 0x90 && byte <= 0xBF;
    case 0xF4:
      return byte >= 0x80 && byte <= 0x8F;
    default:
      return byte >= 0x80 && byte <= 0xBF;
  }
}

bool is_continuation(std::uint8_t byte) { return (byte & 0xC0) == 0x80; }

}  // namespace

std::string Utf8Decoder::decode(std::string_view bytes) {
  std::string input;
  std::string_view data = bytes;
  if (!pending_.empty()) {
    input = std::move(pending_);
    pending_.clear();
    input.append(bytes);
    data = input;
  }

  std::string out;
  out.reserve(data.size());
  std::size_t i = 0;
  while (i < data.size()) {
    auto lead = static_cast<std::uint8_t>(data[i]);
    std::size_t len = sequence_length(lead);
    if (len == 1) {
      out.push_back(data[i]);
      ++i;
      continue;
    }
    if (len == 0) {
      out.append(kReplacement);
      ++replacements_;
      ++i;
      continue;
    }

    // Count how many bytes of the expected sequence are well-formed.
    std::size_t good = 1;
    while (good < len && i + good < data.size()) {
      auto byte = static_cast<std::uint8_t>(data[i + good]);
      bool ok = good == 1 ? valid_second(lead, byte) : is_continuation(byte);
      if (!ok) {
        break;
      }
      ++good;
    }

    if (good == len) {
      out.append(data.substr(i, len));
      i += len;
    } else if (i + good == data.size()) {
      // Well-formed so far but cut off by the read boundary.
      pending_.assign(data.substr(i));
      break;
    } else {
      out.append(kReplacement);
      ++replacements_;
      i += good;
    }
  }
  return out;
}

std::string Utf8Decoder::finish() {
  if (pending_.empty()) {
    return {};
  }
  pending_.clear();
  ++replacements_;
  return std::string(kReplacement);
}

}  // namespace execbridge
