#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace execbridge {

/// @brief Incremental UTF-8 validator for a byte stream read in arbitrary pieces.
///
/// A character split across two reads is held back until its remaining bytes arrive.
/// Ill-formed input is replaced by U+FFFD, one replacement per maximal invalid subpart.
class Utf8Decoder {
 public:
  /// @brief Decode the next piece of the stream.
  ///
  /// Returns only complete characters; a trailing partial sequence is kept for the
  /// next call.
  std::string decode(std::string_view bytes);

  /// @brief End of stream: emit U+FFFD for a pending partial sequence, if any.
  std::string finish();

  /// @brief Number of U+FFFD replacements produced so far.
  [[nodiscard]] std::size_t replacements() const noexcept { return replacements_; }

  /// @brief True if bytes of an unfinished character are being held back.
  [[nodiscard]] bool has_pending() const noexcept { return !pending_.empty(); }

 private:
  std::string pending_;
  std::size_t replacements_ = 0;
};

}  // namespace execbridge
