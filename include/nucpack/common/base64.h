// =============================================================================
// nucpack - Base64 Text Encoding
// =============================================================================
// RFC 4648 base64 (standard alphabet, '=' padding) used to turn the merged
// chunk streams into a portable ASCII blob.
// =============================================================================

#ifndef NUCPACK_COMMON_BASE64_H
#define NUCPACK_COMMON_BASE64_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nucpack/common/error.h"

namespace nucpack {

/// @brief Length of the base64 text for a given number of input bytes.
[[nodiscard]] constexpr std::size_t base64EncodedLength(std::size_t byteCount) noexcept {
    return ((byteCount + 2) / 3) * 4;
}

/// @brief Encode bytes as padded base64 text.
[[nodiscard]] std::string base64Encode(std::span<const std::uint8_t> data);

/// @brief Decode padded base64 text.
/// @return Decoded bytes, or kFormatError for a length that is not a multiple
///         of four, a symbol outside the alphabet, or misplaced padding.
[[nodiscard]] Result<std::vector<std::uint8_t>> base64Decode(std::string_view text);

}  // namespace nucpack

#endif  // NUCPACK_COMMON_BASE64_H
