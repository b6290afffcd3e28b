// =============================================================================
// nucpack - Base64 Text Encoding Implementation
// =============================================================================

#include "nucpack/common/base64.h"

#include <array>

#include <fmt/format.h>

namespace nucpack {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr char kPadding = '=';

/// @brief Marker for bytes outside the alphabet.
constexpr std::uint8_t kInvalid = 0xFF;

constexpr std::array<std::uint8_t, 256> buildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    for (auto& entry : table) {
        entry = kInvalid;
    }
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

constexpr std::array<std::uint8_t, 256> kDecodeTable = buildDecodeTable();

}  // namespace

std::string base64Encode(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve(base64EncodedLength(data.size()));

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                     static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
    }

    const std::size_t remaining = data.size() - i;
    if (remaining == 1) {
        const std::uint32_t value = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(value >> 18) & 0x3F]);
        out.push_back(kAlphabet[(value >> 12) & 0x3F]);
        out.push_back(kPadding);
        out.push_back(kPadding);
    } else if (remaining == 2) {
        const std::uint32_t value = (static_cast<std::uint32_t>(data[i]) << 16) |
                                    (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(value >> 18) & 0x3F]);
        out.push_back(kAlphabet[(value >> 12) & 0x3F]);
        out.push_back(kAlphabet[(value >> 6) & 0x3F]);
        out.push_back(kPadding);
    }

    return out;
}

Result<std::vector<std::uint8_t>> base64Decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kFormatError,
            fmt::format("base64 text length {} is not a multiple of 4", text.size()));
    }

    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool lastQuad = (i + 4 == text.size());
        std::size_t padding = 0;
        if (lastQuad) {
            if (text[i + 3] == kPadding) {
                padding = (text[i + 2] == kPadding) ? 2 : 1;
            }
        }

        std::uint32_t quad = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = text[i + j];
            if (j >= 4 - padding) {
                quad <<= 6;
                continue;
            }
            const std::uint8_t value = kDecodeTable[static_cast<unsigned char>(c)];
            if (value == kInvalid) {
                return makeError<std::vector<std::uint8_t>>(
                    ErrorCode::kFormatError,
                    fmt::format("invalid base64 symbol 0x{:02x} at offset {}",
                                static_cast<unsigned char>(c), i + j));
            }
            quad = (quad << 6) | value;
        }

        out.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<std::uint8_t>(quad & 0xFF));
        }
    }

    return out;
}

}  // namespace nucpack
