// =============================================================================
// nucpack - Little-Endian Byte Buffers
// =============================================================================
// ByteWriter appends fixed-width little-endian fields to a growing buffer.
// ByteReader consumes them from a span and throws FormatError on overrun, so
// truncated or inconsistent input never reads out of bounds.
// =============================================================================

#ifndef NUCPACK_FORMAT_BINARY_IO_H
#define NUCPACK_FORMAT_BINARY_IO_H

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "nucpack/common/error.h"

namespace nucpack::format {

namespace detail {

/// @brief Convert between native and little-endian byte order.
template <typename T>
[[nodiscard]] T toLittleEndian(T value) noexcept {
    static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
        }
    }
    return value;
}

}  // namespace detail

// =============================================================================
// ByteWriter
// =============================================================================

/// @brief Append-only little-endian buffer.
class ByteWriter {
public:
    template <typename T>
    void writeLE(T value) {
        static_assert(std::is_integral_v<T>, "writeLE takes integral values");
        value = detail::toLittleEndian(value);
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(&value);
        buffer_.insert(buffer_.end(), bytes, bytes + sizeof(T));
    }

    /// @brief Write a double as its IEEE-754 bit pattern.
    void writeDouble(double value) { writeLE(std::bit_cast<std::uint64_t>(value)); }

    void writeBytes(std::span<const std::uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    void writeBytes(std::string_view data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }

    [[nodiscard]] const std::vector<std::uint8_t>& buffer() const noexcept { return buffer_; }

    [[nodiscard]] std::vector<std::uint8_t> release() noexcept { return std::move(buffer_); }

private:
    std::vector<std::uint8_t> buffer_;
};

// =============================================================================
// ByteReader
// =============================================================================

/// @brief Bounds-checked little-endian cursor over a byte span.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    template <typename T>
    [[nodiscard]] T readLE() {
        static_assert(std::is_integral_v<T>, "readLE returns integral values");
        require(sizeof(T), "integer field");
        T value;
        std::memcpy(&value, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return detail::toLittleEndian(value);
    }

    [[nodiscard]] double readDouble() { return std::bit_cast<double>(readLE<std::uint64_t>()); }

    /// @brief Borrow the next `size` bytes.
    [[nodiscard]] std::span<const std::uint8_t> readBytes(std::size_t size) {
        require(size, "byte field");
        auto view = data_.subspan(offset_, size);
        offset_ += size;
        return view;
    }

    [[nodiscard]] std::string readString(std::size_t size) {
        auto view = readBytes(size);
        return std::string(view.begin(), view.end());
    }

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }

    [[nodiscard]] bool atEnd() const noexcept { return offset_ == data_.size(); }

private:
    void require(std::size_t size, std::string_view what) const {
        if (size > remaining()) {
            throw FormatError(fmt::format("truncated {}: need {} bytes, {} left", what, size,
                                          remaining()),
                              ErrorContext{}.withOffset(offset_));
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
};

}  // namespace nucpack::format

#endif  // NUCPACK_FORMAT_BINARY_IO_H
