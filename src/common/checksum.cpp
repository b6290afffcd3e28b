// =============================================================================
// nucpack - Checksum Utilities Implementation
// =============================================================================

#include "nucpack/common/checksum.h"

#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <xxhash.h>
#include <zlib.h>

namespace nucpack {

Crc32 crc32Update(Crc32 crc, std::span<const std::uint8_t> data) noexcept {
    // zlib takes uInt lengths; feed large buffers in slices.
    constexpr std::size_t kMaxSlice = std::numeric_limits<uInt>::max();

    uLong value = crc;
    std::size_t offset = 0;
    while (offset < data.size()) {
        const std::size_t slice = std::min(kMaxSlice, data.size() - offset);
        value = ::crc32(value, data.data() + offset, static_cast<uInt>(slice));
        offset += slice;
    }
    return static_cast<Crc32>(value);
}

Crc32 crc32(std::span<const std::uint8_t> data) noexcept {
    return crc32Update(static_cast<Crc32>(::crc32(0L, Z_NULL, 0)), data);
}

std::uint64_t xxhash64(const void* data, std::size_t size, std::uint64_t seed) noexcept {
    return XXH64(data, size, seed);
}

std::string contentHash(std::string_view text) {
    return fmt::format("{:016x}", xxhash64(text.data(), text.size()));
}

}  // namespace nucpack
