// =============================================================================
// nucpack - Common Type Definitions Implementation
// =============================================================================

#include "nucpack/common/types.h"

namespace nucpack {

std::string_view compressionTypeToString(CompressionType type) noexcept {
    switch (type) {
        case CompressionType::kAdaptive:
            return "adaptive";
    }
    return "unknown";
}

std::string_view codecFamilyToString(CodecFamily family) noexcept {
    switch (family) {
        case CodecFamily::kDeflate:
            return "deflate";
        case CodecFamily::kZstdLong:
            return "zstd-long";
    }
    return "unknown";
}

}  // namespace nucpack
