// =============================================================================
// nucpack - Error Handling Framework Implementation
// =============================================================================

#include "nucpack/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace nucpack {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (chunkIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "chunk: " << *chunkIndex;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// NucpackException Implementation
// =============================================================================

void NucpackException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual) {
    return fmt::format("checksum mismatch: expected 0x{:08x}, got 0x{:08x}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
        case ErrorCode::kCorruptedData:
            throw ChecksumError(message_);
        case ErrorCode::kCodecError:
            throw CodecError(message_);
        case ErrorCode::kInvalidSequence:
            throw InvalidSequenceError(message_);
        default:
            break;
    }
    throw NucpackException(code_, message_);
}

}  // namespace nucpack
