// =============================================================================
// nucpack - Error Handling Framework
// =============================================================================
// Error handling for the nucpack library and command-line tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - NucpackException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (chunk index, byte offset, file path, source location)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (malformed blob, bundle or metadata)
// - 4: Checksum verification failure
// - 5: Compression back-end failure
// - 6: Invalid nucleotide sequence
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef NUCPACK_COMMON_ERROR_H
#define NUCPACK_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace nucpack {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Format error.
    /// @note Malformed base64 blob, truncated bundle, metadata/blob disagreement.
    kFormatError = 3,

    /// @brief Checksum verification failure.
    /// @note Chunk CRC-32 mismatch or bundle hash mismatch.
    kChecksumError = 4,

    /// @brief Compression back-end (zlib / zstd) failure.
    kCodecError = 5,

    /// @brief Input is not a valid nucleotide sequence.
    kInvalidSequence = 6,

    /// @brief Invalid argument value.
    kInvalidArgument = 7,

    /// @brief Invalid state for operation.
    kInvalidState = 8,

    /// @brief Corrupted data detected.
    kCorruptedData = 9
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kCodecError:
            return "codec error";
        case ErrorCode::kInvalidSequence:
            return "invalid sequence";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kCorruptedData:
            return "corrupted data";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Chunk index where the error occurred (if applicable).
    std::optional<std::uint32_t> chunkIndex;

    /// @brief Byte offset where the error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the chunk index.
    /// @return Reference to this for method chaining.
    ErrorContext& withChunk(std::uint32_t index) {
        chunkIndex = index;
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all nucpack errors.
/// @note Provides error code, message, and optional context.
class NucpackException : public std::exception {
public:
    /// @brief Construct with error code and message.
    NucpackException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    NucpackException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~NucpackException() override = default;

    NucpackException(const NucpackException&) = default;
    NucpackException(NucpackException&&) noexcept = default;
    NucpackException& operator=(const NucpackException&) = default;
    NucpackException& operator=(NucpackException&&) noexcept = default;

    /// @brief Get the formatted error message (with context).
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public NucpackException {
public:
    explicit UsageError(std::string message)
        : NucpackException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : NucpackException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public NucpackException {
public:
    explicit IOError(std::string message)
        : NucpackException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : NucpackException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    /// @param message Descriptive error message.
    /// @param ec System error code.
    IOError(std::string message, std::error_code ec)
        : NucpackException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for format errors (exit code 3).
/// @note Thrown for malformed blobs, truncated bundles, bad magic or version,
///       and metadata that does not describe the blob it accompanies.
class FormatError : public NucpackException {
public:
    explicit FormatError(std::string message)
        : NucpackException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : NucpackException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for checksum verification failures (exit code 4).
/// @note Thrown when a chunk CRC-32 or the bundle hash doesn't match.
class ChecksumError : public NucpackException {
public:
    explicit ChecksumError(std::string message)
        : NucpackException(ErrorCode::kChecksumError, std::move(message)) {}

    ChecksumError(std::string message, ErrorContext context)
        : NucpackException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual checksum values.
    ChecksumError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : NucpackException(ErrorCode::kChecksumError,
                           formatChecksumMismatch(expected, actual),
                           std::move(context)),
          expected_(expected),
          actual_(actual) {}

    /// @brief Get the expected checksum value (if available).
    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    /// @brief Get the actual checksum value (if available).
    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Exception for compression back-end failures (exit code 5).
class CodecError : public NucpackException {
public:
    explicit CodecError(std::string message)
        : NucpackException(ErrorCode::kCodecError, std::move(message)) {}

    CodecError(std::string message, ErrorContext context)
        : NucpackException(ErrorCode::kCodecError, std::move(message), std::move(context)) {}
};

/// @brief Exception for rejected input sequences (exit code 6).
/// @note Thrown for empty input, input shorter than the minimum length, or a
///       symbol outside {A,C,G,T,N}.
class InvalidSequenceError : public NucpackException {
public:
    explicit InvalidSequenceError(std::string message)
        : NucpackException(ErrorCode::kInvalidSequence, std::move(message)) {}

    /// @brief Construct with the position of the offending symbol.
    InvalidSequenceError(std::string message, std::uint64_t position)
        : NucpackException(ErrorCode::kInvalidSequence, std::move(message),
                           ErrorContext{}.withOffset(position)),
          position_(position) {}

    /// @brief Position of the first rejected symbol (if the rejection was per-symbol).
    [[nodiscard]] std::optional<std::uint64_t> position() const noexcept { return position_; }

private:
    std::optional<std::uint64_t> position_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a NucpackException.
    explicit Error(const NucpackException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const NucpackException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to its value, throwing if it contains an error.
/// @throws NucpackException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw if a VoidResult contains an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert thrown exceptions to a Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const NucpackException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInvalidState, ex.what()});
    }
}

}  // namespace nucpack

#endif  // NUCPACK_COMMON_ERROR_H
