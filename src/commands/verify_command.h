// =============================================================================
// nucpack - Verify Command
// =============================================================================
// Command handler for verifying bundle integrity.
//
// Checks performed, in order:
// - bundle structure (magic, version, end marker)
// - bundle hash (xxHash64 footer)
// - per-chunk CRC-32 of the decoded 2-bit streams
// =============================================================================

#ifndef NUCPACK_COMMANDS_VERIFY_COMMAND_H
#define NUCPACK_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nucpack::format {
class BundleReader;
}  // namespace nucpack::format

namespace nucpack::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    /// @brief Check name.
    std::string checkName;

    /// @brief Whether check passed.
    bool passed = false;

    /// @brief Error message (if failed).
    std::string errorMessage;

    /// @brief Additional details.
    std::string details;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;

    /// @brief Individual results.
    std::vector<VerificationResult> results;

    /// @brief Overall pass/fail.
    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    /// @brief Add a result.
    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for verify command.
struct VerifyOptions {
    /// @brief Input bundle path.
    std::filesystem::path inputPath;

    /// @brief Stop on first failed chunk.
    bool failFast = false;

    /// @brief Print every check, not only failures.
    bool verbose = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying bundle integrity.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);
    ~VerifyCommand();

    // Non-copyable, movable
    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = success, non-zero = verification failed).
    [[nodiscard]] int execute();

    /// @brief Get verification summary.
    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    /// @brief Open the bundle; records structure and hash results.
    /// @return Reader on success, nullptr when either check failed.
    [[nodiscard]] std::unique_ptr<format::BundleReader> openBundle();

    /// @brief Verify every chunk's checksum.
    void verifyChunkChecksums(const format::BundleReader& reader);

    /// @brief Record a result and print it when requested.
    void report(VerificationResult result);

    /// @brief Print verification summary.
    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a verify command from CLI options.
[[nodiscard]] std::unique_ptr<VerifyCommand> createVerifyCommand(
    const std::string& inputPath,
    bool failFast,
    bool verbose);

}  // namespace nucpack::commands

#endif  // NUCPACK_COMMANDS_VERIFY_COMMAND_H
