// =============================================================================
// nucpack - Decompress Command
// =============================================================================
// Command handler for restoring the sequence stored in a .npk bundle.
// =============================================================================

#ifndef NUCPACK_COMMANDS_DECOMPRESS_COMMAND_H
#define NUCPACK_COMMANDS_DECOMPRESS_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace nucpack::commands {

/// @brief Configuration options for decompression.
struct DecompressOptions {
    /// @brief Input bundle path.
    std::filesystem::path inputPath;

    /// @brief Output path (or "-" for stdout).
    std::filesystem::path outputPath;

    /// @brief FASTA line width (0 = one unwrapped line, no header).
    std::size_t lineWidth = 0;

    /// @brief Record name written in the FASTA header.
    std::string recordName = "sequence";
};

/// @brief Command handler for decompression.
class DecompressCommand {
public:
    explicit DecompressCommand(DecompressOptions options);
    ~DecompressCommand();

    // Non-copyable, movable
    DecompressCommand(const DecompressCommand&) = delete;
    DecompressCommand& operator=(const DecompressCommand&) = delete;
    DecompressCommand(DecompressCommand&&) noexcept;
    DecompressCommand& operator=(DecompressCommand&&) noexcept;

    /// @brief Execute the decompression.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const DecompressOptions& options() const noexcept { return options_; }

private:
    DecompressOptions options_;
};

/// @brief Create a decompress command from CLI options.
[[nodiscard]] std::unique_ptr<DecompressCommand> createDecompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    std::size_t lineWidth);

}  // namespace nucpack::commands

#endif  // NUCPACK_COMMANDS_DECOMPRESS_COMMAND_H
