// =============================================================================
// nucpack - Info Command
// =============================================================================
// Command handler for displaying bundle information.
//
// This module provides:
// - InfoCommand: header, size and chunk statistics of a bundle
// - JSON output format
// - Per-chunk metadata listing (detailed mode)
// =============================================================================

#ifndef NUCPACK_COMMANDS_INFO_COMMAND_H
#define NUCPACK_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

namespace nucpack::format {
class BundleReader;
}  // namespace nucpack::format

namespace nucpack::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input bundle path.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Show per-chunk metadata.
    bool detailed = false;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying bundle information.
class InfoCommand {
public:
    /// @brief Construct with options.
    explicit InfoCommand(InfoOptions options);

    /// @brief Destructor.
    ~InfoCommand();

    // Non-copyable, movable
    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    /// @brief Print info in text format.
    void printTextInfo(const format::BundleReader& reader) const;

    /// @brief Print info in JSON format.
    void printJsonInfo(const format::BundleReader& reader) const;

    /// @brief Options.
    InfoOptions options_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(
    const std::string& inputPath,
    bool jsonOutput,
    bool detailed);

}  // namespace nucpack::commands

#endif  // NUCPACK_COMMANDS_INFO_COMMAND_H
