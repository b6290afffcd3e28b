// =============================================================================
// nucpack - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <iostream>

#include <fmt/format.h>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"
#include "nucpack/format/bundle_reader.h"
#include "nucpack/pipeline/genome_codec.h"

namespace nucpack::commands {

// =============================================================================
// VerifyCommand Implementation
// =============================================================================

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    try {
        if (!std::filesystem::exists(options_.inputPath)) {
            throw IOError("Input file not found: " + options_.inputPath.string(),
                          ErrorContext(options_.inputPath.string()));
        }

        if (options_.verbose) {
            std::cout << "Verifying: " << options_.inputPath.string() << std::endl;
            std::cout << std::endl;
        }

        auto reader = openBundle();
        if (reader) {
            verifyChunkChecksums(*reader);
        }

        printSummary();

        return summary_.passed() ? 0 : toExitCode(ErrorCode::kChecksumError);

    } catch (const NucpackException& e) {
        NUCPACK_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        NUCPACK_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

std::unique_ptr<format::BundleReader> VerifyCommand::openBundle() {
    VerificationResult structure;
    structure.checkName = "Bundle Structure";
    VerificationResult hash;
    hash.checkName = "Bundle Checksum";

    // Structure errors are raised before the hash is compared.
    std::unique_ptr<format::BundleReader> reader;
    try {
        reader = std::make_unique<format::BundleReader>(options_.inputPath);
    } catch (const FormatError& e) {
        structure.errorMessage = e.message();
        report(std::move(structure));
        return nullptr;
    } catch (const ChecksumError& e) {
        structure.passed = true;
        report(std::move(structure));
        hash.errorMessage = e.message();
        report(std::move(hash));
        return nullptr;
    }

    const auto& bundle = reader->bundle();
    structure.passed = true;
    structure.details = fmt::format("version {}.{}, {} chunks",
                                    format::decodeMajorVersion(bundle.version),
                                    format::decodeMinorVersion(bundle.version),
                                    bundle.metadata.size());
    report(std::move(structure));

    hash.passed = true;
    hash.details = fmt::format("xxHash64 {:016x}", bundle.checksum);
    report(std::move(hash));

    return reader;
}

void VerifyCommand::verifyChunkChecksums(const format::BundleReader& reader) {
    const auto& bundle = reader.bundle();
    const pipeline::GenomeCodec codec;

    const auto checks = codec.verifyChunks(bundle.blob, bundle.metadata, options_.failFast);
    for (const auto& check : checks) {
        VerificationResult result;
        result.checkName = fmt::format("Chunk {}", check.index);
        result.passed = check.ok;
        if (check.ok) {
            result.details =
                fmt::format("crc32 {:08x}", bundle.metadata[check.index].checksum);
        } else {
            result.errorMessage =
                fmt::format("{}: {}", errorCodeToString(check.code), check.message);
        }
        report(std::move(result));
    }
}

void VerifyCommand::report(VerificationResult result) {
    if (options_.verbose || !result.passed) {
        std::cout << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName;
        if (!result.passed) {
            std::cout << ": " << result.errorMessage;
        } else if (!result.details.empty()) {
            std::cout << " (" << result.details << ")";
        }
        std::cout << std::endl;
    }
    summary_.addResult(std::move(result));
}

void VerifyCommand::printSummary() const {
    std::cout << std::endl;
    std::cout << "=== Verification Summary ===" << std::endl;
    std::cout << "File:    " << options_.inputPath.string() << std::endl;
    std::cout << "Checks:  " << summary_.totalChecks << std::endl;
    std::cout << "Passed:  " << summary_.passedChecks << std::endl;
    std::cout << "Failed:  " << summary_.failedChecks << std::endl;
    std::cout << std::endl;

    if (summary_.passed()) {
        std::cout << "Result:  OK - bundle integrity verified" << std::endl;
    } else {
        std::cout << "Result:  FAILED - bundle may be corrupted" << std::endl;
    }
    std::cout << "============================" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<VerifyCommand> createVerifyCommand(
    const std::string& inputPath,
    bool failFast,
    bool verbose) {

    VerifyOptions opts;
    opts.inputPath = inputPath;
    opts.failFast = failFast;
    opts.verbose = verbose;

    return std::make_unique<VerifyCommand>(std::move(opts));
}

}  // namespace nucpack::commands
