// =============================================================================
// nucpack - Nucleotide Sequence Compressor
// =============================================================================
// Main entry point for the nucpack command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: compress, decompress, info, verify
// - Global options: threads, verbose, quiet, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "nucpack/common/error.h"
#include "nucpack/common/logger.h"
#include "nucpack/common/types.h"

// Command implementations
#include "commands/compress_command.h"
#include "commands/decompress_command.h"
#include "commands/info_command.h"
#include "commands/verify_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "1.0.0";
constexpr const char* kDescription =
    "nucpack: parallel 2-bit compressor for nucleotide sequences\n"
    "Chunks are packed at 2 bits per base, deflated (or zstd-compressed when\n"
    "repetitive) on a TBB worker pool, and stored as a checksummed .npk bundle.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = auto-detect
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliCompressOptions {
    std::string input;
    std::string output;
    std::size_t chunkSize = nucpack::kDefaultChunkSize;
    bool keepInvalid = false;
};

CliCompressOptions gCompressOpts;

struct CliDecompressOptions {
    std::string input;
    std::string output;
    std::size_t lineWidth = 0;
};

CliDecompressOptions gDecompressOpts;

struct CliInfoOptions {
    std::string input;
    bool json = false;
    bool detailed = false;
};

CliInfoOptions gInfoOpts;

struct CliVerifyOptions {
    std::string input;
    bool failFast = false;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCompressCommand(CLI::App& app) {
    auto* compress = app.add_subcommand("compress", "Compress a sequence file to .npk format");
    compress->alias("c");

    compress->add_option("-i,--input", gCompressOpts.input,
                         "Input FASTA or raw sequence file, optionally gzipped (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    compress->add_option("-o,--output", gCompressOpts.output, "Output .npk file")->required();

    compress->add_option("--chunk-size", gCompressOpts.chunkSize, "Symbols per chunk")
        ->default_val(nucpack::kDefaultChunkSize)
        ->check(CLI::PositiveNumber);

    compress->add_flag("--keep-invalid", gCompressOpts.keepInvalid,
                       "Do not strip symbols outside ACGTN (such input is rejected)");
}

void setupDecompressCommand(CLI::App& app) {
    auto* decompress = app.add_subcommand("decompress", "Decompress a .npk file");
    decompress->alias("d");
    decompress->alias("x");

    decompress->add_option("-i,--input", gDecompressOpts.input, "Input .npk file")
        ->required()
        ->check(CLI::ExistingFile);

    decompress->add_option("-o,--output", gDecompressOpts.output,
                           "Output sequence file (or '-' for stdout)")
        ->required();

    decompress->add_option("--line-width", gDecompressOpts.lineWidth,
                           "Write FASTA wrapped at this width (0 = single raw line)")
        ->default_val(0);
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display bundle information");
    info->alias("i");

    info->add_option("-i,--input", gInfoOpts.input, "Input .npk file")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");

    info->add_flag("--detailed", gInfoOpts.detailed, "Show per-chunk metadata");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Verify bundle integrity");
    verify->alias("v");

    verify->add_option("-i,--input", gVerifyOpts.input, "Input .npk file")
        ->required()
        ->check(CLI::ExistingFile);

    verify->add_flag("--fail-fast", gVerifyOpts.failFast, "Stop at the first corrupted chunk");

    verify->add_flag("--verbose", gVerifyOpts.verbose, "Show every check");
}

// =============================================================================
// Command Dispatch
// =============================================================================

int runCompress() {
    auto cmd = nucpack::commands::createCompressCommand(
        gCompressOpts.input, gCompressOpts.output, gCompressOpts.chunkSize, gOptions.threads,
        gCompressOpts.keepInvalid);
    return cmd->execute();
}

int runDecompress() {
    auto cmd = nucpack::commands::createDecompressCommand(
        gDecompressOpts.input, gDecompressOpts.output, gDecompressOpts.lineWidth);
    return cmd->execute();
}

int runInfo() {
    auto cmd = nucpack::commands::createInfoCommand(gInfoOpts.input, gInfoOpts.json,
                                                    gInfoOpts.detailed);
    return cmd->execute();
}

int runVerify() {
    auto cmd = nucpack::commands::createVerifyCommand(gVerifyOpts.input, gVerifyOpts.failFast,
                                                      gVerifyOpts.verbose);
    return cmd->execute();
}

int dispatch(const CLI::App& app) {
    if (app.got_subcommand("compress")) {
        return runCompress();
    }
    if (app.got_subcommand("decompress")) {
        return runDecompress();
    }
    if (app.got_subcommand("info")) {
        return runInfo();
    }
    if (app.got_subcommand("verify")) {
        return runVerify();
    }
    return EXIT_SUCCESS;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupCompressCommand(app);
    setupDecompressCommand(app);
    setupInfoCommand(app);
    setupVerifyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        nucpack::log::Config config;
        config.logFile = gOptions.logFile;
        if (gOptions.quiet) {
            config.level = nucpack::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            config.level = nucpack::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            config.level = nucpack::log::Level::kDebug;
        }
        // Sequence data written to stdout must not interleave with log lines
        config.consoleToStderr =
            app.got_subcommand("decompress") && gDecompressOpts.output == "-";
        nucpack::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        exitCode = dispatch(app);
    } catch (const nucpack::NucpackException& ex) {
        NUCPACK_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        NUCPACK_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    nucpack::log::shutdown();
    return exitCode;
}
