// =============================================================================
// frw - Parallel File Reader and Byte Editor
// =============================================================================
// Main entry point for the frw command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Read subcommands: lines, cat, verify
// - Write subcommands: put, overwrite, insert
// - Global options: verbose, quiet, log-level, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "frw/common/error.h"
#include "frw/common/logger.h"
#include "frw/common/types.h"

#include "commands/edit_command.h"
#include "commands/load_command.h"
#include "commands/verify_command.h"

namespace frw::commands {
int runLines(CLI::App* app);
int runCat(CLI::App* app);
int runVerify(CLI::App* app);
int runEdit(CLI::App* app, EditAction action);
}  // namespace frw::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "frw: parallel chunked file reader and byte-level file editor\n"
    "Reads files with 1, 8 or 16 concurrent positional reads depending on size.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = verbose, 2 = debug
    bool quiet = false;
    std::string logLevel;  // overrides -v/-q when set
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Read Command Options
// =============================================================================

struct CliLinesOptions {
    std::string input;
    bool allowEmpty = false;
    bool errorOnEmpty = false;
    bool print = false;
};

CliLinesOptions gLinesOpts;

struct CliCatOptions {
    std::string input;
};

CliCatOptions gCatOpts;

struct CliVerifyOptions {
    std::string input;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Write Command Options
// =============================================================================

struct CliPutOptions {
    std::string output;
    std::string data;
    std::string mode = "APPEND";
    bool mkdir = false;
};

CliPutOptions gPutOpts;

// Shared by overwrite and insert
struct CliEditOptions {
    std::string input;
    frw::FileOffset offset = 0;
    std::string data;
};

CliEditOptions gOverwriteOpts;
CliEditOptions gInsertOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupLinesCommand(CLI::App& app) {
    auto* lines = app.add_subcommand("lines", "Load a file as trimmed lines");
    lines->alias("l");

    lines->add_option("-i,--input", gLinesOpts.input, "Input file")->required();

    lines->add_flag("--allow-empty", gLinesOpts.allowEmpty,
                    "Keep lines that are empty after trimming");

    lines->add_flag("--error-on-empty", gLinesOpts.errorOnEmpty,
                    "Fail when the file has no lines");

    lines->add_flag("--print", gLinesOpts.print, "Print the lines instead of the count");
}

void setupCatCommand(CLI::App& app) {
    auto* cat = app.add_subcommand("cat", "Read a file in parallel and copy it to stdout");

    cat->add_option("-i,--input", gCatOpts.input, "Input file")->required();
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Compare a parallel read with a sequential read");

    verify->add_option("-i,--input", gVerifyOpts.input, "Input file")->required();

    verify->add_flag("--verbose", gVerifyOpts.verbose, "Show the result of each check");
}

void setupPutCommand(CLI::App& app) {
    auto* put = app.add_subcommand("put", "Write data to a file");

    put->add_option("-o,--output", gPutOpts.output, "Output file")->required();

    put->add_option("-d,--data", gPutOpts.data, "Data to write")->required();

    put->add_option("--mode", gPutOpts.mode, "Write mode: APPEND or OVERWRITE")
        ->default_val("APPEND");

    put->add_flag("--mkdir", gPutOpts.mkdir, "Create missing parent directories");
}

void setupOffsetCommand(CLI::App& app, const std::string& name, const std::string& description,
                        CliEditOptions& opts) {
    auto* cmd = app.add_subcommand(name, description);

    cmd->add_option("-i,--input", opts.input, "Existing file")->required();

    cmd->add_option("--offset", opts.offset, "Byte offset (at most the file size)")
        ->required()
        ->check(CLI::NonNegativeNumber);

    cmd->add_option("-d,--data", opts.data, "Data to write")->required();
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for debug)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical")
        ->check(CLI::Validator(
            [](const std::string& value) -> std::string {
                return frw::log::levelFromString(value) ? std::string{}
                                                        : "unknown log level: " + value;
            },
            "LEVEL"));

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupLinesCommand(app);
    setupCatCommand(app);
    setupVerifyCommand(app);
    setupPutCommand(app);
    setupOffsetCommand(app, "overwrite", "Overwrite bytes of an existing file in place",
                       gOverwriteOpts);
    setupOffsetCommand(app, "insert", "Insert bytes into an existing file", gInsertOpts);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        auto logLevel = frw::log::Level::kWarning;
        if (gOptions.quiet) {
            logLevel = frw::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logLevel = frw::log::Level::kDebug;
        } else if (gOptions.verbosity >= 1) {
            logLevel = frw::log::Level::kInfo;
        }
        if (!gOptions.logLevel.empty()) {
            logLevel = frw::log::levelFromString(gOptions.logLevel).value_or(logLevel);
        }
        frw::log::init(gOptions.logFile, logLevel);
        FRW_LOG_DEBUG("Logging at {} level", frw::log::levelToString(logLevel));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("lines")) {
            exitCode = frw::commands::runLines(app.get_subcommand("lines"));
        } else if (app.got_subcommand("cat")) {
            exitCode = frw::commands::runCat(app.get_subcommand("cat"));
        } else if (app.got_subcommand("verify")) {
            exitCode = frw::commands::runVerify(app.get_subcommand("verify"));
        } else if (app.got_subcommand("put")) {
            exitCode = frw::commands::runEdit(app.get_subcommand("put"),
                                              frw::commands::EditAction::kPut);
        } else if (app.got_subcommand("overwrite")) {
            exitCode = frw::commands::runEdit(app.get_subcommand("overwrite"),
                                              frw::commands::EditAction::kOverwrite);
        } else if (app.got_subcommand("insert")) {
            exitCode = frw::commands::runEdit(app.get_subcommand("insert"),
                                              frw::commands::EditAction::kInsert);
        }
    } catch (const frw::FRWException& ex) {
        FRW_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        FRW_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    frw::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace frw::commands {

int runLines([[maybe_unused]] CLI::App* app) {
    LoadOptions opts;
    opts.inputPath = gLinesOpts.input;
    opts.output = LoadOutput::kLines;
    opts.allowEmptyLines = gLinesOpts.allowEmpty;
    opts.errorOnEmptyFile = gLinesOpts.errorOnEmpty;
    opts.printLines = gLinesOpts.print;

    auto cmd = std::make_unique<LoadCommand>(std::move(opts), std::cout);
    return cmd->execute();
}

int runCat([[maybe_unused]] CLI::App* app) {
    LoadOptions opts;
    opts.inputPath = gCatOpts.input;
    opts.output = LoadOutput::kRaw;

    auto cmd = std::make_unique<LoadCommand>(std::move(opts), std::cout);
    return cmd->execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    VerifyOptions opts;
    opts.inputPath = gVerifyOpts.input;
    opts.verbose = gVerifyOpts.verbose;

    auto cmd = std::make_unique<VerifyCommand>(std::move(opts), std::cout);
    return cmd->execute();
}

int runEdit([[maybe_unused]] CLI::App* app, EditAction action) {
    EditOptions opts;
    opts.action = action;
    if (action == EditAction::kPut) {
        opts.path = gPutOpts.output;
        opts.data = gPutOpts.data;
        opts.mode = gPutOpts.mode;
        opts.createParents = gPutOpts.mkdir;
    } else {
        const auto& src = (action == EditAction::kOverwrite) ? gOverwriteOpts : gInsertOpts;
        opts.path = src.input;
        opts.data = src.data;
        opts.offset = src.offset;
    }

    auto cmd = std::make_unique<EditCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace frw::commands
