// =============================================================================
// lrf - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <fmt/format.h>

#include <utility>

#include "lrf/common/logger.h"
#include "lrf/format/region_reader.h"

namespace lrf::commands {

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    if (options_.inputPaths.empty()) {
        LRF_LOG_ERROR("No input files given");
        return toExitCode(ErrorCode::kUsageError);
    }

    for (const auto& path : options_.inputPaths) {
        if (!verifyFile(path) && options_.failFast) {
            break;
        }
    }

    printSummary();
    return toExitCode(summary_.firstFailure);
}

bool VerifyCommand::verifyFile(const std::filesystem::path& path) {
    if (options_.verbose && !options_.quiet) {
        fmt::print("Verifying: {}\n", path.string());
    }

    format::ReadOptions readOptions;
    readOptions.mode = options_.lenient ? format::ReadMode::kLenient : format::ReadMode::kStrict;

    VerificationResult fileResult;
    fileResult.checkName = path.string();

    auto outcome = tryExecute([&] { return format::RegionReader(readOptions).readFile(path); });
    if (!outcome) {
        fileResult.passed = false;
        fileResult.code = outcome.error().code();
        fileResult.errorMessage = outcome.error().message();
        report(fileResult);
        summary_.addResult(std::move(fileResult));
        return false;
    }

    const auto& readReport = outcome->report;
    fileResult.passed = true;
    fileResult.details = fmt::format("{} chunks, checksum {}", outcome->region.chunkCount(),
                                     format::checksumStatusToString(readReport.checksum));
    report(fileResult);
    summary_.addResult(std::move(fileResult));

    bool clean = true;
    for (const auto& warning : readReport.warnings) {
        VerificationResult framingResult;
        framingResult.checkName = path.string() + " structure";
        framingResult.code = ErrorCode::kFormatError;
        framingResult.errorMessage = warning;
        report(framingResult);
        summary_.addResult(std::move(framingResult));
        clean = false;
    }

    if (readReport.checksum == format::ChecksumStatus::kMismatch) {
        VerificationResult checksumResult;
        checksumResult.checkName = path.string() + " file checksum";
        checksumResult.code = ErrorCode::kIntegrityError;
        checksumResult.errorMessage = fmt::format("computed {:016x}, stored {:016x}",
                                                  readReport.computedChecksum,
                                                  readReport.header.checksum);
        report(checksumResult);
        summary_.addResult(std::move(checksumResult));
        clean = false;
    }

    for (const auto& dropped : readReport.dropped) {
        VerificationResult slotResult;
        slotResult.checkName = fmt::format("{} slot ({}, {})", path.string(), dropped.x(),
                                           dropped.z());
        slotResult.code = dropped.reason == format::DropReason::kChecksumMismatch
                              ? ErrorCode::kIntegrityError
                              : ErrorCode::kFormatError;
        slotResult.errorMessage = fmt::format("{}: {}", format::dropReasonToString(dropped.reason),
                                              dropped.detail);
        report(slotResult);
        summary_.addResult(std::move(slotResult));
        clean = false;
    }
    return clean;
}

void VerifyCommand::report(const VerificationResult& result) const {
    if (!result.passed) {
        fmt::print("[FAIL] {}: {}\n", result.checkName, result.errorMessage);
    } else if (options_.verbose && !options_.quiet) {
        fmt::print("[PASS] {} ({})\n", result.checkName, result.details);
    }
}

void VerifyCommand::printSummary() const {
    if (options_.quiet) {
        return;
    }
    fmt::print("\n=== Verification Summary ===\n");
    fmt::print("Checks: {} total, {} passed, {} failed\n", summary_.totalChecks,
               summary_.passedChecks, summary_.failedChecks);
    fmt::print("Result: {}\n", summary_.passed() ? "PASS" : "FAIL");
}

std::unique_ptr<VerifyCommand> createVerifyCommand(const std::vector<std::string>& inputPaths,
                                                   bool lenient,
                                                   bool failFast,
                                                   bool verbose,
                                                   bool quiet) {
    VerifyOptions opts;
    opts.inputPaths.assign(inputPaths.begin(), inputPaths.end());
    opts.lenient = lenient;
    opts.failFast = failFast;
    opts.verbose = verbose;
    opts.quiet = quiet;
    return std::make_unique<VerifyCommand>(std::move(opts));
}

}  // namespace lrf::commands
