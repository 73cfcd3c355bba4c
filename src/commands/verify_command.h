// =============================================================================
// lrf - Verify Command
// =============================================================================
// Command handler for verifying region file integrity.
//
// Each input is decoded with the region reader. In strict mode any violation
// fails the file; in lenient mode the file passes when it can be salvaged,
// and every dropped slot is reported as a failed check.
//
// Exit code is the error category of the first failure (0 when all pass).
// =============================================================================

#ifndef LRF_COMMANDS_VERIFY_COMMAND_H
#define LRF_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "lrf/common/error.h"

namespace lrf::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    /// @brief Check name (file, or file and slot).
    std::string checkName;

    bool passed = false;

    /// @brief Error category of a failed check.
    ErrorCode code = ErrorCode::kSuccess;

    std::string errorMessage;

    /// @brief Additional details.
    std::string details;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;

    /// @brief Category of the first failed check.
    ErrorCode firstFailure = ErrorCode::kSuccess;

    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
            if (firstFailure == ErrorCode::kSuccess) {
                firstFailure = result.code;
            }
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for verify command.
struct VerifyOptions {
    /// @brief Region files to verify.
    std::vector<std::filesystem::path> inputPaths;

    /// @brief Salvage damaged files instead of failing them outright.
    bool lenient = false;

    /// @brief Stop on first failed file.
    bool failFast = false;

    /// @brief Print every check, not only failures.
    bool verbose = false;

    /// @brief Print failures only.
    bool quiet = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for verifying region file integrity.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    ~VerifyCommand();

    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = all files passed).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    /// @brief Verify one file, appending its results.
    /// @return false if the file failed.
    bool verifyFile(const std::filesystem::path& path);

    void report(const VerificationResult& result) const;

    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

/// @brief Create a verify command from CLI options.
[[nodiscard]] std::unique_ptr<VerifyCommand> createVerifyCommand(
    const std::vector<std::string>& inputPaths,
    bool lenient,
    bool failFast,
    bool verbose,
    bool quiet = false);

}  // namespace lrf::commands

#endif  // LRF_COMMANDS_VERIFY_COMMAND_H
