// =============================================================================
// lrf - Atomic File Replacement
// =============================================================================
// Write-to-temporary-then-rename persistence for region files.
//
// This module provides:
// - AtomicFile: owns "<target>.wip" while bytes are written; commit() makes
//   the new content visible under the target name in a single rename
// - writeFileAtomically(): one-shot helper used by the region writer
// - Signal handling that removes in-flight temporaries on SIGINT/SIGTERM
//
// Guarantees:
// - Readers of the target observe either the old file or the complete new
//   one, never a partial write
// - On any failure the temporary is removed and the target is untouched
// - With sync enabled, the temporary is fsync'd before the rename and the
//   parent directory is fsync'd after it
//
// Usage:
//   AtomicFile file("world/region/r.0.0.linear");
//   file.write(bytes);
//   file.commit(true);
// =============================================================================

#ifndef LRF_IO_ATOMIC_FILE_H
#define LRF_IO_ATOMIC_FILE_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <span>

namespace lrf::io {

class AtomicFile;

// =============================================================================
// Signal Handler Management
// =============================================================================

/// @brief Register a file for signal-based cleanup.
void registerForCleanup(AtomicFile* file);

/// @brief Unregister a file from signal-based cleanup.
void unregisterFromCleanup(AtomicFile* file);

/// @brief Install SIGINT/SIGTERM handlers that abort registered files.
/// @note Idempotent and thread-safe.
void installSignalHandlers();

// =============================================================================
// AtomicFile
// =============================================================================

/// @brief Temporary file that atomically replaces its target on commit.
/// @note Non-copyable, non-movable (registered with the signal handler).
class AtomicFile {
public:
    /// @brief Create "<target>.wip", truncating any stale temporary.
    /// @throws IOError if the temporary cannot be created.
    explicit AtomicFile(std::filesystem::path target);

    /// @brief Removes the temporary unless commit() succeeded.
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;
    AtomicFile(AtomicFile&&) = delete;
    AtomicFile& operator=(AtomicFile&&) = delete;

    /// @brief Append bytes to the temporary.
    /// @throws IOError on short or failed writes (the file is aborted).
    void write(std::span<const std::uint8_t> data);

    /// @brief Flush, optionally fsync, and rename over the target.
    /// @param syncToDisk fsync the file before and the directory after the rename.
    /// @throws IOError on failure (the temporary is removed).
    void commit(bool syncToDisk);

    /// @brief Discard the temporary. Safe to call more than once.
    void abort() noexcept;

    /// @brief Async-signal-safe abort: closes the descriptor and unlinks the
    /// temporary without logging or allocating.
    void discardOnSignal() noexcept;

    [[nodiscard]] const std::filesystem::path& targetPath() const noexcept { return target_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return temp_; }

    [[nodiscard]] bool isCommitted() const noexcept { return committed_; }

    [[nodiscard]] bool isAborted() const noexcept { return aborted_; }

private:
    void closeDescriptor() noexcept;

    std::filesystem::path target_;
    std::filesystem::path temp_;
    int fd_ = -1;
    bool committed_ = false;
    std::atomic<bool> aborted_{false};
};

/// @brief Replace `target` with `data` atomically.
/// @throws IOError on any storage failure; `target` is left untouched.
void writeFileAtomically(const std::filesystem::path& target,
                         std::span<const std::uint8_t> data,
                         bool syncToDisk);

}  // namespace lrf::io

#endif  // LRF_IO_ATOMIC_FILE_H
