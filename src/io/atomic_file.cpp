// =============================================================================
// lrf - Atomic File Replacement Implementation
// =============================================================================

#include "lrf/io/atomic_file.h"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <mutex>
#include <set>
#include <system_error>
#include <utility>

#include "lrf/common/error.h"
#include "lrf/common/logger.h"
#include "lrf/common/types.h"

namespace lrf::io {

// =============================================================================
// Signal Handler Management
// =============================================================================

namespace {

std::mutex gSignalMutex;

/// @brief Files whose temporaries must be removed on interruption.
std::set<AtomicFile*> gRegisteredFiles;

std::atomic<bool> gSignalHandlersInstalled{false};

void (*gPreviousSigintHandler)(int) = nullptr;

void (*gPreviousSigtermHandler)(int) = nullptr;

// Only close(2) and unlink(2) run here. If the interrupted thread holds the
// registry lock, the temporaries are left for the next run to truncate.
void signalHandler(int signum) {
    if (gSignalMutex.try_lock()) {
        for (auto* file : gRegisteredFiles) {
            if (file != nullptr) {
                file->discardOnSignal();
            }
        }
        gSignalMutex.unlock();
    }

    if (signum == SIGINT && gPreviousSigintHandler != nullptr &&
        gPreviousSigintHandler != SIG_DFL && gPreviousSigintHandler != SIG_IGN) {
        gPreviousSigintHandler(signum);
    } else if (signum == SIGTERM && gPreviousSigtermHandler != nullptr &&
               gPreviousSigtermHandler != SIG_DFL && gPreviousSigtermHandler != SIG_IGN) {
        gPreviousSigtermHandler(signum);
    } else {
        std::signal(signum, SIG_DFL);
        std::raise(signum);
    }
}

std::error_code lastError() {
    return {errno, std::generic_category()};
}

/// @brief fsync the directory holding `path` so the rename itself is durable.
void syncParentDirectory(const std::filesystem::path& path) {
    std::filesystem::path parent = path.parent_path();
    if (parent.empty()) {
        parent = ".";
    }

    const int dirFd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        throw IOError("Failed to open directory for sync", lastError(),
                      ErrorContext(parent.string()));
    }
    if (::fsync(dirFd) != 0) {
        auto ec = lastError();
        ::close(dirFd);
        throw IOError("Failed to sync directory", ec, ErrorContext(parent.string()));
    }
    ::close(dirFd);
}

}  // namespace

void registerForCleanup(AtomicFile* file) {
    std::lock_guard<std::mutex> lock(gSignalMutex);
    gRegisteredFiles.insert(file);
}

void unregisterFromCleanup(AtomicFile* file) {
    std::lock_guard<std::mutex> lock(gSignalMutex);
    gRegisteredFiles.erase(file);
}

void installSignalHandlers() {
    bool expected = false;
    if (!gSignalHandlersInstalled.compare_exchange_strong(expected, true)) {
        return;
    }

    std::lock_guard<std::mutex> lock(gSignalMutex);

    gPreviousSigintHandler = std::signal(SIGINT, signalHandler);
    if (gPreviousSigintHandler == SIG_ERR) {
        LRF_LOG_WARNING("Failed to install SIGINT handler");
        gPreviousSigintHandler = nullptr;
    }

    gPreviousSigtermHandler = std::signal(SIGTERM, signalHandler);
    if (gPreviousSigtermHandler == SIG_ERR) {
        LRF_LOG_WARNING("Failed to install SIGTERM handler");
        gPreviousSigtermHandler = nullptr;
    }

    LRF_LOG_DEBUG("Signal handlers installed for SIGINT and SIGTERM");
}

// =============================================================================
// AtomicFile Implementation
// =============================================================================

AtomicFile::AtomicFile(std::filesystem::path target)
    : target_(std::move(target)), temp_(target_.string() + std::string(kWorkInProgressSuffix)) {
    installSignalHandlers();

    fd_ = ::open(temp_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw IOError("Failed to create temporary file", lastError(),
                      ErrorContext(temp_.string()));
    }

    registerForCleanup(this);

    LRF_LOG_DEBUG("AtomicFile created: target={}, temp={}", target_.string(), temp_.string());
}

AtomicFile::~AtomicFile() {
    unregisterFromCleanup(this);

    if (!committed_ && !aborted_) {
        abort();
    }
    closeDescriptor();
}

void AtomicFile::write(std::span<const std::uint8_t> data) {
    if (committed_ || aborted_) {
        throw IOError("Write to a committed or aborted file", ErrorContext(temp_.string()));
    }

    const std::uint8_t* cursor = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        const ssize_t written = ::write(fd_, cursor, left);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto ec = lastError();
            abort();
            throw IOError("Failed to write temporary file", ec, ErrorContext(temp_.string()));
        }
        cursor += written;
        left -= static_cast<std::size_t>(written);
    }
}

void AtomicFile::commit(bool syncToDisk) {
    if (aborted_) {
        throw IOError("Cannot commit aborted file", ErrorContext(temp_.string()));
    }
    if (committed_) {
        return;
    }

    if (syncToDisk && ::fsync(fd_) != 0) {
        auto ec = lastError();
        abort();
        throw IOError("Failed to sync temporary file", ec, ErrorContext(temp_.string()));
    }

    if (::close(fd_) != 0) {
        fd_ = -1;
        auto ec = lastError();
        abort();
        throw IOError("Failed to close temporary file", ec, ErrorContext(temp_.string()));
    }
    fd_ = -1;

    std::error_code ec;
    std::filesystem::rename(temp_, target_, ec);
    if (ec) {
        abort();
        throw IOError("Failed to rename temporary file to target", ec,
                      ErrorContext(target_.string()));
    }
    committed_ = true;
    unregisterFromCleanup(this);

    if (syncToDisk) {
        syncParentDirectory(target_);
    }

    LRF_LOG_DEBUG("AtomicFile committed: {}", target_.string());
}

void AtomicFile::abort() noexcept {
    bool expected = false;
    if (!aborted_.compare_exchange_strong(expected, true)) {
        return;
    }

    closeDescriptor();

    std::error_code ec;
    if (std::filesystem::exists(temp_, ec)) {
        std::filesystem::remove(temp_, ec);
        if (ec) {
            LRF_LOG_WARNING("Failed to remove temporary file: {}", temp_.string());
        }
    }

    LRF_LOG_DEBUG("AtomicFile aborted: {}", temp_.string());
}

void AtomicFile::discardOnSignal() noexcept {
    bool expected = false;
    if (!aborted_.compare_exchange_strong(expected, true)) {
        return;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    ::unlink(temp_.c_str());
}

void AtomicFile::closeDescriptor() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void writeFileAtomically(const std::filesystem::path& target,
                         std::span<const std::uint8_t> data,
                         bool syncToDisk) {
    AtomicFile file(target);
    file.write(data);
    file.commit(syncToDisk);
}

}  // namespace lrf::io
