// =============================================================================
// lrf - zstd Compressor Implementation
// =============================================================================

#include <zstd.h>

#include <algorithm>
#include <format>
#include <string>

#include "lrf/algo/compressor.h"
#include "lrf/common/logger.h"
#include "lrf/common/types.h"

namespace lrf::algo {

namespace {

/// @brief RAII holder for a zstd decompression stream.
struct DStreamDeleter {
    void operator()(ZSTD_DStream* stream) const noexcept { ZSTD_freeDStream(stream); }
};

using DStreamPtr = std::unique_ptr<ZSTD_DStream, DStreamDeleter>;

}  // namespace

Result<std::vector<std::uint8_t>> ZstdCompressor::compress(std::span<const std::uint8_t> data,
                                                           int level) const {
    if (!isValidCompressionLevel(level)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kInvalidArgument,
            std::format("compression level {} outside [{}, {}]", level, kMinCompressionLevel,
                        kMaxCompressionLevel));
    }

    const std::size_t bound = ZSTD_compressBound(data.size());
    std::vector<std::uint8_t> compressed(bound);

    const std::size_t cSize =
        ZSTD_compress(compressed.data(), compressed.size(), data.data(), data.size(), level);
    if (ZSTD_isError(cSize)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError,
            "Zstd compression failed: " + std::string(ZSTD_getErrorName(cSize)));
    }

    compressed.resize(cSize);
    LRF_LOG_TRACE("zstd level {}: {} -> {} bytes", level, data.size(), cSize);
    return compressed;
}

Result<std::vector<std::uint8_t>> ZstdCompressor::decompress(std::span<const std::uint8_t> data,
                                                             std::size_t maxOutputSize) const {
    if (data.empty()) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kDecompressionError,
                                                    "Empty compressed blob");
    }

    // Reject frames that announce an oversized payload before allocating anything.
    const unsigned long long frameSize = ZSTD_getFrameContentSize(data.data(), data.size());
    if (frameSize == ZSTD_CONTENTSIZE_ERROR) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kDecompressionError,
                                                    "Invalid Zstd frame");
    }
    if (frameSize != ZSTD_CONTENTSIZE_UNKNOWN && frameSize > maxOutputSize) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kDecompressionError,
            std::format("Zstd frame declares {} bytes, limit is {}", frameSize, maxOutputSize));
    }

    DStreamPtr stream(ZSTD_createDStream());
    if (!stream) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kIOError,
                                                    "Failed to create Zstd stream");
    }
    const std::size_t initResult = ZSTD_initDStream(stream.get());
    if (ZSTD_isError(initResult)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError,
            "Zstd stream init failed: " + std::string(ZSTD_getErrorName(initResult)));
    }

    std::vector<std::uint8_t> output;
    if (frameSize != ZSTD_CONTENTSIZE_UNKNOWN) {
        output.reserve(static_cast<std::size_t>(frameSize));
    }

    std::vector<std::uint8_t> chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input{data.data(), data.size(), 0};
    std::size_t pending = 1;

    while (pending != 0) {
        ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
        const std::size_t before = input.pos;
        pending = ZSTD_decompressStream(stream.get(), &out, &input);
        if (ZSTD_isError(pending)) {
            return makeError<std::vector<std::uint8_t>>(
                ErrorCode::kDecompressionError,
                "Zstd decompression failed: " + std::string(ZSTD_getErrorName(pending)));
        }
        if (output.size() + out.pos > maxOutputSize) {
            return makeError<std::vector<std::uint8_t>>(
                ErrorCode::kDecompressionError,
                std::format("Decompressed payload exceeds limit of {} bytes", maxOutputSize));
        }
        output.insert(output.end(), chunk.begin(),
                      chunk.begin() + static_cast<std::ptrdiff_t>(out.pos));

        if (pending != 0 && input.pos == input.size && input.pos == before && out.pos == 0) {
            return makeError<std::vector<std::uint8_t>>(ErrorCode::kDecompressionError,
                                                        "Truncated Zstd frame");
        }
    }

    if (input.pos != input.size) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kDecompressionError,
            std::format("{} unexpected bytes after Zstd frame", input.size - input.pos));
    }

    if (frameSize != ZSTD_CONTENTSIZE_UNKNOWN && output.size() != frameSize) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kDecompressionError,
            std::format("Zstd decompressed size mismatch: expected {}, got {}", frameSize,
                        output.size()));
    }
    return output;
}

std::shared_ptr<const ICompressor> defaultCompressor() {
    static const auto instance = std::make_shared<const ZstdCompressor>();
    return instance;
}

}  // namespace lrf::algo
