// =============================================================================
// lrf - Region Checksums Implementation
// =============================================================================

#include "lrf/format/checksum.h"

#include <xxhash.h>

#include <memory>

#include "lrf/common/error.h"

namespace lrf::format {

namespace {

struct XxhStateDeleter {
    void operator()(XXH64_state_t* state) const noexcept { XXH64_freeState(state); }
};

}  // namespace

Checksum calculateXxHash64(std::span<const std::uint8_t> data, std::uint64_t seed) {
    return XXH64(data.data(), data.size(), seed);
}

Checksum calculateXxHash64(const std::vector<std::span<const std::uint8_t>>& segments,
                           std::uint64_t seed) {
    std::unique_ptr<XXH64_state_t, XxhStateDeleter> state(XXH64_createState());
    if (!state) {
        throw IOError("Failed to create xxHash64 state");
    }

    XXH64_reset(state.get(), seed);
    for (const auto& segment : segments) {
        if (!segment.empty()) {
            XXH64_update(state.get(), segment.data(), segment.size());
        }
    }
    return XXH64_digest(state.get());
}

Checksum calculateFileChecksum(std::span<const std::uint8_t> headerPrefix,
                               std::span<const std::uint8_t> payload) {
    const std::vector<std::span<const std::uint8_t>> segments{headerPrefix, payload};
    return calculateXxHash64(segments, 0);
}

Checksum calculateSlotChecksum(std::span<const std::uint8_t> chunk, Timestamp timestamp) {
    return calculateXxHash64(chunk, static_cast<std::uint64_t>(timestamp));
}

}  // namespace lrf::format
