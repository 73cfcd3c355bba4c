// =============================================================================
// lrf - Index Table Codec Implementation
// =============================================================================

#include "lrf/format/index_codec.h"

#include <format>
#include <limits>
#include <type_traits>

#include "lrf/common/error.h"
#include "lrf/io/byte_buffer.h"

namespace lrf::format {

namespace {

std::vector<IndexEntry> decodeEntries(io::ByteReader& in, std::size_t count,
                                      LegacyIndexLayout /*layout*/) {
    std::vector<IndexEntry> entries(count);
    std::uint64_t running = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const auto length = in.readBE<std::int32_t>();
        const auto timestamp = in.readBE<std::int32_t>();

        IndexEntry& entry = entries[i];
        entry.offset = running;
        entry.timestamp = timestamp;
        if (length < 0) {
            entry.length = std::numeric_limits<std::uint64_t>::max();
        } else {
            entry.length = static_cast<std::uint64_t>(length);
            running += entry.length;
        }
    }
    return entries;
}

std::vector<IndexEntry> decodeEntries(io::ByteReader& in, std::size_t count,
                                      ExtendedIndexLayout /*layout*/) {
    std::vector<IndexEntry> entries(count);
    for (auto& entry : entries) {
        entry.offset = in.readBE<std::uint32_t>();
        entry.length = in.readBE<std::uint32_t>();
        entry.timestamp = in.readBE<std::int64_t>();
        entry.checksum = in.readBE<std::uint64_t>();
    }
    return entries;
}

[[noreturn]] void throwOutOfRange(std::size_t slot, std::string_view field, std::string_view layout) {
    throw FormatError(FormatErrorKind::kValueOutOfRange,
                      std::format("{} of slot {} does not fit the {} index layout", field, slot,
                                  layout),
                      ErrorContext{}.withSlot(static_cast<std::uint32_t>(slot)));
}

void encodeEntries(io::ByteWriter& out, std::span<const IndexEntry> entries,
                   LegacyIndexLayout layout) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const IndexEntry& entry = entries[i];
        if (entry.length > layout.kMaxLength) {
            throwOutOfRange(i, "length", layout.kName);
        }
        if (entry.timestamp < layout.kMinTimestamp || entry.timestamp > layout.kMaxTimestamp) {
            throwOutOfRange(i, "timestamp", layout.kName);
        }
        out.writeBE<std::int32_t>(static_cast<std::int32_t>(entry.length));
        out.writeBE<std::int32_t>(static_cast<std::int32_t>(entry.timestamp));
    }
}

void encodeEntries(io::ByteWriter& out, std::span<const IndexEntry> entries,
                   ExtendedIndexLayout layout) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const IndexEntry& entry = entries[i];
        if (entry.length > layout.kMaxLength) {
            throwOutOfRange(i, "length", layout.kName);
        }
        if (entry.offset > std::numeric_limits<std::uint32_t>::max()) {
            throwOutOfRange(i, "offset", layout.kName);
        }
        out.writeBE<std::uint32_t>(static_cast<std::uint32_t>(entry.offset));
        out.writeBE<std::uint32_t>(static_cast<std::uint32_t>(entry.length));
        out.writeBE<std::int64_t>(entry.timestamp);
        out.writeBE<std::uint64_t>(entry.checksum);
    }
}

}  // namespace

std::vector<IndexEntry> decodeIndex(std::span<const std::uint8_t> bytes,
                                    const IndexLayout& layout,
                                    std::size_t count) {
    const std::size_t required = entrySize(layout) * count;
    if (bytes.size() < required) {
        throw FormatError(FormatErrorKind::kTruncated,
                          std::format("payload of {} bytes is shorter than the {} index ({} bytes)",
                                      bytes.size(), layoutName(layout), required));
    }

    io::ByteReader in(bytes.first(required));
    return std::visit([&](auto l) { return decodeEntries(in, count, l); }, layout);
}

std::vector<std::uint8_t> encodeIndex(std::span<const IndexEntry> entries,
                                      const IndexLayout& layout) {
    io::ByteWriter out(entrySize(layout) * entries.size());
    std::visit([&](auto l) { encodeEntries(out, entries, l); }, layout);
    return out.release();
}

}  // namespace lrf::format
