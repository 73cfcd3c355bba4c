// =============================================================================
// lrf - Big-Endian Byte Buffers
// =============================================================================
// Bounds-checked primitives for encoding and decoding the fixed-width
// big-endian fields of the region file format.
//
// This module provides:
// - ByteWriter: appends big-endian integers and raw bytes to a vector
// - ByteReader: cursor over an immutable byte span; every read is checked
//   against the remaining length and throws FormatError(kTruncated) instead
//   of reading past the end
//
// Usage:
//   ByteWriter out;
//   out.writeBE<std::uint32_t>(42);
//   ByteReader in(out.bytes());
//   auto value = in.readBE<std::uint32_t>();
// =============================================================================

#ifndef LRF_IO_BYTE_BUFFER_H
#define LRF_IO_BYTE_BUFFER_H

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

#include "lrf/common/error.h"

namespace lrf::io {

/// @brief Reverse the byte order of an integral value.
template <std::integral T>
[[nodiscard]] constexpr T byteSwap(T value) noexcept {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
    } else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
    } else {
        static_assert(sizeof(T) == 8, "unsupported integer width");
        return static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
    }
}

/// @brief Convert between native and big-endian representation.
template <std::integral T>
[[nodiscard]] constexpr T toBigEndian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return byteSwap(value);
    } else {
        return value;
    }
}

// =============================================================================
// ByteWriter
// =============================================================================

/// @brief Growable output buffer with big-endian integer encoding.
class ByteWriter {
public:
    ByteWriter() = default;

    /// @brief Construct with reserved capacity.
    explicit ByteWriter(std::size_t reserveBytes) { buffer_.reserve(reserveBytes); }

    /// @brief Append an integer in big-endian order.
    template <std::integral T>
    void writeBE(T value) {
        const T encoded = toBigEndian(value);
        const auto* raw = reinterpret_cast<const std::uint8_t*>(&encoded);
        buffer_.insert(buffer_.end(), raw, raw + sizeof(T));
    }

    /// @brief Append raw bytes unchanged.
    void writeBytes(std::span<const std::uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return buffer_; }

    /// @brief Move the accumulated bytes out of the writer.
    [[nodiscard]] std::vector<std::uint8_t> release() noexcept { return std::move(buffer_); }

private:
    std::vector<std::uint8_t> buffer_;
};

// =============================================================================
// ByteReader
// =============================================================================

/// @brief Read cursor over a byte span.
/// @note Never reads outside the span; overruns throw FormatError(kTruncated).
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    /// @brief Read a big-endian integer and advance.
    template <std::integral T>
    [[nodiscard]] T readBE() {
        require(sizeof(T));
        T value;
        std::memcpy(&value, data_.data() + position_, sizeof(T));
        position_ += sizeof(T);
        return toBigEndian(value);
    }

    /// @brief Return a view of the next `count` bytes and advance.
    [[nodiscard]] std::span<const std::uint8_t> readBytes(std::size_t count) {
        require(count);
        auto view = data_.subspan(position_, count);
        position_ += count;
        return view;
    }

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - position_; }

private:
    void require(std::size_t count) const {
        if (count > remaining()) {
            throw FormatError(FormatErrorKind::kTruncated,
                              "unexpected end of data: need " + std::to_string(count) +
                                  " bytes, " + std::to_string(remaining()) + " available",
                              ErrorContext{}.withOffset(position_));
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t position_ = 0;
};

}  // namespace lrf::io

#endif  // LRF_IO_BYTE_BUFFER_H
