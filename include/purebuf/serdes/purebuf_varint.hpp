#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

namespace Purebuf::serdes {

/**
 * @brief Base-128 varint codec used for tags, lengths and varint payloads.
 *
 * Little-endian groups of 7 bits; the high bit of a byte says another byte
 * follows. Every function is constexpr so encodings can be checked at compile
 * time.
 */
struct Varint {
    /**
     * @brief Longest encoding of a uint64_t: ceil(64 / 7) bytes.
     */
    // cppcheck-suppress unusedStructMember
    static constexpr std::size_t max_size = 10;

    /**
     * @brief Writes value at output[offset...].
     *
     * @return Bytes written (1 to max_size). The caller provides room for
     * size(value) bytes.
     */
    static constexpr std::size_t encode(uint64_t value,
                                        std::span<std::byte> output,
                                        std::size_t offset) noexcept {
        std::size_t pos = offset;
        for (; value >= 0x80; value >>= 7) {
            output[pos++] = static_cast<std::byte>((value & 0x7F) | 0x80);
        }
        output[pos++] = static_cast<std::byte>(value);
        return pos - offset;
    }

    /**
     * @brief Reads one varint starting at input[offset].
     *
     * @return The value and the number of bytes consumed, or std::nullopt when
     * the input ends first, the encoding runs past max_size bytes, or the
     * tenth byte sets any bit other than bit 63 of the result.
     */
    static constexpr std::optional<std::pair<uint64_t, std::size_t>> decode(
        std::span<const std::byte> input, std::size_t offset) noexcept {
        uint64_t value = 0;
        for (std::size_t i = 0; i < max_size; ++i) {
            if (offset + i >= input.size()) {
                return std::nullopt;
            }
            const auto byte = static_cast<uint8_t>(input[offset + i]);
            const std::size_t shift = 7 * i;
            if (i == max_size - 1 && (byte & 0x7E) != 0) {
                return std::nullopt;
            }
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return std::make_pair(value, i + 1);
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Encoded length of value in bytes.
     */
    static constexpr std::size_t size(uint64_t value) noexcept {
        std::size_t bytes = 1;
        while (value >= 0x80) {
            value >>= 7;
            ++bytes;
        }
        return bytes;
    }
};

/**
 * @brief ZigZag mapping used by sint32/sint64.
 *
 * Maps 0, -1, 1, -2, 2 ... to 0, 1, 2, 3, 4 ... so small magnitudes of either
 * sign get short varints. The 64-bit mapping agrees with the 32-bit one on
 * every int32 value.
 */
struct ZigZag {
    [[nodiscard]] static constexpr uint64_t encode(int64_t value) noexcept {
        return (static_cast<uint64_t>(value) << 1) ^
               static_cast<uint64_t>(value >> 63);
    }

    [[nodiscard]] static constexpr int64_t decode(uint64_t value) noexcept {
        return static_cast<int64_t>(value >> 1) ^
               -static_cast<int64_t>(value & 1);
    }
};

}  // namespace Purebuf::serdes
