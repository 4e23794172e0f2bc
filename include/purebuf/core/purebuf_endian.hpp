#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>

namespace Purebuf {

/**
 * @brief Converts a value to/from Little Endian byte order.
 *
 * @tparam T The type of the value to convert. Must be an integral or
 * floating-point type.
 * @param value The value to convert.
 * @return The converted value.
 */
template <typename T>
    requires std::integral<T> || std::floating_point<T>
[[nodiscard]] constexpr T LittleEndian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else if constexpr (std::integral<T>) {
        return std::byteswap(value);
    } else {
        auto bits = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
        std::ranges::reverse(bits);
        return std::bit_cast<T>(bits);
    }
}

/**
 * @brief Writes the little-endian layout of a fixed-width value.
 */
template <typename T>
    requires std::integral<T> || std::floating_point<T>
constexpr void StoreLittleEndian(T value,
                                 std::span<std::byte, sizeof(T)> out) noexcept {
    const auto bytes =
        std::bit_cast<std::array<std::byte, sizeof(T)>>(LittleEndian(value));
    std::ranges::copy(bytes, out.begin());
}

/**
 * @brief Reads a fixed-width value from its little-endian layout.
 */
template <typename T>
    requires std::integral<T> || std::floating_point<T>
[[nodiscard]] constexpr T LoadLittleEndian(
    std::span<const std::byte, sizeof(T)> in) noexcept {
    std::array<std::byte, sizeof(T)> bytes{};
    std::ranges::copy(in, bytes.begin());
    return LittleEndian(std::bit_cast<T>(bytes));
}

}  // namespace Purebuf
