#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <purebuf/fields/purebuf_serializer.hpp>
#include <purebuf/serdes/purebuf_varint.hpp>
#include <type_traits>

namespace Purebuf::fields {

/**
 * @brief bool, written as a varint 0 or 1. Any non-zero varint reads as true.
 */
struct Bool {
    using ValueType = bool;
    static constexpr WireType wire_type = WireType::Varint;

    [[nodiscard]] static constexpr auto Validate(ValueType,
                                                 FieldNumber) noexcept
        -> std::optional<Error> {
        return std::nullopt;
    }

    static void Dump(ValueType value, OutputStream& out) {
        out.write_varint(value ? 1 : 0);
    }

    [[nodiscard]] static auto Load(InputStream& in) noexcept
        -> std::expected<ValueType, Error> {
        const auto raw = in.read_varint();
        if (!raw) {
            return std::unexpected(raw.error());
        }
        return *raw != 0;
    }
};

/**
 * @brief Signed integer written as the two's-complement bit pattern in a
 * varint (int32/int64). Negative values always take 10 bytes.
 *
 * @tparam T int32_t or int64_t. int32 values are sign-extended to 64 bits.
 */
template <typename T>
    requires std::same_as<T, int32_t> || std::same_as<T, int64_t>
struct TwosComplementVarint {
    using ValueType = T;
    static constexpr WireType wire_type = WireType::Varint;

    [[nodiscard]] static constexpr auto Validate(ValueType,
                                                 FieldNumber) noexcept
        -> std::optional<Error> {
        return std::nullopt;
    }

    static void Dump(ValueType value, OutputStream& out) {
        out.write_varint(static_cast<uint64_t>(static_cast<int64_t>(value)));
    }

    [[nodiscard]] static auto Load(InputStream& in) noexcept
        -> std::expected<ValueType, Error> {
        const auto raw = in.read_varint();
        if (!raw) {
            return std::unexpected(raw.error());
        }
        const auto wide = std::bit_cast<int64_t>(*raw);
        if (wide < std::numeric_limits<T>::min() ||
            wide > std::numeric_limits<T>::max()) {
            return std::unexpected(
                Error::deserialization("varint exceeds integer width"));
        }
        return static_cast<T>(wide);
    }
};

/**
 * @brief Unsigned integer written as a plain varint (uint32/uint64).
 */
template <typename T>
    requires std::same_as<T, uint32_t> || std::same_as<T, uint64_t>
struct UnsignedVarint {
    using ValueType = T;
    static constexpr WireType wire_type = WireType::Varint;

    [[nodiscard]] static constexpr auto Validate(ValueType,
                                                 FieldNumber) noexcept
        -> std::optional<Error> {
        return std::nullopt;
    }

    static void Dump(ValueType value, OutputStream& out) {
        out.write_varint(value);
    }

    [[nodiscard]] static auto Load(InputStream& in) noexcept
        -> std::expected<ValueType, Error> {
        const auto raw = in.read_varint();
        if (!raw) {
            return std::unexpected(raw.error());
        }
        if (*raw > std::numeric_limits<T>::max()) {
            return std::unexpected(
                Error::deserialization("varint exceeds integer width"));
        }
        return static_cast<T>(*raw);
    }
};

/**
 * @brief Signed integer written as a ZigZag varint (sint32/sint64).
 */
template <typename T>
    requires std::same_as<T, int32_t> || std::same_as<T, int64_t>
struct ZigZagVarint {
    using ValueType = T;
    static constexpr WireType wire_type = WireType::Varint;

    [[nodiscard]] static constexpr auto Validate(ValueType,
                                                 FieldNumber) noexcept
        -> std::optional<Error> {
        return std::nullopt;
    }

    static void Dump(ValueType value, OutputStream& out) {
        out.write_varint(serdes::ZigZag::encode(value));
    }

    [[nodiscard]] static auto Load(InputStream& in) noexcept
        -> std::expected<ValueType, Error> {
        const auto raw = in.read_varint();
        if (!raw) {
            return std::unexpected(raw.error());
        }
        if (*raw > std::numeric_limits<std::make_unsigned_t<T>>::max()) {
            return std::unexpected(
                Error::deserialization("varint exceeds integer width"));
        }
        return static_cast<T>(serdes::ZigZag::decode(*raw));
    }
};

/**
 * @brief Raw little-endian 4 or 8 byte value (fixed32/64, sfixed32/64,
 * float, double).
 */
template <typename T>
    requires(std::integral<T> || std::floating_point<T>) &&
            (sizeof(T) == 4 || sizeof(T) == 8) && (!std::same_as<T, bool>)
struct FixedWidth {
    using ValueType = T;
    static constexpr WireType wire_type =
        sizeof(T) == 4 ? WireType::Fixed32 : WireType::Fixed64;

    [[nodiscard]] static constexpr auto Validate(ValueType,
                                                 FieldNumber) noexcept
        -> std::optional<Error> {
        return std::nullopt;
    }

    static void Dump(ValueType value, OutputStream& out) {
        out.write_fixed(value);
    }

    [[nodiscard]] static auto Load(InputStream& in) noexcept
        -> std::expected<ValueType, Error> {
        return in.read_fixed<T>();
    }
};

using Int32 = TwosComplementVarint<int32_t>;
using Int64 = TwosComplementVarint<int64_t>;
using UInt32 = UnsignedVarint<uint32_t>;
using UInt64 = UnsignedVarint<uint64_t>;
using SInt32 = ZigZagVarint<int32_t>;
using SInt64 = ZigZagVarint<int64_t>;
using Fixed32 = FixedWidth<uint32_t>;
using Fixed64 = FixedWidth<uint64_t>;
using SFixed32 = FixedWidth<int32_t>;
using SFixed64 = FixedWidth<int64_t>;
using Float = FixedWidth<float>;
using Double = FixedWidth<double>;

/**
 * @brief Plain host integer. Not a protobuf scalar: written as a
 * two's-complement varint, so it only interoperates with int64 peers.
 */
using Int = Int64;

/**
 * @brief Plain host unsigned integer, written as an unsigned varint.
 */
using UInt = UInt64;

}  // namespace Purebuf::fields
