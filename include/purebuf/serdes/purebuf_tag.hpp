#pragma once

#include <cstdint>
#include <expected>
#include <purebuf/core/purebuf_types.hpp>
#include <string_view>
#include <utility>

namespace Purebuf {

/**
 * @brief Payload framing selected by the low 3 bits of a tag.
 *
 * Group framing (3 and 4) is deprecated and not supported.
 */
enum class WireType : uint8_t {
    Varint = 0,
    Fixed64 = 1,
    LengthDelimited = 2,
    Fixed32 = 5,
};

inline std::string_view to_string(WireType wire_type) {
    switch (wire_type) {
        case WireType::Varint:
            return "varint";
        case WireType::Fixed64:
            return "fixed64";
        case WireType::LengthDelimited:
            return "length-delimited";
        case WireType::Fixed32:
            return "fixed32";
    }
    return "unknown";
}

namespace serdes {

/**
 * @brief Number of bits used for the wire type in a tag.
 */
static constexpr std::size_t WireTypeBits = 3;

/**
 * @brief Builds the tag value (FieldNumber << 3) | WireType.
 */
[[nodiscard]] constexpr uint32_t MakeTag(FieldNumber number,
                                         WireType wire_type) noexcept {
    return (static_cast<uint32_t>(number) << WireTypeBits) |
           static_cast<uint8_t>(wire_type);
}

/**
 * @brief Splits a raw tag into field number and wire type.
 *
 * @param raw The tag as read from the wire.
 * @return The (number, wire type) pair, or an Error for field number 0, a
 * number above MaxFieldNumber, or an unsupported wire type.
 */
[[nodiscard]] constexpr auto ParseTag(uint64_t raw) noexcept
    -> std::expected<std::pair<FieldNumber, WireType>, Error> {
    const uint64_t number = raw >> WireTypeBits;
    if (number == 0) {
        return std::unexpected(Error::deserialization("field number 0"));
    }
    if (number > static_cast<uint64_t>(MaxFieldNumber)) {
        return std::unexpected(
            Error::deserialization("field number out of range"));
    }

    const auto wire_type = static_cast<WireType>(raw & 0x07);
    switch (wire_type) {
        case WireType::Varint:
        case WireType::Fixed64:
        case WireType::LengthDelimited:
        case WireType::Fixed32:
            return std::make_pair(static_cast<FieldNumber>(number), wire_type);
    }
    return std::unexpected(Error::deserialization("unsupported wire type"));
}

}  // namespace serdes
}  // namespace Purebuf
