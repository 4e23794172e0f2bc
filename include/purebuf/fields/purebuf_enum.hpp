#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <purebuf/fields/purebuf_scalar.hpp>
#include <purebuf/fields/purebuf_serializer.hpp>
#include <type_traits>

namespace Purebuf::fields {

/**
 * @brief Serializer for strongly-typed enums (backed by int32_t).
 *
 * Written as the member's ordinal in an int32 varint. C++ cannot enumerate
 * the members of an enum, so the declared member set is part of the type;
 * values outside it fail validation and are rejected on decode.
 *
 * @tparam E The enum type.
 * @tparam Members Every member of E that may appear on the wire.
 */
template <typename E, E... Members>
    requires std::is_enum_v<E> &&
             std::is_same_v<std::underlying_type_t<E>, int32_t> &&
             (sizeof...(Members) > 0)
struct Enum {
    using ValueType = E;
    static constexpr WireType wire_type = WireType::Varint;

    [[nodiscard]] static constexpr bool IsMember(ValueType value) noexcept {
        return ((value == Members) || ...);
    }

    [[nodiscard]] static constexpr auto Validate(ValueType value,
                                                 FieldNumber number) noexcept
        -> std::optional<Error> {
        if (!IsMember(value)) {
            return Error::validation(number, "value is not an enum member");
        }
        return std::nullopt;
    }

    static void Dump(ValueType value, OutputStream& out) {
        Int32::Dump(static_cast<int32_t>(value), out);
    }

    [[nodiscard]] static auto Load(InputStream& in) noexcept
        -> std::expected<ValueType, Error> {
        const auto ordinal = Int32::Load(in);
        if (!ordinal) {
            return std::unexpected(ordinal.error());
        }
        const auto value = static_cast<E>(*ordinal);
        if (!IsMember(value)) {
            return std::unexpected(
                Error::deserialization("unknown enum value"));
        }
        return value;
    }
};

}  // namespace Purebuf::fields
