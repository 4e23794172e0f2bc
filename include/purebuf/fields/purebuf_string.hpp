#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <purebuf/fields/purebuf_serializer.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Purebuf::fields {

/**
 * @brief Checks that a byte sequence is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogates (U+D800..U+DFFF) and code points above
 * U+10FFFF.
 */
[[nodiscard]] constexpr bool IsValidUtf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<uint8_t>(text[i]);
        std::size_t extra = 0;
        uint32_t code_point = 0;
        uint32_t min_code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        } else {
            return false;
        }
        if (text.size() - i <= extra) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }
        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

/**
 * @brief Raw byte string, written length-delimited.
 */
struct Bytes {
    using ValueType = std::vector<std::byte>;
    static constexpr WireType wire_type = WireType::LengthDelimited;

    [[nodiscard]] static constexpr auto Validate(const ValueType&,
                                                 FieldNumber) noexcept
        -> std::optional<Error> {
        return std::nullopt;
    }

    static void Dump(const ValueType& value, OutputStream& out) {
        out.write_length_delimited(value);
    }

    [[nodiscard]] static auto Load(InputStream& in)
        -> std::expected<ValueType, Error> {
        const auto block = in.read_length_delimited();
        if (!block) {
            return std::unexpected(block.error());
        }
        return ValueType(block->begin(), block->end());
    }
};

/**
 * @brief UTF-8 text, written length-delimited.
 */
struct String {
    using ValueType = std::string;
    static constexpr WireType wire_type = WireType::LengthDelimited;

    [[nodiscard]] static constexpr auto Validate(const ValueType& value,
                                                 FieldNumber number) noexcept
        -> std::optional<Error> {
        if (!IsValidUtf8(value)) {
            return Error::validation(number, "string is not valid utf-8");
        }
        return std::nullopt;
    }

    static void Dump(const ValueType& value, OutputStream& out) {
        out.write_length_delimited(std::as_bytes(std::span{value}));
    }

    [[nodiscard]] static auto Load(InputStream& in)
        -> std::expected<ValueType, Error> {
        const auto block = in.read_length_delimited();
        if (!block) {
            return std::unexpected(block.error());
        }
        ValueType text(reinterpret_cast<const char*>(block->data()),
                       block->size());
        if (!IsValidUtf8(text)) {
            return std::unexpected(
                Error::deserialization("string is not valid utf-8"));
        }
        return text;
    }
};

}  // namespace Purebuf::fields
