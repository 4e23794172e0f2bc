#pragma once

#include <expected>
#include <optional>
#include <purebuf/fields/purebuf_serializer.hpp>
#include <purebuf/messages/purebuf_messages.hpp>
#include <purebuf/serdes/purebuf_wire_layout.hpp>
#include <utility>

namespace Purebuf::fields {

/**
 * @brief Embedded message serializer.
 *
 * Writes the nested message's own encoding inside a length prefix. Decoding
 * recurses into a stream bounded to that prefix, one nesting level deeper.
 * Repeated occurrences merge (see MergeableSerializer).
 *
 * @tparam M The nested message type.
 */
template <messages::ProtoMessage M>
struct Message {
    using ValueType = M;
    static constexpr WireType wire_type = WireType::LengthDelimited;

    [[nodiscard]] static auto Validate(const ValueType& value, FieldNumber)
        -> std::optional<Error> {
        return serdes::WireLayout::Validate(value);
    }

    static void Dump(const ValueType& value, OutputStream& out) {
        const std::size_t len_offset = out.begin_length_delimited();
        serdes::WireLayout::Dump(value, out);
        out.end_length_delimited(len_offset);
    }

    [[nodiscard]] static auto Load(InputStream& in)
        -> std::expected<ValueType, Error> {
        const auto block = in.read_length_delimited();
        if (!block) {
            return std::unexpected(block.error());
        }
        auto body = in.nested(*block);
        if (!body) {
            return std::unexpected(body.error());
        }
        ValueType value{};
        if (auto err = serdes::WireLayout::Load(*body, value)) {
            return std::unexpected(*err);
        }
        return value;
    }

    static void Merge(ValueType& into, const ValueType& from) {
        serdes::WireLayout::Merge(into, from);
    }
};

}  // namespace Purebuf::fields
