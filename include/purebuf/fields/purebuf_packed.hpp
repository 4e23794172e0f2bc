#pragma once

#include <cstddef>
#include <optional>
#include <purebuf/fields/purebuf_serializer.hpp>
#include <utility>
#include <vector>

namespace Purebuf::fields {

/**
 * @brief Packing helper: a sequence of scalar values written as one
 * length-delimited block of back-to-back payloads with no per-element tag.
 *
 * Not a serializer itself. PackedRepeatedField writes through Dump, and both
 * repeated variants read packed blocks through LoadAppend.
 *
 * @tparam S The element serializer. Must not be length-delimited itself.
 */
template <PackableSerializer S>
struct Packed {
    using ElementType = typename S::ValueType;

    /**
     * @brief Writes the length prefix and the untagged elements. The caller
     * writes the tag.
     */
    static void Dump(const std::vector<ElementType>& values,
                     OutputStream& out) {
        const std::size_t len_offset = out.begin_length_delimited();
        for (const auto& value : values) {
            S::Dump(value, out);
        }
        out.end_length_delimited(len_offset);
    }

    /**
     * @brief Reads one packed block and appends its elements to values.
     *
     * On error values keeps the elements read before the bad one; callers
     * decode into a scratch message.
     */
    [[nodiscard]] static auto LoadAppend(InputStream& in,
                                         std::vector<ElementType>& values)
        -> std::optional<Error> {
        const auto block = in.read_length_delimited();
        if (!block) {
            return block.error();
        }
        InputStream elements = in.bounded(*block);
        while (!elements.at_end()) {
            auto value = S::Load(elements);
            if (!value) {
                return value.error();
            }
            values.push_back(std::move(*value));
        }
        return std::nullopt;
    }
};

}  // namespace Purebuf::fields
