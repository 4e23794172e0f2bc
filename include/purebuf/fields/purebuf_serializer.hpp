#pragma once

#include <concepts>
#include <expected>
#include <optional>
#include <purebuf/core/purebuf_types.hpp>
#include <purebuf/serdes/purebuf_stream.hpp>
#include <purebuf/serdes/purebuf_tag.hpp>

namespace Purebuf::fields {

using serdes::InputStream;
using serdes::OutputStream;

/**
 * @brief Concept for a value serializer.
 *
 * A serializer is a stateless type pairing one WireType with the rules for
 * one kind of value. It is never instantiated: every field using it shares
 * the same static functions.
 *
 * - `ValueType`: the in-memory value.
 * - `wire_type`: the framing the value is written with.
 * - `Validate(value, number)`: rejects values outside the serializer's domain.
 * - `Dump(value, out)`: writes the payload (no tag).
 * - `Load(in)`: reads one payload (no tag).
 */
template <typename S>
concept Serializer =
    requires(const typename S::ValueType& value, FieldNumber number,
             OutputStream& out, InputStream& in) {
        { S::wire_type } -> std::convertible_to<WireType>;
        { S::Validate(value, number) } -> std::same_as<std::optional<Error>>;
        { S::Dump(value, out) } -> std::same_as<void>;
        {
            S::Load(in)
        } -> std::same_as<std::expected<typename S::ValueType, Error>>;
    };

/**
 * @brief Serializers whose repeated occurrences merge instead of replacing
 * (embedded messages).
 */
template <typename S>
concept MergeableSerializer =
    Serializer<S> && requires(typename S::ValueType& into,
                              const typename S::ValueType& from) {
        { S::Merge(into, from) } -> std::same_as<void>;
    };

/**
 * @brief Serializers whose values may share one packed block.
 */
template <typename S>
concept PackableSerializer =
    Serializer<S> && (S::wire_type != WireType::LengthDelimited);

}  // namespace Purebuf::fields
