#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <purebuf/core/purebuf_log.hpp>
#include <purebuf/core/purebuf_types.hpp>
#include <purebuf/fields/purebuf_enum.hpp>
#include <purebuf/fields/purebuf_message.hpp>
#include <purebuf/fields/purebuf_packed.hpp>
#include <purebuf/fields/purebuf_scalar.hpp>
#include <purebuf/fields/purebuf_string.hpp>
#include <purebuf/messages/purebuf_field.hpp>
#include <purebuf/messages/purebuf_messages.hpp>
#include <purebuf/purebuf_detail.hpp>
#include <purebuf/serdes/purebuf_stream.hpp>
#include <purebuf/serdes/purebuf_wire_layout.hpp>
#include <purebuf/validators/purebuf_validators.hpp>
#include <span>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief The public API for Purebuf.
 *
 * This section contains all the interfaces for encoding and decoding
 * messages in the Protocol Buffers wire format, and transitively provides
 * the necessary types for defining messages and fields.
 *
 * @section top_level_apis Top-level APIs
 *
 * - @b Validate: Validates field presence, field values, embedded messages
 *   and message-level constraints.
 * - @b Encode: Validates and writes a message into a new byte buffer.
 * - @b EncodeTo: Validates and appends a message to an OutputStream.
 * - @b Decode: Reads a message from a byte buffer.
 * - @b DecodeInto: Reads a message from a byte buffer and merges it into an
 *   existing one.
 * - @b Merge: Merges one message into another.
 * - @b TypeUrl: The `google.protobuf.Any` type URL of a message type.
 */

namespace Purebuf {

using messages::Case;
using messages::Field;
using messages::OneofField;
using messages::PackedRepeatedField;
using messages::Packing;
using messages::ProtoMessage;
using messages::RepeatedField;
using messages::UnpackedRepeatedField;
using serdes::InputStream;
using serdes::OutputStream;

/**
 * @brief Validates a message.
 *
 * Checks field presence, runs the serializer domain checks and field
 * validators of every set field, recurses into embedded messages, then calls
 * the message's own Validate() when it declares one.
 *
 * @tparam Message The ProtoMessage type to validate.
 * @param message The message to validate.
 * @return std::optional<Error> std::nullopt on success, or the first Error in
 * field order.
 */
template <ProtoMessage Message>
[[nodiscard]] auto Validate(const Message& message) -> std::optional<Error> {
    return serdes::WireLayout::Validate(message);
}

/**
 * @brief Validates and encodes a message.
 *
 * The output is deterministic: fields appear in ascending field number
 * order, repeated elements in sequence order, and unset fields are omitted.
 *
 * @tparam Message The ProtoMessage type to encode.
 * @param message The message to encode.
 * @return The encoded bytes, or the validation Error (no bytes are produced).
 */
template <ProtoMessage Message>
[[nodiscard]] auto Encode(const Message& message)
    -> std::expected<std::vector<std::byte>, Error> {
    OutputStream out;
    if (auto err = detail::EncodeTo(message, out); err.has_value()) {
        return std::unexpected(*err);
    }
    return std::move(out).release();
}

/**
 * @brief Encodes a message without running any validation.
 *
 * Useful for forwarding messages as-is, or for tests producing deliberately
 * invalid input for a peer.
 */
template <ProtoMessage Message>
[[nodiscard]] auto EncodeWithoutValidation(const Message& message)
    -> std::vector<std::byte> {
    OutputStream out;
    serdes::WireLayout::Dump(message, out);
    return std::move(out).release();
}

/**
 * @brief Validates a message and appends its encoding to out.
 *
 * @return std::nullopt on success, or the validation Error, in which case out
 * is unchanged.
 */
template <ProtoMessage Message>
[[nodiscard]] auto EncodeTo(const Message& message, OutputStream& out)
    -> std::optional<Error> {
    return detail::EncodeTo(message, out);
}

/**
 * @brief Decodes a message from a byte buffer.
 *
 * Fields the message does not declare are skipped. Fields absent from the
 * input stay unset. The decoded message is not validated; call Validate() to
 * enforce presence and value constraints.
 *
 * @tparam Message The ProtoMessage type to decode.
 * @param buffer The complete encoded message.
 * @param options Decoder limits.
 * @return The decoded message, or an Error (DeserializationError,
 * DepthLimitExceeded).
 */
template <ProtoMessage Message>
[[nodiscard]] auto Decode(std::span<const std::byte> buffer,
                          const DecodeOptions& options = {})
    -> std::expected<Message, Error> {
    Message message{};
    if (auto err = detail::LoadFrom(buffer, message, options);
        err.has_value()) {
        return std::unexpected(*err);
    }
    return message;
}

/**
 * @brief Decodes a byte buffer and merges the result into message.
 *
 * Equivalent to Merge(message, *Decode<Message>(buffer)). On error message is
 * left unchanged.
 */
template <ProtoMessage Message>
[[nodiscard]] auto DecodeInto(std::span<const std::byte> buffer,
                              Message& message,
                              const DecodeOptions& options = {})
    -> std::optional<Error> {
    auto decoded = Decode<Message>(buffer, options);
    if (!decoded) {
        return decoded.error();
    }
    serdes::WireLayout::Merge(message, *decoded);
    return std::nullopt;
}

/**
 * @brief Merges other into into, field by field.
 *
 * Set singular fields of other replace those of into, except embedded
 * messages which merge recursively. Repeated fields are concatenated. A set
 * oneof alternative of other replaces the alternative of into.
 */
template <ProtoMessage Message>
void Merge(Message& into, const Message& other) {
    serdes::WireLayout::Merge(into, other);
}

/**
 * @brief The `google.protobuf.Any` type URL of a message type.
 *
 * @tparam Message A ProtoMessage declaring
 * `static constexpr std::string_view type_name`.
 */
template <ProtoMessage Message>
    requires messages::HasTypeName<Message>
[[nodiscard]] auto TypeUrl() -> std::string {
    return std::string{"type.googleapis.com/"} +
           std::string{Message::type_name};
}

}  // namespace Purebuf
