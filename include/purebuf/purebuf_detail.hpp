#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <purebuf/core/purebuf_log.hpp>
#include <purebuf/core/purebuf_types.hpp>
#include <purebuf/messages/purebuf_messages.hpp>
#include <purebuf/serdes/purebuf_stream.hpp>
#include <purebuf/serdes/purebuf_wire_layout.hpp>
#include <span>
#include <vector>

/**
 * @brief Internal implementation details for Purebuf's public API.
 */
namespace Purebuf::detail {

/**
 * @brief Writes the message after it passed validation.
 *
 * @return std::nullopt on success, or the validation Error. Nothing is
 * written on error.
 */
template <messages::ProtoMessage Message>
[[nodiscard]] auto EncodeTo(const Message& message, serdes::OutputStream& out)
    -> std::optional<Error> {
    if (auto err = serdes::WireLayout::Validate(message); err.has_value()) {
        return err;
    }
    serdes::WireLayout::Dump(message, out);
    return std::nullopt;
}

/**
 * @brief Decodes a whole buffer into message, merging into what it holds.
 */
template <messages::ProtoMessage Message>
[[nodiscard]] auto LoadFrom(std::span<const std::byte> buffer,
                            Message& message, const DecodeOptions& options)
    -> std::optional<Error> {
    serdes::InputStream in{buffer, options.max_depth};
    auto err = serdes::WireLayout::Load(in, message);
    if (err.has_value()) {
        Logger()->debug("decode failed: code {} field {}: {}",
                        static_cast<uint8_t>(err->code), err->field_number,
                        err->message);
    }
    return err;
}

}  // namespace Purebuf::detail
