#pragma once

#include <cstddef>
#include <optional>
#include <purebuf/core/purebuf_log.hpp>
#include <purebuf/core/purebuf_types.hpp>
#include <purebuf/messages/purebuf_field.hpp>
#include <purebuf/messages/purebuf_messages.hpp>
#include <purebuf/serdes/purebuf_stream.hpp>
#include <purebuf/serdes/purebuf_tag.hpp>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Purebuf::serdes {

/**
 * @brief Protocol Buffers wire layout.
 *
 * Drives whole-message encode, decode and merge over the fields a message
 * registered:
 * - Dump writes every field in declaration (ascending field number) order.
 * - Load reads tags until the input is exhausted and hands each payload to
 *   the field owning its number. Payloads for numbers the message does not
 *   declare are skipped by wire type and dropped.
 * - Merge applies each field's merge rule against the other message.
 */
struct WireLayout {
    /**
     * @brief Writes the fields of a message. Does not validate.
     */
    template <messages::ProtoMessage Message>
    static void Dump(const Message& msg, OutputStream& out) {
        std::apply([&](const auto&... fields) { (fields.Dump(out), ...); },
                   msg.get_fields());
    }

    /**
     * @brief Reads fields from the input until it is exhausted.
     *
     * Fields of msg that are already set are merged with what is read, as
     * when the same field occurs several times on the wire.
     *
     * @return std::nullopt on success, or Error. On error msg is partially
     * updated; callers decode into a scratch message.
     */
    template <messages::ProtoMessage Message>
    [[nodiscard]] static auto Load(InputStream& in, Message& msg)
        -> std::optional<Error> {
        while (!in.at_end()) {
            const auto tag = in.read_tag();
            if (!tag) {
                return tag.error();
            }
            const auto [number, wire_type] = *tag;

            bool found = false;
            if (auto err = visit_fields(msg.get_fields(), number, wire_type,
                                        in, found)) {
                return err;
            }
            if (!found) {
                Logger()->debug("skipping unknown field {} ({})", number,
                                to_string(wire_type));
                if (auto err = in.skip(wire_type)) {
                    return err->with_field(number);
                }
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Merges every field of from into into.
     */
    template <messages::ProtoMessage Message>
    static void Merge(Message& into, const Message& from) {
        merge_fields(into.get_fields(), from.get_fields(),
                     std::make_index_sequence<std::tuple_size_v<
                         decltype(into.get_fields())>>{});
    }

    /**
     * @brief Validates a message (field presence, values, submessages, and
     * message-level logic).
     *
     * @return std::nullopt on success, or the first Error in field order.
     */
    template <messages::ProtoMessage Message>
    [[nodiscard]] static auto Validate(const Message& msg)
        -> std::optional<Error> {
        std::optional<Error> err;
        std::apply(
            [&](const auto&... fields) {
                ([&] {
                    err = validate_field(fields);
                    return !err.has_value();
                }() &&
                 ...);
            },
            msg.get_fields());

        if (err.has_value()) {
            return err;
        }

        if constexpr (messages::HasMessageValidate<Message>) {
            return msg.Validate();
        }
        return std::nullopt;
    }

   private:
    template <typename FieldT>
    [[nodiscard]] static auto validate_field(const FieldT& field)
        -> std::optional<Error> {
        if constexpr (requires { field.validate_presence(); }) {
            if (auto err = field.validate_presence(); err) {
                return err;
            }
        }
        return field.Validate();
    }

    template <typename Into, typename From, std::size_t... Is>
    static void merge_fields(Into&& into, const From& from,
                             std::index_sequence<Is...>) {
        (std::get<Is>(into).MergeFrom(std::get<Is>(from)), ...);
    }

    /**
     * @brief Recursive helper to visit fields in a tuple and find the one
     * owning a field number.
     * @tparam Tuple The tuple of fields.
     * @tparam I The current index in the tuple.
     * @param fields_tuple The tuple instance.
     * @param number The FieldNumber read from the tag.
     * @param wire_type The wire type read from the tag.
     * @param in The input positioned after the tag.
     * @param found Set when a field owns the number.
     * @return std::nullopt on success (or not found yet), or Error.
     */
    template <typename Tuple, std::size_t I = 0>
    [[nodiscard]] static auto visit_fields(Tuple&& fields_tuple,
                                           FieldNumber number,
                                           WireType wire_type, InputStream& in,
                                           bool& found)
        -> std::optional<Error> {
        using TupleT = std::remove_cvref_t<Tuple>;
        if constexpr (I < std::tuple_size_v<TupleT>) {
            auto& f = std::get<I>(fields_tuple);
            using FieldT = std::remove_cvref_t<decltype(f)>;
            if constexpr (messages::is_oneof_field_v<FieldT>) {
                if (FieldT::HasFieldNumber(number)) {
                    found = true;
                    return f.LoadAndMerge(number, wire_type, in);
                }
            } else {
                if (FieldT::field_number == number) {
                    found = true;
                    return f.LoadAndMerge(wire_type, in);
                }
            }
            return visit_fields<Tuple, I + 1>(std::forward<Tuple>(fields_tuple),
                                              number, wire_type, in, found);
        }
        return std::nullopt;
    }
};

}  // namespace Purebuf::serdes
