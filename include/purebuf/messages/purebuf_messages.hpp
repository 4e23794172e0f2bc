#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <purebuf/core/purebuf_types.hpp>
#include <purebuf/messages/purebuf_field.hpp>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Purebuf::messages {

/**
 * @brief Macro to register the fields of a message.
 *
 * Generates `get_fields()` methods (const and non-const) returning a tuple
 * of references to the listed field members. Fields must be listed in
 * ascending field number order; this order is also the encoding order.
 *
 * @param ... The field member variables to include.
 */
#define PUREBUF_MESSAGE_FIELDS(...)                                     \
    constexpr auto get_fields() const { return std::tie(__VA_ARGS__); } \
    constexpr auto get_fields() { return std::tie(__VA_ARGS__); }

/**
 * @brief Concept checking that a type registered its fields.
 */
template <typename T>
concept HasFieldsInterface = requires(const T& ct, T& t) {
    { ct.get_fields() };
    { t.get_fields() };
};

/// @cond INTERNAL

template <typename Tuple>
inline constexpr bool all_valid_fields_v =
    []<std::size_t... Is>(std::index_sequence<Is...>) {
        return (ValidField<std::tuple_element_t<Is, Tuple>> && ... && true);
    }(std::make_index_sequence<std::tuple_size_v<Tuple>>{});

template <typename Tuple>
concept tuple_members_are_valid_fields =
    all_valid_fields_v<std::remove_cvref_t<Tuple>>;

/**
 * @brief Flattens the field numbers of every field in declaration order
 * (a OneofField contributes all of its alternatives).
 */
template <typename Tuple>
consteval auto collect_field_numbers() {
    return []<std::size_t... Is>(std::index_sequence<Is...>) {
        constexpr std::size_t total =
            (std::remove_cvref_t<
                 std::tuple_element_t<Is, Tuple>>::field_numbers.size() +
             ... + 0);
        std::array<FieldNumber, total> numbers{};
        std::size_t k = 0;
        (
            [&] {
                for (const FieldNumber n : std::remove_cvref_t<
                         std::tuple_element_t<Is, Tuple>>::field_numbers) {
                    numbers[k++] = n;
                }
            }(),
            ...);
        return numbers;
    }(std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

template <std::size_t N>
consteval bool has_duplicates(const std::array<FieldNumber, N>& numbers) {
    for (std::size_t i = 0; i < N; ++i) {
        for (std::size_t j = i + 1; j < N; ++j) {
            if (numbers[i] == numbers[j]) {
                return true;
            }
        }
    }
    return false;
}

template <std::size_t N>
consteval bool is_strictly_ascending(const std::array<FieldNumber, N>& numbers) {
    for (std::size_t i = 1; i < N; ++i) {
        if (numbers[i - 1] >= numbers[i]) {
            return false;
        }
    }
    return true;
}

template <typename Tuple>
concept has_unique_field_numbers =
    !has_duplicates(collect_field_numbers<std::remove_cvref_t<Tuple>>());

template <typename Tuple>
concept has_ascending_field_numbers =
    is_strictly_ascending(collect_field_numbers<std::remove_cvref_t<Tuple>>());

/// @endcond

/**
 * @brief Concept detecting an optional message-level `Validate()` for
 * cross-field rules.
 */
template <typename Message>
concept HasMessageValidate = requires(const Message& m) {
    { m.Validate() } -> std::same_as<std::optional<Error>>;
};

/**
 * @brief Concept detecting a fully qualified protobuf type name, used to
 * build the message's type URL.
 */
template <typename Message>
concept HasTypeName = requires {
    { Message::type_name } -> std::convertible_to<std::string_view>;
};

/**
 * @brief Concept ensuring a type is a fully valid ProtoMessage.
 *
 * This is the schema registration check, evaluated once per type at compile
 * time:
 * 1. Regular type (copyable, default constructible, equality comparable).
 * 2. Registers its fields with PUREBUF_MESSAGE_FIELDS.
 * 3. All registered members are field variants.
 * 4. Field numbers are unique.
 * 5. Field numbers ascend in declaration order, so output is deterministic.
 */
template <typename Message>
concept ProtoMessage =
    std::regular<Message> && HasFieldsInterface<Message> &&
    tuple_members_are_valid_fields<
        decltype(std::declval<const Message&>().get_fields())> &&
    has_unique_field_numbers<
        decltype(std::declval<const Message&>().get_fields())> &&
    has_ascending_field_numbers<
        decltype(std::declval<const Message&>().get_fields())>;

}  // namespace Purebuf::messages
