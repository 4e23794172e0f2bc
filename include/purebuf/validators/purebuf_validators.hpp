#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <purebuf/core/purebuf_types.hpp>
#include <ranges>
#include <type_traits>

namespace Purebuf {

/**
 * @brief A value constraint attached to a field after its serializer.
 *
 * `V::Check(value, number)` returns std::nullopt when value is acceptable.
 * Checks run after the serializer's own domain check, on set and on
 * Validate(), never on decode.
 */
template <typename V, typename T>
concept Validator = requires(const T& value, FieldNumber number) {
    { V::Check(value, number) } -> std::same_as<std::optional<Error>>;
};

/**
 * @brief Presence policy of a field that must be set for the message to
 * validate (proto2 `required`).
 */
struct Required {
    [[nodiscard]] static constexpr std::optional<Error> check_presence(
        bool set, FieldNumber number) noexcept {
        if (!set) {
            return Error::validation(number, "field is required but not set");
        }
        return std::nullopt;
    }
};

/**
 * @brief Presence policy of a field that may be left unset. An unset field is
 * absent from the wire.
 */
struct Optional {
    [[nodiscard]] static constexpr std::optional<Error> check_presence(
        bool, FieldNumber) noexcept {
        return std::nullopt;
    }
};

/**
 * @brief Concept for validators that check field presence semantics.
 */
template <typename T>
concept IsPresenceValidator =
    std::same_as<T, Required> || std::same_as<T, Optional>;

/**
 * @brief Arithmetic field values a numeric validator applies to. bool is
 * excluded.
 */
template <typename T>
concept Numeric =
    (std::integral<T> || std::floating_point<T>) && !std::same_as<T, bool>;

/**
 * @brief Rejects NaN and infinities in float and double fields.
 */
struct IsFinite {
    template <std::floating_point T>
    [[nodiscard]] static constexpr auto Check(T value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (!std::isfinite(value)) {
            return Error::validation(number, "value is not finite");
        }
        return std::nullopt;
    }
};

/** @brief Rejects negative values (zero passes). */
struct Positive {
    template <Numeric T>
        requires std::is_signed_v<T>
    [[nodiscard]] static constexpr auto Check(T value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (value < 0) {
            return Error::validation(number, "value is negative");
        }
        return std::nullopt;
    }
};

struct NotZero {
    template <Numeric T>
    [[nodiscard]] static constexpr auto Check(T value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (value == 0) {
            return Error::validation(number, "value is zero");
        }
        return std::nullopt;
    }
};

/** @brief Exclusive upper bound. */
template <auto Bound>
struct LessThan {
    template <Numeric T>
    [[nodiscard]] static constexpr auto Check(T value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (!(value < Bound)) {
            return Error::validation(number, "value is not below the bound");
        }
        return std::nullopt;
    }
};

/** @brief Exclusive lower bound. */
template <auto Bound>
struct GreaterThan {
    template <Numeric T>
    [[nodiscard]] static constexpr auto Check(T value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (!(value > Bound)) {
            return Error::validation(number, "value is not above the bound");
        }
        return std::nullopt;
    }
};

/**
 * @brief Restricts a value to a fixed set, e.g. a subset of the members an
 * Enum serializer declares.
 */
template <auto... Allowed>
struct OneOf {
    template <typename T>
        requires Numeric<T> || std::is_enum_v<T>
    [[nodiscard]] static constexpr auto Check(T value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (!((value == Allowed) || ...)) {
            return Error::validation(number, "value is not an allowed value");
        }
        return std::nullopt;
    }
};

/**
 * @brief Minimum size of a string, byte string or repeated field.
 */
template <std::size_t Min>
struct LengthAtLeast {
    template <std::ranges::sized_range R>
    [[nodiscard]] static constexpr auto Check(const R& value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (std::ranges::size(value) < Min) {
            return Error::validation(number, "too few elements");
        }
        return std::nullopt;
    }
};

/**
 * @brief Maximum size of a string, byte string or repeated field.
 */
template <std::size_t Max>
struct LengthAtMost {
    template <std::ranges::sized_range R>
    [[nodiscard]] static constexpr auto Check(const R& value,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        if (std::ranges::size(value) > Max) {
            return Error::validation(number, "too many elements");
        }
        return std::nullopt;
    }
};

/**
 * @brief Rejects a repeated field holding the same element twice. Compares
 * pairwise, so it needs only equality on the element type.
 */
struct Unique {
    template <std::ranges::forward_range R>
        requires std::equality_comparable<std::ranges::range_value_t<R>>
    [[nodiscard]] static constexpr auto Check(const R& values,
                                              FieldNumber number) noexcept
        -> std::optional<Error> {
        for (auto it = std::ranges::begin(values);
             it != std::ranges::end(values); ++it) {
            if (std::ranges::find(std::ranges::next(it),
                                  std::ranges::end(values),
                                  *it) != std::ranges::end(values)) {
                return Error::validation(number, "duplicate element");
            }
        }
        return std::nullopt;
    }
};

}  // namespace Purebuf
