#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Purebuf {

/**
 * @brief Field number of an attribute within a Purebuf message.
 *
 * Field numbers are positive; 0 is reserved and never valid on the wire.
 */
using FieldNumber = int32_t;

/**
 * @brief Maximum valid FieldNumber value.
 *
 * Tags are encoded as: Tag = (FieldNumber << 3) | WireType
 * The low 3 bits of the tag hold the wire type, so the field number must not
 * exceed 2^29 - 1 to fit a 32-bit tag.
 */
static constexpr FieldNumber MaxFieldNumber = (1 << 29) - 1;

/**
 * @brief Default limit on nested embedded messages accepted by the decoder.
 */
static constexpr std::size_t DefaultMaxDepth = 100;

/**
 * @brief Error codes representing various failure conditions in Purebuf.
 */
enum class ErrorCode : uint8_t {
    UNKNOWN = 0,           ///< Unknown error.
    ValidationFailed,      ///< A value is outside its serializer's domain, a
                           ///< required field is missing or a validator
                           ///< rejected it.
    DeserializationError,  ///< Malformed wire bytes.
    DepthLimitExceeded,    ///< Embedded messages nested deeper than the
                           ///< decoder allows.
};

/**
 * @brief Represents an error occurred during Purebuf operations.
 *
 * Contains an error code, an optional field number related to the error, and
 * a descriptive message.
 */
struct Error {
    ErrorCode code;  ///< The error code.
    // cppcheck-suppress unusedStructMember
    FieldNumber field_number{0};  ///< Number of the field associated with the
                                  ///< error (0 if not applicable).
    // cppcheck-suppress unusedStructMember
    std::string_view message{};  ///< Static error message string.

    /**
     * @brief Creates an error representing a validation failure.
     * @tparam N Size of the message string literal.
     * @param number The FieldNumber that failed validation.
     * @param msg The failure description.
     */
    template <std::size_t N>
    [[nodiscard]] static constexpr Error validation(
        FieldNumber number, const char (&msg)[N]) noexcept {
        return {ErrorCode::ValidationFailed, number,
                std::string_view{msg, N - 1}};
    }

    /**
     * @brief Creates an error representing a deserialization failure.
     * @param msg Description of the deserialization error.
     */
    [[nodiscard]] static constexpr Error deserialization(
        std::string_view msg = "deserialization error") noexcept {
        return {ErrorCode::DeserializationError, 0, msg};
    }

    /**
     * @brief Creates an error for input nested deeper than the decoder limit.
     */
    [[nodiscard]] static constexpr Error depth_limit() noexcept {
        return {ErrorCode::DepthLimitExceeded, 0,
                "message nesting exceeds depth limit"};
    }

    /**
     * @brief Returns a copy attributed to the given field, unless the error
     * already names one (the innermost field wins).
     */
    [[nodiscard]] constexpr Error with_field(
        FieldNumber number) const noexcept {
        Error copy = *this;
        if (copy.field_number == 0) {
            copy.field_number = number;
        }
        return copy;
    }

    [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept =
        default;

    /**
     * @brief Checks if the error matches a specific error code.
     */
    [[nodiscard]] constexpr bool operator==(ErrorCode c) const noexcept {
        return code == c;
    }
};

/**
 * @brief Limits applied while decoding.
 */
struct DecodeOptions {
    std::size_t max_depth{DefaultMaxDepth};
};

}  // namespace Purebuf
