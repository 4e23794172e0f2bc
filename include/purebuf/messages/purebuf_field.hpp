#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <purebuf/core/purebuf_types.hpp>
#include <purebuf/fields/purebuf_packed.hpp>
#include <purebuf/fields/purebuf_serializer.hpp>
#include <purebuf/validators/purebuf_validators.hpp>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Purebuf::messages {

using fields::MergeableSerializer;
using fields::PackableSerializer;
using fields::Serializer;
using serdes::InputStream;
using serdes::OutputStream;

/**
 * @brief Singular (non-repeated) message field.
 *
 * Associates a FieldNumber and Presence requirements with a serializer and
 * owns the value. An unset field is absent from the wire. On decode the last
 * occurrence wins, except for embedded messages which merge.
 *
 * @tparam Number The unique FieldNumber.
 * @tparam Presence The presence validation policy (Optional/Required).
 * @tparam S The value serializer.
 * @tparam Validators Extra constraints on the value.
 */
template <FieldNumber Number, typename Presence, typename S,
          typename... Validators>
    requires IsPresenceValidator<Presence> && Serializer<S> &&
             (Validator<Validators, typename S::ValueType> && ...)
class Field {
   public:
    static_assert(Number > 0, "FieldNumber must be positive");
    static_assert(Number <= MaxFieldNumber,
                  "FieldNumber must be <= MaxFieldNumber (2^29 - 1)");
    static constexpr FieldNumber field_number = Number;
    static constexpr std::array<FieldNumber, 1> field_numbers{Number};
    using SerializerType = S;
    using ValueType = typename S::ValueType;

    Field() = default;

    /**
     * @brief Validate and set the value.
     * @return Error if the value is rejected, in which case the field is left
     * unchanged.
     */
    [[nodiscard]] std::optional<Error> set(ValueType value) {
        if (auto err = ValidateValue(value)) {
            return err;
        }
        value_ = std::move(value);
        return std::nullopt;
    }

    /**
     * @brief Set the value, bypassing validation
     */
    void set_without_validation(ValueType value) { value_ = std::move(value); }

    [[nodiscard]] const std::optional<ValueType>& get() const noexcept {
        return value_;
    }

    /**
     * @brief Access the value for in-place modification, default-constructing
     * it first if unset.
     */
    [[nodiscard]] ValueType& mutable_value() {
        if (!value_) {
            value_.emplace();
        }
        return *value_;
    }

    [[nodiscard]] bool has_value() const noexcept { return value_.has_value(); }

    void clear() noexcept { value_.reset(); }

    /**
     * @brief Check presence requirement.
     */
    [[nodiscard]] auto validate_presence() const noexcept
        -> std::optional<Error> {
        return Presence::check_presence(value_.has_value(), Number);
    }

    /**
     * @brief Validate the field value. An unset field is valid here; presence
     * is checked separately.
     */
    [[nodiscard]] auto Validate() const -> std::optional<Error> {
        if (!value_) {
            return std::nullopt;
        }
        return ValidateValue(*value_);
    }

    [[nodiscard]] static auto ValidateValue(const ValueType& value)
        -> std::optional<Error> {
        if (auto err = S::Validate(value, Number)) {
            return err->with_field(Number);
        }
        std::optional<Error> err;
        ((err = err ? err : Validators::Check(value, Number)), ...);
        return err;
    }

    void Dump(OutputStream& out) const {
        if (!value_) {
            return;
        }
        out.write_tag(Number, S::wire_type);
        S::Dump(*value_, out);
    }

    [[nodiscard]] std::optional<Error> LoadAndMerge(WireType wire_type,
                                                    InputStream& in) {
        if (wire_type != S::wire_type) {
            return Error::deserialization("wire type mismatch")
                .with_field(Number);
        }
        auto loaded = S::Load(in);
        if (!loaded) {
            return loaded.error().with_field(Number);
        }
        if constexpr (MergeableSerializer<S>) {
            if (value_) {
                S::Merge(*value_, *loaded);
                return std::nullopt;
            }
        }
        value_ = std::move(*loaded);
        return std::nullopt;
    }

    void MergeFrom(const Field& other) {
        if (!other.value_) {
            return;
        }
        if constexpr (MergeableSerializer<S>) {
            if (value_) {
                S::Merge(*value_, *other.value_);
                return;
            }
        }
        value_ = other.value_;
    }

    [[nodiscard]] bool operator==(const Field& other) const = default;

   private:
    std::optional<ValueType> value_;
};

/**
 * @brief Whether a repeated field of scalars is written packed.
 */
enum class Packing : uint8_t {
    Default,   ///< Packed when the element type is not length-delimited.
    Unpacked,  ///< Always one tag per element.
};

namespace detail {

/**
 * @brief Storage, validation, decode and merge shared by both repeated
 * variants. The variants differ only in how they write.
 */
template <FieldNumber Number, typename S, typename... Validators>
    requires Serializer<S> &&
             (Validator<Validators, std::vector<typename S::ValueType>> && ...)
class RepeatedStorage {
   public:
    static_assert(Number > 0, "FieldNumber must be positive");
    static_assert(Number <= MaxFieldNumber,
                  "FieldNumber must be <= MaxFieldNumber (2^29 - 1)");
    static constexpr FieldNumber field_number = Number;
    static constexpr std::array<FieldNumber, 1> field_numbers{Number};
    using SerializerType = S;
    using ElementType = typename S::ValueType;
    using ValueType = std::vector<ElementType>;

    /**
     * @brief Validate and append one element.
     */
    [[nodiscard]] std::optional<Error> add(ElementType value) {
        if (auto err = S::Validate(value, Number)) {
            return err->with_field(Number);
        }
        values_.push_back(std::move(value));
        return std::nullopt;
    }

    /**
     * @brief Validate and replace the whole sequence.
     */
    [[nodiscard]] std::optional<Error> set(ValueType values) {
        if (auto err = ValidateValue(values)) {
            return err;
        }
        values_ = std::move(values);
        return std::nullopt;
    }

    void set_without_validation(ValueType values) {
        values_ = std::move(values);
    }

    [[nodiscard]] const ValueType& get() const noexcept { return values_; }

    [[nodiscard]] ValueType& mutable_value() noexcept { return values_; }

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    const ElementType& operator[](std::size_t index) const noexcept {
        return values_[index];
    }

    void clear() noexcept { values_.clear(); }

    auto begin() const noexcept { return values_.begin(); }
    auto end() const noexcept { return values_.end(); }

    /**
     * @brief Validates each element, then the sequence-level validators.
     */
    [[nodiscard]] auto Validate() const -> std::optional<Error> {
        return ValidateValue(values_);
    }

    [[nodiscard]] static auto ValidateValue(const ValueType& values)
        -> std::optional<Error> {
        for (const auto& value : values) {
            if (auto err = S::Validate(value, Number)) {
                return err->with_field(Number);
            }
        }
        std::optional<Error> err;
        ((err = err ? err : Validators::Check(values, Number)), ...);
        return err;
    }

    /**
     * @brief Appends the elements of one wire occurrence.
     *
     * Scalar elements are accepted both packed (one length-delimited block)
     * and unpacked (one element per tag), whichever way the field is
     * written.
     */
    [[nodiscard]] std::optional<Error> LoadAndMerge(WireType wire_type,
                                                    InputStream& in) {
        if constexpr (PackableSerializer<S>) {
            if (wire_type == WireType::LengthDelimited) {
                if (auto err = fields::Packed<S>::LoadAppend(in, values_)) {
                    return err->with_field(Number);
                }
                return std::nullopt;
            }
        }
        if (wire_type != S::wire_type) {
            return Error::deserialization("wire type mismatch")
                .with_field(Number);
        }
        auto loaded = S::Load(in);
        if (!loaded) {
            return loaded.error().with_field(Number);
        }
        values_.push_back(std::move(*loaded));
        return std::nullopt;
    }

    void MergeFrom(const RepeatedStorage& other) {
        if (this == &other) {
            const ValueType copy = values_;
            values_.insert(values_.end(), copy.begin(), copy.end());
            return;
        }
        values_.insert(values_.end(), other.values_.begin(),
                       other.values_.end());
    }

    [[nodiscard]] bool operator==(const RepeatedStorage& other) const =
        default;

   protected:
    ValueType values_;
};

}  // namespace detail

/**
 * @brief Repeated scalar field written as a single packed block. An empty
 * sequence writes nothing.
 */
template <FieldNumber Number, typename S, typename... Validators>
    requires PackableSerializer<S>
class PackedRepeatedField
    : public detail::RepeatedStorage<Number, S, Validators...> {
   public:
    static constexpr bool is_packed = true;

    void Dump(OutputStream& out) const {
        if (this->values_.empty()) {
            return;
        }
        out.write_tag(Number, WireType::LengthDelimited);
        fields::Packed<S>::Dump(this->values_, out);
    }

    [[nodiscard]] bool operator==(const PackedRepeatedField& other) const =
        default;
};

/**
 * @brief Repeated field written as one tag and payload per element, in
 * sequence order.
 */
template <FieldNumber Number, typename S, typename... Validators>
    requires Serializer<S>
class UnpackedRepeatedField
    : public detail::RepeatedStorage<Number, S, Validators...> {
   public:
    static constexpr bool is_packed = false;

    void Dump(OutputStream& out) const {
        for (const auto& value : this->values_) {
            out.write_tag(Number, S::wire_type);
            S::Dump(value, out);
        }
    }

    [[nodiscard]] bool operator==(const UnpackedRepeatedField& other) const =
        default;
};

namespace detail {
template <bool Pack, FieldNumber Number, typename S, typename... Validators>
struct select_repeated {
    using type = UnpackedRepeatedField<Number, S, Validators...>;
};

template <FieldNumber Number, typename S, typename... Validators>
struct select_repeated<true, Number, S, Validators...> {
    using type = PackedRepeatedField<Number, S, Validators...>;
};
}  // namespace detail

/**
 * @brief Repeated field whose representation follows the element wire type
 * and the packing preference: length-delimited elements are never packed.
 */
template <FieldNumber Number, typename S, Packing P = Packing::Default,
          typename... Validators>
using RepeatedField = typename detail::select_repeated<
    P == Packing::Default && PackableSerializer<S>, Number, S,
    Validators...>::type;

/**
 * @brief One alternative of a OneofField.
 */
template <FieldNumber Number, typename S, typename... Validators>
    requires Serializer<S> &&
             (Validator<Validators, typename S::ValueType> && ...)
struct Case {
    static_assert(Number > 0, "FieldNumber must be positive");
    static_assert(Number <= MaxFieldNumber,
                  "FieldNumber must be <= MaxFieldNumber (2^29 - 1)");
    static constexpr FieldNumber field_number = Number;
    using SerializerType = S;
    using ValueType = typename S::ValueType;

    [[nodiscard]] static auto ValidateValue(const ValueType& value)
        -> std::optional<Error> {
        if (auto err = S::Validate(value, Number)) {
            return err->with_field(Number);
        }
        std::optional<Error> err;
        ((err = err ? err : Validators::Check(value, Number)), ...);
        return err;
    }
};

template <typename T>
struct is_case : std::false_type {};

template <FieldNumber Number, typename S, typename... V>
struct is_case<Case<Number, S, V...>> : std::true_type {};

/**
 * @brief A set of alternative fields of which at most one is set.
 *
 * Holds a std::variant over the alternatives, so a second alternative can
 * never be set alongside the first. Setting or decoding an alternative
 * replaces whichever one was set; an embedded message decoded onto the same
 * alternative merges into it.
 *
 * @tparam Cases The alternatives, in ascending field number order.
 */
template <typename... Cases>
    requires(sizeof...(Cases) > 0) && (is_case<Cases>::value && ...)
class OneofField {
   public:
    static constexpr std::array<FieldNumber, sizeof...(Cases)> field_numbers{
        Cases::field_number...};

   private:
    template <std::size_t I>
    using CaseAt = std::tuple_element_t<I, std::tuple<Cases...>>;

    template <FieldNumber Number>
    static consteval std::size_t case_index() {
        std::size_t index = 0;
        for (const FieldNumber n : field_numbers) {
            if (n == Number) {
                return index;
            }
            ++index;
        }
        throw "FieldNumber is not an alternative of this oneof";
    }

   public:
    using VariantType =
        std::variant<std::monostate, typename Cases::ValueType...>;

    OneofField() = default;

    /**
     * @brief Field number of the alternative currently set, if any.
     */
    [[nodiscard]] std::optional<FieldNumber> which() const noexcept {
        if (value_.index() == 0) {
            return std::nullopt;
        }
        return field_numbers[value_.index() - 1];
    }

    [[nodiscard]] bool has_value() const noexcept {
        return value_.index() != 0;
    }

    /**
     * @brief The value of alternative Number, or nullptr when another (or no)
     * alternative is set.
     */
    template <FieldNumber Number>
    [[nodiscard]] const auto* get() const noexcept {
        constexpr std::size_t I = case_index<Number>();
        return std::get_if<I + 1>(&value_);
    }

    template <FieldNumber Number>
    [[nodiscard]] std::optional<Error> set(
        typename CaseAt<case_index<Number>()>::ValueType value) {
        constexpr std::size_t I = case_index<Number>();
        if (auto err = CaseAt<I>::ValidateValue(value)) {
            return err;
        }
        value_.template emplace<I + 1>(std::move(value));
        return std::nullopt;
    }

    void clear() noexcept { value_.template emplace<0>(); }

    [[nodiscard]] auto Validate() const -> std::optional<Error> {
        std::optional<Error> err;
        visit_active([&]<std::size_t I>(const auto& value) {
            err = CaseAt<I>::ValidateValue(value);
        });
        return err;
    }

    void Dump(OutputStream& out) const {
        visit_active([&]<std::size_t I>(const auto& value) {
            using S = typename CaseAt<I>::SerializerType;
            out.write_tag(CaseAt<I>::field_number, S::wire_type);
            S::Dump(value, out);
        });
    }

    [[nodiscard]] static constexpr bool HasFieldNumber(
        FieldNumber number) noexcept {
        return ((number == Cases::field_number) || ...);
    }

    [[nodiscard]] std::optional<Error> LoadAndMerge(FieldNumber number,
                                                    WireType wire_type,
                                                    InputStream& in) {
        std::optional<Error> err;
        [&]<std::size_t... Is>(std::index_sequence<Is...>) {
            static_cast<void>(
                ((CaseAt<Is>::field_number == number
                      ? (err = load_case<Is>(wire_type, in), true)
                      : false) ||
                 ...));
        }(std::index_sequence_for<Cases...>{});
        return err;
    }

    void MergeFrom(const OneofField& other) {
        if (other.value_.index() == 0) {
            return;
        }
        bool merged = false;
        if (value_.index() == other.value_.index()) {
            visit_active([&]<std::size_t I>(auto&) {
                using S = typename CaseAt<I>::SerializerType;
                if constexpr (MergeableSerializer<S>) {
                    S::Merge(std::get<I + 1>(value_),
                             std::get<I + 1>(other.value_));
                    merged = true;
                }
            });
        }
        if (!merged) {
            value_ = other.value_;
        }
    }

    [[nodiscard]] bool operator==(const OneofField& other) const = default;

   private:
    /**
     * @brief Calls fn.template operator()<I>(value) for the active
     * alternative I, if any.
     */
    template <typename Fn>
    void visit_active(Fn&& fn) const {
        [&]<std::size_t... Is>(std::index_sequence<Is...>) {
            static_cast<void>(
                ((value_.index() == Is + 1
                      ? (fn.template operator()<Is>(std::get<Is + 1>(value_)),
                         true)
                      : false) ||
                 ...));
        }(std::index_sequence_for<Cases...>{});
    }

    template <std::size_t I>
    [[nodiscard]] std::optional<Error> load_case(WireType wire_type,
                                                 InputStream& in) {
        using C = CaseAt<I>;
        using S = typename C::SerializerType;
        if (wire_type != S::wire_type) {
            return Error::deserialization("wire type mismatch")
                .with_field(C::field_number);
        }
        auto loaded = S::Load(in);
        if (!loaded) {
            return loaded.error().with_field(C::field_number);
        }
        if constexpr (MergeableSerializer<S>) {
            if (value_.index() == I + 1) {
                S::Merge(std::get<I + 1>(value_), *loaded);
                return std::nullopt;
            }
        }
        value_.template emplace<I + 1>(std::move(*loaded));
        return std::nullopt;
    }

    VariantType value_;
};

template <typename T>
struct is_field : std::false_type {};

template <FieldNumber Number, typename P, typename S, typename... V>
struct is_field<Field<Number, P, S, V...>> : std::true_type {};

template <typename T>
inline constexpr bool is_field_v = is_field<T>::value;

template <typename T>
struct is_repeated_field : std::false_type {};

template <FieldNumber Number, typename S, typename... V>
struct is_repeated_field<PackedRepeatedField<Number, S, V...>>
    : std::true_type {};

template <FieldNumber Number, typename S, typename... V>
struct is_repeated_field<UnpackedRepeatedField<Number, S, V...>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_repeated_field_v = is_repeated_field<T>::value;

template <typename T>
struct is_oneof_field : std::false_type {};

template <typename... Cases>
struct is_oneof_field<OneofField<Cases...>> : std::true_type {};

template <typename T>
inline constexpr bool is_oneof_field_v = is_oneof_field<T>::value;

/**
 * @brief Concept checking if a type T is a valid field wrapper instance.
 *
 * Must be a Field, PackedRepeatedField, UnpackedRepeatedField or OneofField.
 */
template <typename T>
concept ValidField = is_field_v<std::remove_cvref_t<T>> ||
                     is_repeated_field_v<std::remove_cvref_t<T>> ||
                     is_oneof_field_v<std::remove_cvref_t<T>>;

}  // namespace Purebuf::messages
