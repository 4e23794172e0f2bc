#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <limits>
#include <purebuf/fields/purebuf_scalar.hpp>

#include "../test_bytes.hpp"

using namespace Purebuf;
using namespace Purebuf::fields;

namespace {
template <typename S>
std::vector<std::byte> DumpValue(const typename S::ValueType& value) {
    OutputStream out;
    S::Dump(value, out);
    return std::move(out).release();
}

template <typename S>
auto LoadValue(const std::vector<std::byte>& bytes) {
    InputStream in{bytes};
    return S::Load(in);
}
}  // namespace

static_assert(Serializer<Bool>);
static_assert(Serializer<Int32> && Serializer<SInt64> && Serializer<Double>);
static_assert(Int32::wire_type == WireType::Varint);
static_assert(SInt32::wire_type == WireType::Varint);
static_assert(Fixed32::wire_type == WireType::Fixed32);
static_assert(SFixed64::wire_type == WireType::Fixed64);
static_assert(Float::wire_type == WireType::Fixed32);
static_assert(Double::wire_type == WireType::Fixed64);
static_assert(PackableSerializer<UInt32> && PackableSerializer<Double>);
static_assert(!MergeableSerializer<Int64>);

TEST_CASE("Int32 encoding") {
    REQUIRE(DumpValue<Int32>(150) == ToBytes({0x96, 0x01}));
    REQUIRE(DumpValue<Int32>(-1) == ToBytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                                             0xFF, 0xFF, 0xFF, 0xFF, 0x01}));
    REQUIRE(LoadValue<Int32>(DumpValue<Int32>(-1)).value() == -1);
    REQUIRE(LoadValue<Int32>(DumpValue<Int32>(
                                 std::numeric_limits<int32_t>::min()))
                .value() == std::numeric_limits<int32_t>::min());
}

TEST_CASE("Varint serializers reject values wider than their type") {
    // 2^32 as a varint
    const auto wide = ToBytes({0x80, 0x80, 0x80, 0x80, 0x10});

    SECTION("uint32") {
        const auto res = LoadValue<UInt32>(wide);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::DeserializationError);
        REQUIRE(LoadValue<UInt64>(wide).value() == (uint64_t{1} << 32));
    }
    SECTION("sint32") {
        REQUIRE_FALSE(LoadValue<SInt32>(wide).has_value());
        REQUIRE(LoadValue<SInt64>(wide).value() == 2147483648LL);
    }
    SECTION("int32 accepts only sign-extended negatives") {
        // 0xFFFFFFFF without sign extension
        const auto unsigned_form = ToBytes({0xFF, 0xFF, 0xFF, 0xFF, 0x0F});
        REQUIRE_FALSE(LoadValue<Int32>(unsigned_form).has_value());
        REQUIRE(LoadValue<Int64>(unsigned_form).value() == 4294967295LL);
    }
}

TEST_CASE("SInt encoding uses zigzag") {
    REQUIRE(DumpValue<SInt32>(-1) == ToBytes({0x01}));
    REQUIRE(DumpValue<SInt32>(1) == ToBytes({0x02}));
    REQUIRE(DumpValue<SInt64>(-64) == ToBytes({0x7F}));
    REQUIRE(LoadValue<SInt32>(ToBytes({0x03})).value() == -2);
}

TEST_CASE("Fixed-width encoding is little-endian") {
    REQUIRE(DumpValue<Fixed32>(1) == ToBytes({0x01, 0x00, 0x00, 0x00}));
    REQUIRE(DumpValue<SFixed64>(-2) ==
            ToBytes({0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
    REQUIRE(DumpValue<Float>(1.0f) == ToBytes({0x00, 0x00, 0x80, 0x3F}));
    REQUIRE(DumpValue<Double>(1.0) ==
            ToBytes({0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F}));
    REQUIRE(LoadValue<SFixed32>(ToBytes({0xFF, 0xFF, 0xFF, 0xFF})).value() ==
            -1);

    REQUIRE_FALSE(LoadValue<Fixed64>(ToBytes({0x01, 0x02})).has_value());
}

TEST_CASE("Bool encoding") {
    REQUIRE(DumpValue<Bool>(true) == ToBytes({0x01}));
    REQUIRE(DumpValue<Bool>(false) == ToBytes({0x00}));
    REQUIRE(LoadValue<Bool>(ToBytes({0x02})).value() == true);
    REQUIRE(LoadValue<Bool>(ToBytes({0x00})).value() == false);
}

TEMPLATE_TEST_CASE("Integer serializers accept their whole range", "[scalar]",
                   Int32, Int64, UInt32, UInt64, SInt32, SInt64, Fixed32,
                   Fixed64, SFixed32, SFixed64) {
    using T = typename TestType::ValueType;
    constexpr T lo = std::numeric_limits<T>::min();
    constexpr T hi = std::numeric_limits<T>::max();
    REQUIRE_FALSE(TestType::Validate(lo, 1).has_value());
    REQUIRE(LoadValue<TestType>(DumpValue<TestType>(lo)).value() == lo);
    REQUIRE(LoadValue<TestType>(DumpValue<TestType>(hi)).value() == hi);
}
