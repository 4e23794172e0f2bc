#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <purebuf/fields/purebuf_packed.hpp>
#include <purebuf/fields/purebuf_scalar.hpp>
#include <utility>
#include <vector>

#include "../test_bytes.hpp"

using namespace Purebuf;
using namespace Purebuf::fields;

namespace {
using PackedSInt32 = Packed<SInt32>;

std::vector<std::byte> DumpPacked(const std::vector<int32_t>& values) {
    OutputStream out;
    PackedSInt32::Dump(values, out);
    return std::move(out).release();
}
}  // namespace

TEST_CASE("Packed block dump") {
    REQUIRE(DumpPacked({0, -1, 1, -64}) ==
            ToBytes({0x04, 0x00, 0x01, 0x02, 0x7F}));
    REQUIRE(DumpPacked({INT32_MIN}) ==
            ToBytes({0x05, 0xFF, 0xFF, 0xFF, 0xFF, 0x0F}));
    REQUIRE(DumpPacked({}) == ToBytes({0x00}));
}

TEST_CASE("Packed block load-append") {
    SECTION("elements append after existing values") {
        const auto bytes = ToBytes({0x03, 0x01, 0x02, 0x7F, 0x08});
        InputStream in{bytes};
        std::vector<int32_t> values{7};
        REQUIRE_FALSE(PackedSInt32::LoadAppend(in, values).has_value());
        REQUIRE(values == std::vector<int32_t>{7, -1, 1, -64});
        REQUIRE(in.remaining() == 1);
    }
    SECTION("empty block appends nothing") {
        const auto bytes = ToBytes({0x00});
        InputStream in{bytes};
        std::vector<int32_t> values;
        REQUIRE_FALSE(PackedSInt32::LoadAppend(in, values).has_value());
        REQUIRE(values.empty());
        REQUIRE(in.at_end());
    }
    SECTION("block ending mid-element") {
        const auto bytes = ToBytes({0x02, 0x01, 0x80});
        InputStream in{bytes};
        std::vector<int32_t> values;
        const auto err = PackedSInt32::LoadAppend(in, values);
        REQUIRE(err.has_value());
        REQUIRE(err->code == ErrorCode::DeserializationError);
        REQUIRE(values == std::vector<int32_t>{-1});
    }
    SECTION("block longer than the input") {
        const auto bytes = ToBytes({0x05, 0x01});
        InputStream in{bytes};
        std::vector<int32_t> values;
        REQUIRE(PackedSInt32::LoadAppend(in, values).has_value());
        REQUIRE(values.empty());
    }
    SECTION("element wider than its type") {
        // zigzag 2^32 does not fit sint32
        const auto bytes = ToBytes({0x05, 0x80, 0x80, 0x80, 0x80, 0x10});
        InputStream in{bytes};
        std::vector<int32_t> values;
        REQUIRE(PackedSInt32::LoadAppend(in, values).has_value());
    }
}
