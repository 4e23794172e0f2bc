#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <purebuf/serdes/purebuf_stream.hpp>
#include <vector>

#include "../test_bytes.hpp"

using namespace Purebuf;
using namespace Purebuf::serdes;

TEST_CASE("OutputStream appends tags, varints and fixed values") {
    OutputStream out;
    out.write_tag(1, WireType::Varint);
    out.write_varint(150);
    out.write_fixed<uint32_t>(1);
    REQUIRE(CopyBytes(out.bytes()) ==
            ToBytes({0x08, 0x96, 0x01, 0x01, 0x00, 0x00, 0x00}));
    REQUIRE(out.size() == 7);
}

TEST_CASE("OutputStream length-delimited blocks") {
    SECTION("short content gets a one byte prefix") {
        OutputStream out;
        const std::size_t len_offset = out.begin_length_delimited();
        out.write_varint(150);
        out.end_length_delimited(len_offset);
        REQUIRE(CopyBytes(out.bytes()) == ToBytes({0x02, 0x96, 0x01}));
    }
    SECTION("content of 200 bytes gets a two byte prefix") {
        OutputStream out;
        out.write_varint(7);
        const std::size_t len_offset = out.begin_length_delimited();
        const std::vector<std::byte> payload(200, std::byte{0xAB});
        out.write_raw(payload);
        out.end_length_delimited(len_offset);

        const auto bytes = std::move(out).release();
        REQUIRE(bytes.size() == 1 + 2 + 200);
        REQUIRE(bytes[0] == std::byte{0x07});
        REQUIRE(bytes[1] == std::byte{0xC8});
        REQUIRE(bytes[2] == std::byte{0x01});
        REQUIRE(bytes[3] == std::byte{0xAB});
        REQUIRE(bytes.back() == std::byte{0xAB});
    }
    SECTION("empty content") {
        OutputStream out;
        out.end_length_delimited(out.begin_length_delimited());
        REQUIRE(CopyBytes(out.bytes()) == ToBytes({0x00}));
    }
}

TEST_CASE("InputStream reads values in order") {
    const auto bytes = ToBytes({0x08, 0x96, 0x01, 0x02, 0x61, 0x62, 0x2A,
                                0x00, 0x00, 0x00});
    InputStream in{bytes};

    const auto tag = in.read_tag();
    REQUIRE(tag.has_value());
    REQUIRE(tag->first == 1);
    REQUIRE(tag->second == WireType::Varint);
    REQUIRE(in.read_varint().value() == 150);

    const auto block = in.read_length_delimited();
    REQUIRE(block.has_value());
    REQUIRE(CopyBytes(*block) == ToBytes({0x61, 0x62}));

    REQUIRE(in.read_fixed<uint32_t>().value() == 42);
    REQUIRE(in.at_end());
}

TEST_CASE("InputStream reports truncated input") {
    SECTION("length prefix larger than the remaining input") {
        const auto bytes = ToBytes({0x05, 0x01, 0x02});
        InputStream in{bytes};
        const auto block = in.read_length_delimited();
        REQUIRE_FALSE(block.has_value());
        REQUIRE(block.error() == ErrorCode::DeserializationError);
    }
    SECTION("fixed-width value cut short") {
        const auto bytes = ToBytes({0x01, 0x02, 0x03});
        InputStream in{bytes};
        REQUIRE_FALSE(in.read_fixed<uint32_t>().has_value());
    }
    SECTION("varint cut short") {
        const auto bytes = ToBytes({0x96});
        InputStream in{bytes};
        REQUIRE_FALSE(in.read_varint().has_value());
    }
    SECTION("tag above 32 bits") {
        const auto bytes = ToBytes({0x80, 0x80, 0x80, 0x80, 0x10});
        InputStream in{bytes};
        REQUIRE_FALSE(in.read_tag().has_value());
    }
}

TEST_CASE("InputStream skips payloads of every wire type") {
    const auto bytes = ToBytes({0x96, 0x01,                    // varint
                                0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                0x08,                          // fixed64
                                0x02, 0x61, 0x62,              // block
                                0x01, 0x02, 0x03, 0x04});      // fixed32
    InputStream in{bytes};
    REQUIRE_FALSE(in.skip(WireType::Varint).has_value());
    REQUIRE_FALSE(in.skip(WireType::Fixed64).has_value());
    REQUIRE_FALSE(in.skip(WireType::LengthDelimited).has_value());
    REQUIRE_FALSE(in.skip(WireType::Fixed32).has_value());
    REQUIRE(in.at_end());

    REQUIRE(in.skip(WireType::Varint).has_value());
}

TEST_CASE("InputStream nesting depth") {
    const auto bytes = ToBytes({0x00});
    InputStream root{bytes, 2};
    REQUIRE(root.depth() == 0);

    auto child = root.nested(bytes);
    REQUIRE(child.has_value());
    REQUIRE(child->depth() == 1);

    auto grandchild = child->nested(bytes);
    REQUIRE(grandchild.has_value());
    REQUIRE(grandchild->depth() == 2);

    auto too_deep = grandchild->nested(bytes);
    REQUIRE_FALSE(too_deep.has_value());
    REQUIRE(too_deep.error() == ErrorCode::DepthLimitExceeded);

    REQUIRE(grandchild->bounded(bytes).depth() == 2);
}
