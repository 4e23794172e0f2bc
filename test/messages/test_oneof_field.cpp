#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <purebuf/purebuf.hpp>
#include <string>

#include "../test_bytes.hpp"

using namespace Purebuf;
using namespace Purebuf::fields;

namespace {
struct Point {
    PUREBUF_MESSAGE_FIELDS(x, y);
    Field<1, Optional, SInt32> x;
    Field<2, Optional, SInt32> y;
    bool operator==(const Point&) const = default;
};

struct Shape {
    PUREBUF_MESSAGE_FIELDS(id, kind);
    Field<1, Optional, UInt32> id;
    OneofField<Case<2, String>, Case<3, Int32, Positive>,
               Case<4, fields::Message<Point>>>
        kind;
    bool operator==(const Shape&) const = default;
};
}  // namespace

static_assert(ProtoMessage<Shape>);
static_assert(decltype(Shape::kind)::HasFieldNumber(3));
static_assert(!decltype(Shape::kind)::HasFieldNumber(1));

TEST_CASE("Oneof holds at most one alternative") {
    Shape shape;
    REQUIRE_FALSE(shape.kind.has_value());
    REQUIRE_FALSE(shape.kind.which().has_value());

    REQUIRE_FALSE(shape.kind.set<2>("circle").has_value());
    REQUIRE(shape.kind.which() == 2);
    REQUIRE(*shape.kind.get<2>() == "circle");
    REQUIRE(shape.kind.get<3>() == nullptr);

    REQUIRE_FALSE(shape.kind.set<3>(5).has_value());
    REQUIRE(shape.kind.which() == 3);
    REQUIRE(shape.kind.get<2>() == nullptr);
    REQUIRE(*shape.kind.get<3>() == 5);

    shape.kind.clear();
    REQUIRE_FALSE(shape.kind.has_value());
}

TEST_CASE("Oneof alternative validators") {
    Shape shape;
    REQUIRE_FALSE(shape.kind.set<2>("square").has_value());

    const auto err = shape.kind.set<3>(-1);
    REQUIRE(err.has_value());
    REQUIRE(err->field_number == 3);
    REQUIRE(shape.kind.which() == 2);
}

TEST_CASE("Oneof encoding writes only the active alternative") {
    Shape shape;
    REQUIRE_FALSE(shape.id.set(1).has_value());
    REQUIRE_FALSE(shape.kind.set<3>(5).has_value());
    REQUIRE(Encode(shape).value() == ToBytes({0x08, 0x01, 0x18, 0x05}));

    Shape empty;
    REQUIRE(Encode(empty).value().empty());
}

TEST_CASE("Oneof decoding keeps the last alternative seen") {
    const auto decoded =
        Decode<Shape>(ToBytes({0x12, 0x01, 0x61, 0x18, 0x07}));
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->kind.which() == 3);
    REQUIRE(*decoded->kind.get<3>() == 7);

    const auto back =
        Decode<Shape>(ToBytes({0x18, 0x07, 0x12, 0x01, 0x61}));
    REQUIRE(back.has_value());
    REQUIRE(*back->kind.get<2>() == "a");
}

TEST_CASE("Oneof message alternative merges repeated occurrences") {
    // kind=4 {x: 1}, then kind=4 {y: -1}
    const auto decoded = Decode<Shape>(
        ToBytes({0x22, 0x02, 0x08, 0x02, 0x22, 0x02, 0x10, 0x01}));
    REQUIRE(decoded.has_value());
    const Point* point = decoded->kind.get<4>();
    REQUIRE(point != nullptr);
    REQUIRE(point->x.get() == 1);
    REQUIRE(point->y.get() == -1);
}

TEST_CASE("Oneof wire type mismatch") {
    const auto res = Decode<Shape>(ToBytes({0x10, 0x01}));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().field_number == 2);
}
