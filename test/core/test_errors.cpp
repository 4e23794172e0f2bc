#include <catch2/catch_test_macros.hpp>
#include <purebuf/core/purebuf_types.hpp>

using namespace Purebuf;

TEST_CASE("Error factories") {
    constexpr Error v = Error::validation(7, "bad value");
    STATIC_REQUIRE(v.code == ErrorCode::ValidationFailed);
    STATIC_REQUIRE(v.field_number == 7);
    STATIC_REQUIRE(v.message == "bad value");

    constexpr Error d = Error::deserialization();
    STATIC_REQUIRE(d == ErrorCode::DeserializationError);
    STATIC_REQUIRE(d.field_number == 0);

    constexpr Error depth = Error::depth_limit();
    STATIC_REQUIRE(depth == ErrorCode::DepthLimitExceeded);
}

TEST_CASE("with_field keeps the innermost field number") {
    const Error inner = Error::deserialization("truncated").with_field(3);
    REQUIRE(inner.field_number == 3);

    const Error outer = inner.with_field(1);
    REQUIRE(outer.field_number == 3);
    REQUIRE(outer.message == "truncated");
}

TEST_CASE("Error equality") {
    REQUIRE(Error::validation(1, "x") == Error::validation(1, "x"));
    REQUIRE_FALSE(Error::validation(1, "x") == Error::validation(2, "x"));
    REQUIRE_FALSE(Error::validation(1, "x") ==
                  ErrorCode::DeserializationError);
}

TEST_CASE("DecodeOptions defaults") {
    DecodeOptions options;
    REQUIRE(options.max_depth == DefaultMaxDepth);
    STATIC_REQUIRE(DefaultMaxDepth == 100);
    STATIC_REQUIRE(MaxFieldNumber == 536870911);
}
