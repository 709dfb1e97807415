/**
 * @file TestStateHash.cpp
 * @brief Unit tests for spc::math::StateHash.
 */

#include <catch2/catch_test_macros.hpp>

#include <spc/math/StateHash.hpp>

using namespace spc;
using spc::math::StateHash;

TEST_CASE("FNV-1a reference vectors", "[math][hash]")
{
    REQUIRE(StateHash::of("") == StateHash::kOffsetBasis);
    REQUIRE(StateHash::of("a") == 0xaf63dc4c8601ec8cULL);
    REQUIRE(StateHash::of("foobar") == 0x85944171f73967e8ULL);
}

TEST_CASE("Hex rendering is fixed width", "[math][hash]")
{
    REQUIRE(StateHash::toHex(0) == "0000000000000000");
    REQUIRE(StateHash::toHex(0xaf63dc4c8601ec8cULL) == "af63dc4c8601ec8c");
    REQUIRE(StateHash::toHex(StateHash::of("evidence")).size() == 16);
}

TEST_CASE("Chained feeding equals one-shot hashing", "[math][hash]")
{
    StateHash h;
    h.hashString("foo").hashString("bar");
    REQUIRE(h.digest() == StateHash::of("foobar"));

    h.reset();
    REQUIRE(h.digest() == StateHash::kOffsetBasis);
}

TEST_CASE("Combining values is order dependent", "[math][hash]")
{
    StateHash ab;
    ab.combine(core::u32{1}).combine(core::u32{2});

    StateHash ba;
    ba.combine(core::u32{2}).combine(core::u32{1});

    StateHash again;
    again.combine(core::u32{1}).combine(core::u32{2});

    REQUIRE(ab.digest() != ba.digest());
    REQUIRE(ab.digest() == again.digest());
}
