/**
 * @file TestStateHash.cpp
 * @brief Unit tests for core::StateHash.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/core/StateHash.hpp"

#include <array>

namespace hop::core {

TEST_CASE("StateHash of empty input is the offset basis", "[core][hash]")
{
    REQUIRE(StateHash{}.digest() == StateHash::kOffsetBasis);
    REQUIRE(StateHash::of({}) == StateHash::kOffsetBasis);
}

TEST_CASE("StateHash matches the FNV-1a reference for 'a'", "[core][hash]")
{
    const std::array<byte, 1> a{byte{'a'}};
    REQUIRE(StateHash::of(a) == 0xaf63dc4c8601ec8cULL);
}

TEST_CASE("StateHash is sensitive to a single flipped byte", "[core][hash]")
{
    Bytes page(4096, byte{0});
    const auto before = StateHash::of(page);
    page[1234] = byte{1};
    REQUIRE(StateHash::of(page) != before);
}

TEST_CASE("StateHash incremental feed equals one-shot", "[core][hash]")
{
    const std::array<byte, 4> data{byte{1}, byte{2}, byte{3}, byte{4}};
    StateHash h;
    h.hashBytes(std::span{data}.first(2)).hashBytes(std::span{data}.subspan(2));
    REQUIRE(h.digest() == StateHash::of(data));

    h.reset();
    REQUIRE(h.digest() == StateHash::kOffsetBasis);
}

} // namespace hop::core
