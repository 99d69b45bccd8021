/**
 * @file TestDeltaEngine.cpp
 * @brief Unit tests for PageCodec and DeltaEngine.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/migration/DeltaEngine.hpp"
#include "hop/migration/PageCodec.hpp"
#include "hop/core/Constants.hpp"

#include <random>

namespace hop::migration {

namespace {

constexpr core::usize kPage = core::kPageSize;

core::Bytes patterned(core::usize pages, core::u8 seed)
{
    core::Bytes out(pages * kPage);
    for (core::usize i = 0; i < out.size(); ++i)
        out[i] = static_cast<core::byte>((i / 97 + seed) & 0xFF);
    return out;
}

core::Bytes noise(core::usize size)
{
    std::mt19937 rng{1234};
    core::Bytes out(size);
    for (auto &b : out)
        b = static_cast<core::byte>(rng() & 0xFF);
    return out;
}

/// Source and destination stores agreeing on @p image as baseline @p id.
struct Pair
{
    BaselineStore source;
    BaselineStore destination;
    DeltaEngine   sender{source, cluster::MigrationSettings{}};
    DeltaEngine   receiver{destination, cluster::MigrationSettings{}};

    void agree(core::u64 id, const core::Bytes &image)
    {
        source.record("dst", id, std::make_shared<const core::Bytes>(image));
        destination.record("src", id, std::make_shared<const core::Bytes>(image));
    }
};

} // namespace

TEST_CASE("PageCodec compresses only when smaller", "[migration][codec]")
{
    const core::Bytes zeros(kPage);
    const auto packed = PageCodec::encodeIfSmaller(zeros);
    REQUIRE(packed.has_value());
    REQUIRE(packed->compressed);
    REQUIRE(packed->data.size() < zeros.size());
    REQUIRE(PageCodec::decompress(packed->data, kPage).value() == zeros);

    const auto random = noise(kPage);
    const auto raw = PageCodec::encodeIfSmaller(random);
    REQUIRE(raw.has_value());
    REQUIRE_FALSE(raw->compressed);
    REQUIRE(raw->data == random);
}

TEST_CASE("PageCodec prepends the little-endian uncompressed size", "[migration][codec]")
{
    const core::Bytes zeros(3 * kPage);
    const auto packed = PageCodec::compress(zeros).value();

    REQUIRE(packed.size() > 4);
    const core::u32 announced = static_cast<core::u32>(packed[0]) | static_cast<core::u32>(packed[1]) << 8
                                | static_cast<core::u32>(packed[2]) << 16 | static_cast<core::u32>(packed[3]) << 24;
    REQUIRE(announced == zeros.size());
    REQUIRE(PageCodec::decompress(packed, zeros.size()).value() == zeros);
}

TEST_CASE("PageCodec refuses oversized or truncated input", "[migration][codec]")
{
    const auto packed = PageCodec::compress(core::Bytes(2 * kPage)).value();

    REQUIRE(PageCodec::decompress(packed, kPage).error().code() == core::ErrorCode::kDecompressionFailed);

    const std::span<const core::byte> truncated{packed.data(), packed.size() / 2};
    REQUIRE_FALSE(PageCodec::decompress(truncated, 2 * kPage).has_value());
}

TEST_CASE("Without a baseline the full image is sent", "[migration][delta]")
{
    Pair pair;
    const auto memory = patterned(3, 1);

    auto image = pair.sender.encode("dst", memory, std::nullopt);
    REQUIRE(image.has_value());
    REQUIRE(image->isFull());
    REQUIRE(image->pages() == 3);

    const auto restored = pair.receiver.decode("src", std::move(*image));
    REQUIRE(restored.has_value());
    REQUIRE(*restored == memory);
}

TEST_CASE("Unchanged memory produces an empty delta", "[migration][delta]")
{
    Pair pair;
    const auto memory = patterned(2, 7);
    pair.agree(10, memory);

    auto image = pair.sender.encode("dst", memory, 10);
    REQUIRE(image.has_value());
    REQUIRE(image->isDelta());
    REQUIRE(image->baselineId() == 10);
    REQUIRE(image->patches().empty());

    REQUIRE(pair.receiver.decode("src", std::move(*image)).value() == memory);
}

TEST_CASE("Only changed pages are transferred", "[migration][delta]")
{
    Pair pair;
    auto memory = patterned(4, 3);
    pair.agree(11, memory);

    memory[2 * kPage + 5] = core::byte{0xEE};

    auto image = pair.sender.encode("dst", memory, 11);
    REQUIRE(image.has_value());
    REQUIRE(image->patches().size() == 1);
    REQUIRE(image->patches().front().index == 2);

    REQUIRE(pair.receiver.decode("src", std::move(*image)).value() == memory);
}

TEST_CASE("Grown and shrunk images reconstruct exactly", "[migration][delta]")
{
    Pair pair;
    const auto base = patterned(2, 9);
    pair.agree(12, base);

    SECTION("grown")
    {
        auto grown = base;
        grown.resize(4 * kPage, core::byte{0x42});

        auto image = pair.sender.encode("dst", grown, 12);
        REQUIRE(image->isDelta());
        REQUIRE(image->patches().size() == 2);
        REQUIRE(pair.receiver.decode("src", std::move(*image)).value() == grown);
    }

    SECTION("shrunk")
    {
        const core::Bytes shrunk(base.begin(), base.begin() + static_cast<std::ptrdiff_t>(kPage));

        auto image = pair.sender.encode("dst", shrunk, 12);
        REQUIRE(image->isDelta());
        REQUIRE(image->pages() == 1);
        REQUIRE(image->patches().empty());
        REQUIRE(pair.receiver.decode("src", std::move(*image)).value() == shrunk);
    }
}

TEST_CASE("A differing remote baseline forces a full image", "[migration][delta]")
{
    Pair pair;
    const auto memory = patterned(2, 5);
    pair.agree(20, memory);

    const auto image = pair.sender.encode("dst", memory, 19);
    REQUIRE(image.has_value());
    REQUIRE(image->isFull());
}

TEST_CASE("Delta over an unknown baseline is a baseline mismatch", "[migration][delta]")
{
    Pair pair;
    const auto memory = patterned(2, 5);
    pair.source.record("dst", 30, std::make_shared<const core::Bytes>(memory));

    auto image = pair.sender.encode("dst", memory, 30);
    REQUIRE(image->isDelta());

    const auto restored = pair.receiver.decode("src", std::move(*image));
    REQUIRE_FALSE(restored.has_value());
    REQUIRE(restored.error().code() == core::ErrorCode::kBaselineMismatch);
}

TEST_CASE("Patches outside the image are rejected", "[migration][delta]")
{
    Pair pair;
    pair.agree(40, patterned(2, 1));

    std::vector<serial::PagePatch> patches;
    patches.push_back(serial::PagePatch{5, false, core::Bytes(kPage)});

    const auto restored = pair.receiver.decode("src", serial::MemoryImage::delta(40, 2, std::move(patches)));
    REQUIRE_FALSE(restored.has_value());
    REQUIRE(restored.error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("Full strategy ignores baselines", "[migration][delta]")
{
    BaselineStore store;
    cluster::MigrationSettings settings{};
    settings.strategy    = cluster::MemoryStrategy::Full;
    settings.compression = false;
    const DeltaEngine engine{store, settings};

    const auto memory = patterned(1, 0);
    store.record("dst", 1, std::make_shared<const core::Bytes>(memory));

    const auto image = engine.encode("dst", memory, 1);
    REQUIRE(image->isFull());
    REQUIRE_FALSE(image->compressed());
    REQUIRE(image->blob() == memory);
}

} // namespace hop::migration
