/**
 * @file TestRadixKey.cpp
 * @brief Unit tests for the key extractors and RadixKeyTraits.
 */

#include <catch2/catch.hpp>

#include "rdx/radix/RadixKey.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace rdx::radix {

namespace {

template <typename T>
std::vector<core::u8> keyBytes(const T &value)
{
    TraitsExtractor<T> extractor;
    std::vector<core::u8> bytes;
    for (core::usize i = 0; i < extractor.digitCount(); ++i)
        bytes.push_back(extractor.digitAt(value, i));
    return bytes;
}

template <typename T>
bool bytesStrictlyIncreasing(const std::vector<T> &values)
{
    for (std::size_t i = 1; i < values.size(); ++i)
        if (!(keyBytes(values[i - 1]) < keyBytes(values[i])))
            return false;
    return true;
}

struct Record {
    core::u16 id;
    char      tag;
};

} // namespace

static_assert(KeyExtractor<TraitsExtractor<core::u32>, core::u32>);
static_assert(HasRadixKey<std::pair<core::u32, core::i16>>);
static_assert(HasRadixKey<std::array<core::u8, 12>>);
static_assert(!HasRadixKey<bool>);
static_assert(RadixKeyTraits<std::pair<core::u16, core::u64>>::kDigits == 10);

TEST_CASE("Unsigned keys are big-endian", "[radixkey]")
{
    REQUIRE(keyBytes<core::u32>(0x11223344u) == std::vector<core::u8>{0x11, 0x22, 0x33, 0x44});
    REQUIRE(keyBytes<core::u8>(0xAB) == std::vector<core::u8>{0xAB});
    REQUIRE(keyBytes<core::u64>(1).back() == 1);
    REQUIRE(keyBytes<core::u64>(1).front() == 0);
}

TEST_CASE("Signed keys order negatives first", "[radixkey]")
{
    const std::vector<core::i32> values = {
        std::numeric_limits<core::i32>::min(), -1000, -1, 0, 1, 1000,
        std::numeric_limits<core::i32>::max()};
    REQUIRE(bytesStrictlyIncreasing(values));
    REQUIRE(keyBytes<core::i8>(0) == std::vector<core::u8>{0x80});
}

TEST_CASE("Floating point keys follow numeric order", "[radixkey]")
{
    SECTION("f32")
    {
        const std::vector<core::f32> values = {
            -std::numeric_limits<core::f32>::infinity(), -2.5f, -1.0f, -0.0f, 0.0f,
            std::numeric_limits<core::f32>::denorm_min(), 1.0f, 3.75f,
            std::numeric_limits<core::f32>::infinity()};
        REQUIRE(bytesStrictlyIncreasing(values));
    }

    SECTION("f64")
    {
        const std::vector<core::f64> values = {-1.0e300, -3.0, -1.0e-300, 0.0, 1.0e-300, 3.0, 1.0e300};
        REQUIRE(bytesStrictlyIncreasing(values));
    }
}

TEST_CASE("Byte arrays use their bytes as digits", "[radixkey]")
{
    const std::array<core::u8, 3> key = {1, 2, 3};
    REQUIRE(keyBytes(key) == std::vector<core::u8>{1, 2, 3});
}

TEST_CASE("Pairs concatenate the digits of both members", "[radixkey]")
{
    const std::pair<core::u8, core::u16> key{0x7F, 0x0102};
    REQUIRE(keyBytes(key) == std::vector<core::u8>{0x7F, 0x01, 0x02});

    const std::vector<std::pair<core::i8, core::u8>> ordered = {{-1, 200}, {0, 0}, {0, 1}, {5, 0}};
    REQUIRE(bytesStrictlyIncreasing(ordered));
}

TEST_CASE("makeExtractor wraps a closure", "[radixkey]")
{
    const auto byId = makeExtractor(2, [](const Record &r, core::usize i) {
        return RadixKeyTraits<core::u16>::digitAt(r.id, i);
    });
    static_assert(KeyExtractor<decltype(byId), Record>);

    const Record record{0xBEEF, 'x'};
    REQUIRE(byId.digitCount() == 2);
    REQUIRE(byId.digitAt(record, 0) == 0xBE);
    REQUIRE(byId.digitAt(record, 1) == 0xEF);
}

} // namespace rdx::radix
