/**
 * @file TestCountingSort.cpp
 * @brief Unit tests for the LSD counting sort.
 */

#include <catch2/catch.hpp>

#include "rdx/radix/CountingSort.hpp"

#include <algorithm>
#include <memory>
#include <random>
#include <vector>

namespace rdx::radix {

TEST_CASE("lsdCountingSort sorts on every remaining digit", "[countingsort]")
{
    std::mt19937 rng{99};
    std::vector<core::u32> items(5000);
    for (auto &v : items)
        v = rng();

    auto expected = items;
    std::sort(expected.begin(), expected.end());

    lsdCountingSort(std::span<core::u32>{items}, TraitsExtractor<core::u32>{}, 0);
    REQUIRE(items == expected);
}

TEST_CASE("lsdCountingSort ignores digits before fromDigit", "[countingsort]")
{
    // Callers only hand over ranges whose leading digits are equal, so
    // digit 0 differing here shows it is not consulted.
    std::vector<core::u16> items = {0x0105, 0x0203, 0x0304, 0x0401};
    lsdCountingSort(std::span<core::u16>{items}, TraitsExtractor<core::u16>{}, 1);
    REQUIRE(items == std::vector<core::u16>{0x0401, 0x0203, 0x0304, 0x0105});
}

TEST_CASE("lsdCountingSort leaves uniform input untouched", "[countingsort]")
{
    std::vector<core::u32> items(300, 0xDEADBEEFu);
    lsdCountingSort(std::span<core::u32>{items}, TraitsExtractor<core::u32>{}, 0);
    REQUIRE(std::all_of(items.begin(), items.end(), [](core::u32 v) { return v == 0xDEADBEEFu; }));
}

TEST_CASE("lsdCountingSort runs a single pass when one digit varies", "[countingsort]")
{
    std::vector<core::u32> items;
    for (core::u32 i = 0; i < 200; ++i)
        items.push_back(0x11220033u | ((199 - i) << 8));

    lsdCountingSort(std::span<core::u32>{items}, TraitsExtractor<core::u32>{}, 0);
    REQUIRE(std::is_sorted(items.begin(), items.end()));
}

TEST_CASE("lsdCountingSort works with move-only items", "[countingsort]")
{
    std::vector<std::unique_ptr<core::u16>> items;
    for (core::u16 v : {300, 2, 65535, 0, 300, 7})
        items.push_back(std::make_unique<core::u16>(v));

    const auto extractor = makeExtractor(2, [](const std::unique_ptr<core::u16> &p, core::usize i) {
        return RadixKeyTraits<core::u16>::digitAt(*p, i);
    });
    lsdCountingSort(std::span<std::unique_ptr<core::u16>>{items}, extractor, 0);

    std::vector<core::u16> values;
    for (const auto &p : items)
        values.push_back(*p);
    REQUIRE(values == std::vector<core::u16>{0, 2, 7, 300, 300, 65535});
}

} // namespace rdx::radix
