#include "autoarray/PageMath.hpp"

#include "doctest/doctest.h"

#include <cstdint>

namespace autoarray {

TEST_CASE("PageMath rounding") {
    SUBCASE("16 byte elements in 4096 byte pages") {
        CHECK_EQ(elementsPerPage(16, 4096), 256);
        CHECK_EQ(mappedSizeFor(1, 16, 4096), 4096);
        CHECK_EQ(capacityFor(mappedSizeFor(1, 16, 4096), 16), 256);
        CHECK_EQ(mappedSizeFor(384, 16, 4096), 8192);
        CHECK_EQ(capacityFor(mappedSizeFor(384, 16, 4096), 16), 512);
        CHECK_EQ(capacityFor(mappedSizeFor(300, 16, 4096), 16), 512);
    }

    SUBCASE("zero elements still map a page") {
        CHECK_EQ(pagesFor(0, 16, 4096), 1);
        CHECK_EQ(mappedSizeFor(0, 16, 4096), 4096);
        CHECK_EQ(mappedSizeFor(0, 1, 65536), 65536);
    }

    SUBCASE("exact page multiples do not round up") {
        CHECK_EQ(pagesFor(256, 16, 4096), 1);
        CHECK_EQ(pagesFor(257, 16, 4096), 2);
        CHECK_EQ(pagesFor(512, 16, 4096), 2);
        CHECK_EQ(pagesFor(4096, 1, 4096), 1);
        CHECK_EQ(pagesFor(4097, 1, 4096), 2);
    }

    SUBCASE("one and a half pages rounds to two") {
        size_t perPage = elementsPerPage(16, 16384);
        CHECK_EQ(capacityFor(mappedSizeFor(perPage + perPage / 2, 16, 16384), 16), perPage * 2);
    }

    SUBCASE("element sizes that do not divide the page") {
        // 4096 / 24 leaves a 16 byte remainder per page, which two pages pool into an extra slot.
        CHECK_EQ(capacityFor(mappedSizeFor(1, 24, 4096), 24), 170);
        CHECK_EQ(mappedSizeFor(341, 24, 4096), 8192);
        CHECK_EQ(capacityFor(8192, 24), 341);
        CHECK_EQ(mappedSizeFor(342, 24, 4096), 12288);
    }

    SUBCASE("capacity formula holds across sizes") {
        const size_t pageSizes[] = {4096, 16384, 65536};
        const size_t elementSizes[] = {1, 3, 8, 16, 24, 100, 4096};
        for (auto pageSize : pageSizes) {
            for (auto elementSize : elementSizes) {
                for (size_t count = 0; count < 3 * pageSize / elementSize + 2; count += 7) {
                    size_t mappedSize = mappedSizeFor(count, elementSize, pageSize);
                    size_t capacity = capacityFor(mappedSize, elementSize);
                    size_t pages = (count * elementSize + pageSize - 1) / pageSize;
                    CHECK_EQ(mappedSize % pageSize, 0);
                    CHECK_EQ(mappedSize, (pages > 0 ? pages : 1) * pageSize);
                    CHECK_GE(capacity, count);
                    CHECK_GE(capacity, elementsPerPage(elementSize, pageSize));
                }
            }
        }
    }
}

TEST_CASE("PageMath limits") {
    size_t maxCount = maxElementCount(16, 4096);
    CHECK_GT(maxCount, 0);
    CHECK_EQ(mappedSizeFor(maxCount, 16, 4096) % 4096, 0);
}

TEST_CASE("PageMath alignment") {
    CHECK(isPageAligned(nullptr, 4096));
    CHECK(isPageAligned(reinterpret_cast<void*>(0x40000000), 4096));
    CHECK(isPageAligned(reinterpret_cast<void*>(0x1000), 4096));
    CHECK_FALSE(isPageAligned(reinterpret_cast<void*>(0x1008), 4096));
    CHECK_FALSE(isPageAligned(reinterpret_cast<void*>(0x1000), 16384));
}

} // namespace autoarray
