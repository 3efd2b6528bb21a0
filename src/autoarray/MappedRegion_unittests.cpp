#include "autoarray/MappedRegion.hpp"

#include "autoarray/VirtualMemory.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <utility>

namespace {

// Forwards to the system, keeping count of what is currently mapped.
class CountingVirtualMemory : public autoarray::VirtualMemory {
public:
    CountingVirtualMemory(): mappedBytes(0), unmapCalls(0) {}
    virtual ~CountingVirtualMemory() = default;

    autoarray::MapResult map(void* address, size_t length) override {
        auto result = autoarray::VirtualMemory::system()->map(address, length);
        if (result.status.isOk()) {
            mappedBytes += length;
        }
        return result;
    }
    bool unmap(void* address, size_t length) override {
        ++unmapCalls;
        mappedBytes -= length;
        return autoarray::VirtualMemory::system()->unmap(address, length);
    }
    size_t pageSize() const override { return autoarray::VirtualMemory::system()->pageSize(); }

    size_t mappedBytes;
    int unmapCalls;
};

} // namespace

namespace autoarray {

TEST_CASE("MappedRegion ownership") {
    CountingVirtualMemory vm;
    size_t pageSize = vm.pageSize();

    SUBCASE("default is empty") {
        MappedRegion region;
        CHECK_FALSE(region.isMapped());
        CHECK_EQ(region.startAddress(), nullptr);
        CHECK_EQ(region.totalSize(), 0);
    }

    SUBCASE("destructor unmaps") {
        {
            MapStatus status;
            auto region = MappedRegion::map(&vm, nullptr, pageSize * 3, status);
            REQUIRE(status.isOk());
            CHECK(region.isMapped());
            CHECK_EQ(region.totalSize(), pageSize * 3);
            CHECK_EQ(region.endAddress(), region.startAddress() + pageSize * 3);
            CHECK_EQ(region.virtualMemory(), &vm);
            CHECK_EQ(vm.mappedBytes, pageSize * 3);
        }
        CHECK_EQ(vm.mappedBytes, 0);
        CHECK_EQ(vm.unmapCalls, 1);
    }

    SUBCASE("move construction transfers ownership") {
        MapStatus status;
        auto region = MappedRegion::map(&vm, nullptr, pageSize, status);
        REQUIRE(status.isOk());
        uint8_t* start = region.startAddress();
        {
            MappedRegion moved(std::move(region));
            CHECK_FALSE(region.isMapped());
            CHECK_EQ(region.totalSize(), 0);
            CHECK_EQ(moved.startAddress(), start);
            CHECK_EQ(moved.totalSize(), pageSize);
        }
        CHECK_EQ(vm.unmapCalls, 1);
        CHECK_EQ(vm.mappedBytes, 0);
    }

    SUBCASE("move assignment releases the previous range") {
        MapStatus status;
        auto first = MappedRegion::map(&vm, nullptr, pageSize, status);
        REQUIRE(status.isOk());
        auto second = MappedRegion::map(&vm, nullptr, pageSize * 2, status);
        REQUIRE(status.isOk());
        uint8_t* secondStart = second.startAddress();

        first = std::move(second);
        CHECK_EQ(vm.unmapCalls, 1);
        CHECK_EQ(vm.mappedBytes, pageSize * 2);
        CHECK_EQ(first.startAddress(), secondStart);
        CHECK_EQ(first.totalSize(), pageSize * 2);
        CHECK_FALSE(second.isMapped());
    }

    SUBCASE("failed map yields an empty region") {
        MapStatus status;
        auto blocker = MappedRegion::map(&vm, nullptr, pageSize, status);
        REQUIRE(status.isOk());
        auto region = MappedRegion::map(&vm, blocker.startAddress(), pageSize, status);
        CHECK(status.isAddressOccupied());
        CHECK_FALSE(region.isMapped());
    }
}

TEST_CASE("MappedRegion extend") {
    CountingVirtualMemory vm;
    size_t pageSize = vm.pageSize();

    // Claim a range and give it back so the pages after the region start out free.
    MapStatus status;
    uint8_t* start = nullptr;
    {
        auto scratch = MappedRegion::map(&vm, nullptr, pageSize * 8, status);
        REQUIRE(status.isOk());
        start = scratch.startAddress();
    }

    auto region = MappedRegion::map(&vm, start, pageSize, status);
    REQUIRE(status.isOk());
    REQUIRE_EQ(region.startAddress(), start);
    region.startAddress()[0] = 7;

    SUBCASE("adjacent pages free") {
        status = region.extend(pageSize * 2);
        REQUIRE(status.isOk());
        CHECK_EQ(region.startAddress(), start);
        CHECK_EQ(region.totalSize(), pageSize * 3);
        CHECK_EQ(region.startAddress()[0], 7);
        CHECK_EQ(region.startAddress()[pageSize * 3 - 1], 0);
        region.startAddress()[pageSize * 3 - 1] = 9;
        CHECK_EQ(region.startAddress()[pageSize * 3 - 1], 9);
    }

    SUBCASE("adjacent pages occupied") {
        auto blocker = MappedRegion::map(&vm, start + pageSize, pageSize, status);
        REQUIRE(status.isOk());
        status = region.extend(pageSize);
        CHECK(status.isAddressOccupied());
        CHECK_EQ(region.startAddress(), start);
        CHECK_EQ(region.totalSize(), pageSize);
    }
}

TEST_CASE("MappedRegion extended region unmaps as one") {
    CountingVirtualMemory vm;
    size_t pageSize = vm.pageSize();
    MapStatus status;
    uint8_t* start = nullptr;
    {
        auto scratch = MappedRegion::map(&vm, nullptr, pageSize * 4, status);
        REQUIRE(status.isOk());
        start = scratch.startAddress();
    }
    {
        auto region = MappedRegion::map(&vm, start, pageSize, status);
        REQUIRE(status.isOk());
        REQUIRE(region.extend(pageSize * 3).isOk());
        CHECK_EQ(vm.mappedBytes, pageSize * 4);
    }
    CHECK_EQ(vm.mappedBytes, 0);

    // The whole range is free again.
    auto again = MappedRegion::map(&vm, start, pageSize * 4, status);
    CHECK(status.isOk());
    CHECK_EQ(again.startAddress(), start);
}

} // namespace autoarray
