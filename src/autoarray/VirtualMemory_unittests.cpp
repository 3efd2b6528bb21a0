#include "autoarray/VirtualMemory.hpp"

#include "autoarray/PageMath.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <errno.h>
#include <string>

namespace autoarray {

TEST_CASE("VirtualMemory system mapping") {
    VirtualMemory* vm = VirtualMemory::system();
    REQUIRE(vm);
    size_t pageSize = vm->pageSize();
    REQUIRE_GT(pageSize, 0);
    CHECK_EQ(pageSize & (pageSize - 1), 0);
    CHECK_EQ(vm, VirtualMemory::system());

    SUBCASE("system chosen address") {
        auto result = vm->map(nullptr, pageSize * 2);
        REQUIRE(result.status.isOk());
        REQUIRE(result.address);
        CHECK(isPageAligned(result.address, pageSize));
        // Anonymous mappings start zeroed.
        auto bytes = reinterpret_cast<uint8_t*>(result.address);
        CHECK_EQ(bytes[0], 0);
        CHECK_EQ(bytes[pageSize * 2 - 1], 0);
        bytes[pageSize] = 0xaa;
        CHECK_EQ(bytes[pageSize], 0xaa);
        CHECK(vm->unmap(result.address, pageSize * 2));
    }

    SUBCASE("fixed address") {
        auto reserved = vm->map(nullptr, pageSize * 4);
        REQUIRE(reserved.status.isOk());
        auto start = reinterpret_cast<uint8_t*>(reserved.address);

        // Occupied range is refused rather than replaced.
        auto collision = vm->map(start + pageSize, pageSize);
        CHECK(collision.status.isAddressOccupied());
        CHECK_EQ(collision.status.error, MapError::kAddressOccupied);
        CHECK_EQ(collision.address, nullptr);

        // Once freed, the same range can be claimed at exactly that address.
        REQUIRE(vm->unmap(start + pageSize, pageSize * 3));
        auto fixed = vm->map(start + pageSize, pageSize);
        REQUIRE(fixed.status.isOk());
        CHECK_EQ(fixed.address, start + pageSize);

        // Partial overlap also counts as occupied.
        auto partial = vm->map(start, pageSize * 3);
        CHECK(partial.status.isAddressOccupied());

        CHECK(vm->unmap(start, pageSize * 2));
    }

    SUBCASE("invalid request") {
        auto result = vm->map(nullptr, 0);
        CHECK_EQ(result.status.error, MapError::kOther);
        CHECK_EQ(result.status.systemError, EINVAL);
    }
}

TEST_CASE("MapStatus descriptions") {
    CHECK(MapStatus().isOk());
    CHECK_EQ(MapStatus::ok(), MapStatus());
    CHECK_NE(MapStatus::addressOccupied(EEXIST), MapStatus::other(EEXIST));
    CHECK_EQ(MapStatus().toString(), "ok");

    std::string occupied = MapStatus::addressOccupied(EEXIST).toString();
    CHECK_EQ(occupied.find("address occupied"), 0);
    CHECK_NE(occupied.find(std::to_string(EEXIST)), std::string::npos);

    std::string other = MapStatus::other(ENOMEM).toString();
    CHECK_EQ(other.find("mapping failed"), 0);
    CHECK_NE(other.find(std::to_string(ENOMEM)), std::string::npos);
}

} // namespace autoarray
