#include "autoarray/AutoArray.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <cstring>
#include <errno.h>
#include <utility>

namespace {

struct TestStruct {
    uint64_t x;
    uint64_t y;
};

// Forwards to the system mapper, but can be told to fail fixed or system-placed requests with a chosen status.
class ScriptedVirtualMemory : public autoarray::VirtualMemory {
public:
    ScriptedVirtualMemory(): fixedMaps(0), placedMaps(0) {}
    virtual ~ScriptedVirtualMemory() = default;

    autoarray::MapResult map(void* address, size_t length) override {
        if (address) {
            ++fixedMaps;
            if (!failFixed.isOk()) {
                autoarray::MapResult result;
                result.status = failFixed;
                return result;
            }
        } else {
            ++placedMaps;
            if (!failPlaced.isOk()) {
                autoarray::MapResult result;
                result.status = failPlaced;
                return result;
            }
        }
        return autoarray::VirtualMemory::system()->map(address, length);
    }
    bool unmap(void* address, size_t length) override {
        return autoarray::VirtualMemory::system()->unmap(address, length);
    }
    size_t pageSize() const override { return autoarray::VirtualMemory::system()->pageSize(); }

    autoarray::MapStatus failFixed;
    autoarray::MapStatus failPlaced;
    int fixedMaps;
    int placedMaps;
};

// Returns the start of an address range of |length| bytes that was free when this function returned.
uint8_t* findFreeRange(size_t length) {
    auto vm = autoarray::VirtualMemory::system();
    auto result = vm->map(nullptr, length);
    REQUIRE(result.status.isOk());
    REQUIRE(vm->unmap(result.address, length));
    return reinterpret_cast<uint8_t*>(result.address);
}

size_t itemsPerPage() { return autoarray::VirtualMemory::system()->pageSize() / sizeof(TestStruct); }

} // namespace

namespace autoarray {

TEST_CASE("AutoArray create") {
    size_t pageSize = VirtualMemory::system()->pageSize();
    MapStatus status;

    SUBCASE("less than a page maps a full page") {
        uint8_t* base = findFreeRange(pageSize);
        auto array = AutoArray<TestStruct>::create(1, status, base);
        REQUIRE(array);
        CHECK(status.isOk());
        CHECK_EQ(static_cast<void*>(array->data()), base);
        CHECK_EQ(array->capacity(), itemsPerPage());
        CHECK_EQ(array->size(), 0);
        CHECK(array->empty());
        CHECK_EQ(array->mappedSize(), pageSize);
    }

    SUBCASE("rounds up to full pages") {
        uint8_t* base = findFreeRange(pageSize * 2);
        auto array = AutoArray<TestStruct>::create(itemsPerPage() + itemsPerPage() / 2, status, base);
        REQUIRE(array);
        CHECK_EQ(array->capacity(), itemsPerPage() * 2);
        CHECK_EQ(array->mappedSize(), pageSize * 2);
    }

    SUBCASE("zero capacity maps a page") {
        auto array = AutoArray<TestStruct>::create(0, status);
        REQUIRE(array);
        CHECK_EQ(array->capacity(), itemsPerPage());
        CHECK(isPageAligned(array->data(), pageSize));
    }

    SUBCASE("same request gives same capacity") {
        for (size_t request : {size_t(0), size_t(1), itemsPerPage() - 1, itemsPerPage(), itemsPerPage() * 5 + 3}) {
            auto first = AutoArray<TestStruct>::create(request, status);
            REQUIRE(first);
            auto second = AutoArray<TestStruct>::create(request, status);
            REQUIRE(second);
            CHECK_EQ(first->capacity(), second->capacity());
            CHECK_GE(first->capacity(), request);
            CHECK_NE(first->data(), second->data());
        }
    }

    SUBCASE("odd element size") {
        struct Triple {
            uint64_t a, b, c;
        };
        size_t request = pageSize / sizeof(Triple) + 1;
        auto array = AutoArray<Triple>::create(request, status);
        REQUIRE(array);
        CHECK_EQ(array->mappedSize(), ((request * sizeof(Triple) + pageSize - 1) / pageSize) * pageSize);
        CHECK_EQ(array->capacity(), array->mappedSize() / sizeof(Triple));
        CHECK_GE(array->capacity(), request);
    }

    SUBCASE("occupied base address") {
        auto blocker = AutoArray<TestStruct>::create(1, status);
        REQUIRE(blocker);
        auto array = AutoArray<TestStruct>::create(1, status, blocker->data());
        CHECK_FALSE(array);
        CHECK(status.isAddressOccupied());
    }

    SUBCASE("unaligned base address") {
        uint8_t* base = findFreeRange(pageSize);
        auto array = AutoArray<TestStruct>::create(1, status, base + 16);
        CHECK_FALSE(array);
        CHECK_EQ(status.error, MapError::kOther);
        CHECK_EQ(status.systemError, EINVAL);
    }

    SUBCASE("impossible size") {
        auto array = AutoArray<TestStruct>::create(maxElementCount(sizeof(TestStruct), pageSize) + 1, status);
        CHECK_FALSE(array);
        CHECK_EQ(status.error, MapError::kOther);
        CHECK_EQ(status.systemError, ENOMEM);
    }

    SUBCASE("system failure is surfaced") {
        ScriptedVirtualMemory vm;
        vm.failPlaced = MapStatus::other(ENOMEM);
        auto array = AutoArray<TestStruct>::create(10, status, nullptr, &vm);
        CHECK_FALSE(array);
        CHECK_EQ(status, MapStatus::other(ENOMEM));
        CHECK_EQ(vm.placedMaps, 1);
    }
}

TEST_CASE("AutoArray zero-copy expansion") {
    size_t pageSize = VirtualMemory::system()->pageSize();
    uint8_t* base = findFreeRange(pageSize * 4);
    MapStatus status;
    auto array = AutoArray<TestStruct>::create(itemsPerPage(), status, base);
    REQUIRE(array);
    TestStruct* originalData = array->data();

    for (size_t i = 0; i < itemsPerPage(); ++i) {
        (*array)[i] = TestStruct{i, i * 3};
    }
    array->setSize(itemsPerPage());

    status = array->expand(itemsPerPage() * 2);
    REQUIRE(status.isOk());
    CHECK_EQ(array->data(), originalData);
    CHECK_EQ(array->capacity(), itemsPerPage() * 2);
    CHECK_EQ(array->mappedSize(), pageSize * 2);
    CHECK_EQ(array->size(), itemsPerPage());

    // The second page is readable, zeroed, and writable.
    CHECK_EQ((*array)[itemsPerPage()].x, 0);
    (*array)[itemsPerPage()] = TestStruct{1998, 1998};
    CHECK_EQ((*array)[itemsPerPage()].x, 1998);

    for (size_t i = 0; i < itemsPerPage(); ++i) {
        CHECK_EQ((*array)[i].x, i);
        CHECK_EQ((*array)[i].y, i * 3);
    }

    // Growth by less than a page still maps a whole page.
    status = array->expand(itemsPerPage() * 2 + 1);
    REQUIRE(status.isOk());
    CHECK_EQ(array->data(), originalData);
    CHECK_EQ(array->capacity(), itemsPerPage() * 3);
}

TEST_CASE("AutoArray fallback expansion when address space is occupied") {
    size_t pageSize = VirtualMemory::system()->pageSize();
    uint8_t* base = findFreeRange(pageSize * 2);
    MapStatus status;
    auto array = AutoArray<TestStruct>::create(itemsPerPage(), status, base);
    REQUIRE(array);

    // Map the next page to force a fallback.
    auto blocker = VirtualMemory::system()->map(base + pageSize, pageSize);
    REQUIRE(blocker.status.isOk());
    REQUIRE_EQ(blocker.address, base + pageSize);

    size_t size = itemsPerPage() / 2;
    for (size_t i = 0; i < itemsPerPage(); ++i) {
        (*array)[i] = TestStruct{i + 100, i + 200};
    }
    array->setSize(size);
    TestStruct* originalData = array->data();

    status = array->expand(itemsPerPage() + itemsPerPage() / 6);
    REQUIRE(status.isOk());
    CHECK_NE(array->data(), originalData);
    CHECK(isPageAligned(array->data(), pageSize));
    CHECK_EQ(array->capacity(), itemsPerPage() * 2);
    CHECK_EQ(array->size(), size);

    // Only the first size() elements are carried over.
    for (size_t i = 0; i < size; ++i) {
        CHECK_EQ((*array)[i].x, i + 100);
        CHECK_EQ((*array)[i].y, i + 200);
    }
    CHECK_EQ((*array)[size].x, 0);
    CHECK_EQ((*array)[itemsPerPage() * 2 - 1].y, 0);

    // The old region is released, and can be claimed again.
    auto reclaimed = VirtualMemory::system()->map(base, pageSize);
    CHECK(reclaimed.status.isOk());
    CHECK_EQ(reclaimed.address, base);
    if (reclaimed.status.isOk()) {
        CHECK(VirtualMemory::system()->unmap(base, pageSize));
    }
    CHECK(VirtualMemory::system()->unmap(blocker.address, pageSize));
}

TEST_CASE("AutoArray expansion failures") {
    ScriptedVirtualMemory vm;
    MapStatus status;
    auto array = AutoArray<TestStruct>::create(itemsPerPage(), status, nullptr, &vm);
    REQUIRE(array);
    (*array)[0] = TestStruct{42, 43};
    array->setSize(1);
    TestStruct* originalData = array->data();
    size_t originalCapacity = array->capacity();

    SUBCASE("other errors skip the fallback") {
        vm.failFixed = MapStatus::other(ENOMEM);
        status = array->expand(originalCapacity * 4);
        CHECK_EQ(status, MapStatus::other(ENOMEM));
        CHECK_EQ(vm.fixedMaps, 1);
        CHECK_EQ(vm.placedMaps, 1);
        CHECK_EQ(array->data(), originalData);
        CHECK_EQ(array->capacity(), originalCapacity);
    }

    SUBCASE("occupied address falls back") {
        vm.failFixed = MapStatus::addressOccupied(EEXIST);
        status = array->expand(originalCapacity * 4);
        CHECK(status.isOk());
        CHECK_EQ(vm.fixedMaps, 1);
        CHECK_EQ(vm.placedMaps, 2);
        CHECK_NE(array->data(), originalData);
        CHECK_EQ(array->capacity(), originalCapacity * 4);
        CHECK_EQ((*array)[0].x, 42);
        CHECK_EQ((*array)[0].y, 43);
    }

    SUBCASE("failed fallback leaves the array intact") {
        vm.failFixed = MapStatus::addressOccupied(EEXIST);
        vm.failPlaced = MapStatus::other(ENOMEM);
        status = array->expand(originalCapacity * 4);
        CHECK_EQ(status, MapStatus::other(ENOMEM));
        CHECK_EQ(array->data(), originalData);
        CHECK_EQ(array->capacity(), originalCapacity);
        CHECK_EQ(array->size(), 1);
        CHECK_EQ((*array)[0].x, 42);
    }
}

TEST_CASE("AutoArray emplaceBack") {
    MapStatus status;
    auto array = AutoArray<TestStruct>::create(0, status);
    REQUIRE(array);
    size_t initialCapacity = array->capacity();

    for (size_t i = 0; i < initialCapacity * 3; ++i) {
        TestStruct* element = array->emplaceBack(TestStruct{i, ~i});
        REQUIRE(element);
        CHECK_EQ(element, array->data() + i);
    }
    CHECK_EQ(array->size(), initialCapacity * 3);
    CHECK_EQ(array->capacity(), initialCapacity * 4);

    size_t index = 0;
    for (const auto& element : *array) {
        CHECK_EQ(element.x, index);
        CHECK_EQ(element.y, ~index);
        ++index;
    }
    CHECK_EQ(index, array->size());

    SUBCASE("growth failure") {
        ScriptedVirtualMemory vm;
        auto full = AutoArray<uint8_t>::create(0, status, nullptr, &vm);
        REQUIRE(full);
        full->setSize(full->capacity());
        vm.failFixed = MapStatus::other(ENOMEM);
        CHECK_EQ(full->emplaceBack(uint8_t(1)), nullptr);
        CHECK_EQ(full->size(), full->capacity());
    }
}

TEST_CASE("AutoArray move") {
    MapStatus status;
    auto array = AutoArray<TestStruct>::create(10, status);
    REQUIRE(array);
    (*array)[3] = TestStruct{3, 4};
    array->setSize(4);
    TestStruct* data = array->data();
    size_t capacity = array->capacity();

    AutoArray<TestStruct> moved(std::move(*array));
    CHECK_EQ(moved.data(), data);
    CHECK_EQ(moved.capacity(), capacity);
    CHECK_EQ(moved.size(), 4);
    CHECK_EQ(moved[3].y, 4);
    CHECK_EQ(array->data(), nullptr);
    CHECK_EQ(array->capacity(), 0);
    CHECK_EQ(array->size(), 0);

    auto other = AutoArray<TestStruct>::create(10, status);
    REQUIRE(other);
    *other = std::move(moved);
    CHECK_EQ(other->data(), data);
    CHECK_EQ(moved.data(), nullptr);
}

} // namespace autoarray
