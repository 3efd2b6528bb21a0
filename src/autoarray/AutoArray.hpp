#ifndef SRC_AUTOARRAY_AUTO_ARRAY_HPP_
#define SRC_AUTOARRAY_AUTO_ARRAY_HPP_

#include "autoarray/MapStatus.hpp"
#include "autoarray/MappedRegion.hpp"
#include "autoarray/PageMath.hpp"
#include "autoarray/VirtualMemory.hpp"

#include "spdlog/spdlog.h"

#include <cassert>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace autoarray {

// A contiguous array of T stored directly in pages mapped from the operating system. Growing the array first tries to
// map the pages directly after the current ones, which leaves every element (and every pointer to one) where it is.
// Only if that address range is taken does it relocate to a new mapping and copy the first size() elements over.
//
// The array tracks capacity, while size() is maintained by the owner, either through setSize() after writing
// elements through data(), or with emplaceBack(). Elements are never destroyed, so T must be trivially copyable.
//
// Not thread-safe.
template <typename T> class AutoArray {
    static_assert(std::is_trivially_copyable<T>::value, "AutoArray relocates elements by copying bytes");

public:
    using iterator = T*;
    using const_iterator = const T*;

    AutoArray() = delete;
    AutoArray(const AutoArray&) = delete;
    AutoArray& operator=(const AutoArray&) = delete;
    AutoArray(AutoArray&& other) noexcept:
        m_region(std::move(other.m_region)), m_capacity(other.m_capacity), m_size(other.m_size) {
        other.m_capacity = 0;
        other.m_size = 0;
    }
    AutoArray& operator=(AutoArray&& other) noexcept {
        if (this == &other) {
            return *this;
        }
        m_region = std::move(other.m_region);
        m_capacity = other.m_capacity;
        m_size = other.m_size;
        other.m_capacity = 0;
        other.m_size = 0;
        return *this;
    }
    // Unmaps the whole region.
    ~AutoArray() = default;

    // Maps room for at least |initialCapacity| elements, rounded up to whole pages. If |baseAddress| is not nullptr the
    // region must start exactly there, and creation fails with kAddressOccupied if that range is already mapped.
    // Returns an empty optional on failure, with the reason in |status|.
    static std::optional<AutoArray<T>> create(size_t initialCapacity, MapStatus& status, void* baseAddress = nullptr,
                                              VirtualMemory* virtualMemory = nullptr) {
        if (!virtualMemory) {
            virtualMemory = VirtualMemory::system();
        }
        size_t pageSize = virtualMemory->pageSize();
        if (sizeof(T) > pageSize || initialCapacity > maxElementCount(sizeof(T), pageSize)) {
            status = MapStatus::other(ENOMEM);
            return std::nullopt;
        }
        if (!isPageAligned(baseAddress, pageSize)) {
            status = MapStatus::other(EINVAL);
            return std::nullopt;
        }

        size_t mappedSize = mappedSizeFor(initialCapacity, sizeof(T), pageSize);
        auto region = MappedRegion::map(virtualMemory, baseAddress, mappedSize, status);
        if (!status.isOk()) {
            return std::nullopt;
        }
        return AutoArray<T>(std::move(region));
    }

    // Grows the capacity to at least |newCapacity|, which must exceed capacity(). Prefers mapping the pages adjacent to
    // the current region, keeping data() stable. If they are occupied, maps a fresh region wherever the system places
    // it, copies the first size() elements, and releases the old region. Any other mapping failure is returned as is
    // and leaves the array unchanged.
    MapStatus expand(size_t newCapacity) {
        assert(newCapacity > m_capacity);
        VirtualMemory* virtualMemory = m_region.virtualMemory();
        size_t pageSize = virtualMemory->pageSize();
        if (newCapacity > maxElementCount(sizeof(T), pageSize)) {
            return MapStatus::other(ENOMEM);
        }

        size_t currentMappedSize = m_region.totalSize();
        size_t expandedMappedSize = mappedSizeFor(newCapacity, sizeof(T), pageSize);
        assert(expandedMappedSize > currentMappedSize);

        auto status = m_region.extend(expandedMappedSize - currentMappedSize);
        if (status.isOk()) {
            SPDLOG_DEBUG("AutoArray grew in place at {} from {} to {} bytes", static_cast<void*>(data()),
                         currentMappedSize, expandedMappedSize);
        } else if (status.isAddressOccupied()) {
            auto relocated = MappedRegion::map(virtualMemory, nullptr, expandedMappedSize, status);
            if (!status.isOk()) {
                return status;
            }
            std::memcpy(relocated.startAddress(), m_region.startAddress(), m_size * sizeof(T));
            SPDLOG_DEBUG("AutoArray relocated {} elements from {} to {}, {} bytes", m_size,
                         static_cast<void*>(m_region.startAddress()), static_cast<void*>(relocated.startAddress()),
                         expandedMappedSize);
            // Releases the old region only now that the copy is complete.
            m_region = std::move(relocated);
        } else {
            return status;
        }

        m_capacity = capacityFor(m_region.totalSize(), sizeof(T));
        return status;
    }

    // Constructs a new element at index size(), doubling the capacity first if the array is full. Returns nullptr and
    // leaves the array unchanged if that growth fails.
    template <typename... Args> T* emplaceBack(Args&&... args) {
        if (m_size == m_capacity) {
            if (!expand(m_capacity * 2).isOk()) {
                return nullptr;
            }
        }
        T* element = new (data() + m_size) T(std::forward<Args>(args)...);
        ++m_size;
        return element;
    }

    T* data() { return reinterpret_cast<T*>(m_region.startAddress()); }
    const T* data() const { return reinterpret_cast<const T*>(m_region.startAddress()); }
    T& operator[](size_t index) { return data()[index]; }
    const T& operator[](size_t index) const { return data()[index]; }

    iterator begin() { return data(); }
    const_iterator begin() const { return data(); }
    iterator end() { return data() + m_size; }
    const_iterator end() const { return data() + m_size; }

    size_t capacity() const { return m_capacity; }
    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }
    // Number of elements at the front of the array holding valid data. These are the elements preserved by expand().
    void setSize(size_t size) {
        assert(size <= m_capacity);
        m_size = size;
    }
    size_t mappedSize() const { return m_region.totalSize(); }

private:
    explicit AutoArray(MappedRegion&& region):
        m_region(std::move(region)), m_capacity(capacityFor(m_region.totalSize(), sizeof(T))), m_size(0) {}

    MappedRegion m_region;
    size_t m_capacity;
    size_t m_size;
};

} // namespace autoarray

#endif // SRC_AUTOARRAY_AUTO_ARRAY_HPP_
