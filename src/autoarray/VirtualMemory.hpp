#ifndef SRC_AUTOARRAY_VIRTUAL_MEMORY_HPP_
#define SRC_AUTOARRAY_VIRTUAL_MEMORY_HPP_

#include "autoarray/MapStatus.hpp"

#include <cstddef>

namespace autoarray {

struct MapResult {
    void* address = nullptr;
    MapStatus status;
};

// Boundary to the operating system's virtual memory subsystem. All mappings are private, anonymous, and read/write.
class VirtualMemory {
public:
    VirtualMemory() = default;
    virtual ~VirtualMemory() = default;

    // Maps |length| bytes. If |address| is nullptr the system picks the placement, otherwise the mapping must land
    // exactly at |address| and fails with kAddressOccupied if any part of the range is already mapped.
    virtual MapResult map(void* address, size_t length) = 0;
    virtual bool unmap(void* address, size_t length) = 0;
    virtual size_t pageSize() const = 0;

    // Process-wide instance backed by mmap/munmap.
    static VirtualMemory* system();
};

class SystemVirtualMemory : public VirtualMemory {
public:
    SystemVirtualMemory();
    virtual ~SystemVirtualMemory() = default;

    MapResult map(void* address, size_t length) override;
    bool unmap(void* address, size_t length) override;
    size_t pageSize() const override { return m_pageSize; }

private:
    size_t m_pageSize;
};

} // namespace autoarray

#endif // SRC_AUTOARRAY_VIRTUAL_MEMORY_HPP_
