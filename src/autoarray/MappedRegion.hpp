#ifndef SRC_AUTOARRAY_MAPPED_REGION_HPP_
#define SRC_AUTOARRAY_MAPPED_REGION_HPP_

#include "autoarray/MapStatus.hpp"

#include <cstddef>
#include <cstdint>

namespace autoarray {

class VirtualMemory;

// Sole owner of one contiguous range of mapped memory. Unmaps the range on destruction. Move-only, so that a range never
// has two owners, including while an AutoArray hands its storage over to a relocated region.
class MappedRegion {
public:
    // An empty region that owns nothing.
    MappedRegion();
    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;
    MappedRegion(MappedRegion&& other) noexcept;
    // Releases the currently owned range before taking ownership of |other|'s.
    MappedRegion& operator=(MappedRegion&& other) noexcept;
    ~MappedRegion();

    // Maps |totalSize| bytes, at exactly |address| if it is not nullptr. On failure returns an empty region and sets
    // |status| to the reason.
    static MappedRegion map(VirtualMemory* virtualMemory, void* address, size_t totalSize, MapStatus& status);

    // Maps |additionalSize| bytes immediately after the end of this region, growing it in place. On failure the region
    // is unchanged.
    MapStatus extend(size_t additionalSize);

    bool isMapped() const { return m_startAddress != nullptr; }
    uint8_t* startAddress() const { return m_startAddress; }
    uint8_t* endAddress() const { return m_startAddress + m_totalSize; }
    size_t totalSize() const { return m_totalSize; }
    VirtualMemory* virtualMemory() const { return m_virtualMemory; }

private:
    MappedRegion(VirtualMemory* virtualMemory, uint8_t* startAddress, size_t totalSize);
    void unmap();

    VirtualMemory* m_virtualMemory;
    uint8_t* m_startAddress;
    // Total size of the region in bytes, always a multiple of the page size.
    size_t m_totalSize;
};

} // namespace autoarray

#endif // SRC_AUTOARRAY_MAPPED_REGION_HPP_
