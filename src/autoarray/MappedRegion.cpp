#include "autoarray/MappedRegion.hpp"

#include "autoarray/PageMath.hpp"
#include "autoarray/VirtualMemory.hpp"

#include "spdlog/spdlog.h"

#include <cassert>

namespace autoarray {

MappedRegion::MappedRegion(): m_virtualMemory(nullptr), m_startAddress(nullptr), m_totalSize(0) {}

MappedRegion::MappedRegion(VirtualMemory* virtualMemory, uint8_t* startAddress, size_t totalSize):
    m_virtualMemory(virtualMemory),
    m_startAddress(startAddress),
    m_totalSize(totalSize) {}

MappedRegion::MappedRegion(MappedRegion&& other) noexcept:
    m_virtualMemory(other.m_virtualMemory),
    m_startAddress(other.m_startAddress),
    m_totalSize(other.m_totalSize) {
    other.m_virtualMemory = nullptr;
    other.m_startAddress = nullptr;
    other.m_totalSize = 0;
}

MappedRegion& MappedRegion::operator=(MappedRegion&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    unmap();
    m_virtualMemory = other.m_virtualMemory;
    m_startAddress = other.m_startAddress;
    m_totalSize = other.m_totalSize;
    other.m_virtualMemory = nullptr;
    other.m_startAddress = nullptr;
    other.m_totalSize = 0;
    return *this;
}

MappedRegion::~MappedRegion() { unmap(); }

// static
MappedRegion MappedRegion::map(VirtualMemory* virtualMemory, void* address, size_t totalSize, MapStatus& status) {
    assert(virtualMemory);
    assert(totalSize > 0);
    assert(totalSize % virtualMemory->pageSize() == 0);
    assert(isPageAligned(address, virtualMemory->pageSize()));

    auto result = virtualMemory->map(address, totalSize);
    status = result.status;
    if (!status.isOk()) {
        return MappedRegion();
    }
    return MappedRegion(virtualMemory, reinterpret_cast<uint8_t*>(result.address), totalSize);
}

MapStatus MappedRegion::extend(size_t additionalSize) {
    assert(isMapped());
    assert(additionalSize > 0);
    assert(additionalSize % m_virtualMemory->pageSize() == 0);

    auto result = m_virtualMemory->map(endAddress(), additionalSize);
    if (!result.status.isOk()) {
        return result.status;
    }
    assert(result.address == endAddress());
    m_totalSize += additionalSize;
    return result.status;
}

void MappedRegion::unmap() {
    if (m_startAddress == nullptr) {
        return;
    }

    // The range may span several kernel mappings after extend(), a single munmap releases all of them.
    if (!m_virtualMemory->unmap(m_startAddress, m_totalSize)) {
        SPDLOG_ERROR("MappedRegion unmap failed for {} bytes", m_totalSize);
    }

    m_virtualMemory = nullptr;
    m_startAddress = nullptr;
    m_totalSize = 0;
}

} // namespace autoarray
