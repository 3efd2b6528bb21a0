#include "autoarray/VirtualMemory.hpp"

#include "spdlog/spdlog.h"

#include <errno.h>
#include <string.h>

#if defined(unix) || defined(__unix) || defined(__unix__) || defined(__APPLE__)
#    include <sys/mman.h>
#    include <unistd.h>
#else
#    error "Platform not supported"
#endif

// Older headers lack the flag. Kernels before 4.17 ignore it and treat the address as a hint, which map() detects.
#if defined(__linux__) && !defined(MAP_FIXED_NOREPLACE)
#    define MAP_FIXED_NOREPLACE 0x100000
#endif

namespace autoarray {

VirtualMemory* VirtualMemory::system() {
    static SystemVirtualMemory systemVirtualMemory;
    return &systemVirtualMemory;
}

SystemVirtualMemory::SystemVirtualMemory(): m_pageSize(static_cast<size_t>(sysconf(_SC_PAGESIZE))) {}

MapResult SystemVirtualMemory::map(void* address, size_t length) {
    MapResult result;
    int flags = MAP_PRIVATE | MAP_ANONYMOUS;
    if (address) {
#if defined(MAP_FIXED_NOREPLACE)
        flags |= MAP_FIXED_NOREPLACE;
#endif
    }

    void* mapped = mmap(address, length, PROT_READ | PROT_WRITE, flags, -1, 0);
    if (mapped == MAP_FAILED) {
        int mmapError = errno;
        if (address && mmapError == EEXIST) {
            result.status = MapStatus::addressOccupied(mmapError);
            return result;
        }
        SPDLOG_ERROR("VM map failed for {} bytes at {}, errno: {}, string: {}", length, address, mmapError,
                     strerror(mmapError));
        result.status = MapStatus::other(mmapError);
        return result;
    }

    // Without kernel support for fixed no-replace mappings the address is only a hint, and the kernel moves the
    // mapping elsewhere when the range is taken.
    if (address && mapped != address) {
        SPDLOG_DEBUG("VM map placed {} bytes at {} instead of {}, treating as occupied", length, mapped, address);
        if (munmap(mapped, length) != 0) {
            int munmapError = errno;
            SPDLOG_ERROR("VM munmap of misplaced mapping failed errno: {}, string: {}", munmapError,
                         strerror(munmapError));
        }
        result.status = MapStatus::addressOccupied(EEXIST);
        return result;
    }

    result.address = mapped;
    return result;
}

bool SystemVirtualMemory::unmap(void* address, size_t length) {
    if (munmap(address, length) != 0) {
        int munmapError = errno;
        SPDLOG_ERROR("VM munmap failed for {} bytes at {}, errno: {}, string: {}", length, address, munmapError,
                     strerror(munmapError));
        return false;
    }
    return true;
}

} // namespace autoarray
