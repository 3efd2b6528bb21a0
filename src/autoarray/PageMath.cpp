#include "autoarray/PageMath.hpp"

#include <cassert>
#include <cstdint>
#include <limits>

namespace autoarray {

size_t elementsPerPage(size_t elementSize, size_t pageSize) {
    assert(elementSize > 0);
    assert(elementSize <= pageSize);
    return pageSize / elementSize;
}

size_t pagesFor(size_t elementCount, size_t elementSize, size_t pageSize) {
    assert(elementCount <= maxElementCount(elementSize, pageSize));
    size_t byteCount = elementCount * elementSize;
    size_t pages = (byteCount + pageSize - 1) / pageSize;
    return pages > 0 ? pages : 1;
}

size_t maxElementCount(size_t elementSize, size_t pageSize) {
    assert(elementSize > 0);
    // Leave room for rounding the byte count up to the next page without overflow.
    return (std::numeric_limits<size_t>::max() - pageSize) / elementSize;
}

size_t mappedSizeFor(size_t elementCount, size_t elementSize, size_t pageSize) {
    return pagesFor(elementCount, elementSize, pageSize) * pageSize;
}

size_t capacityFor(size_t mappedSize, size_t elementSize) {
    assert(elementSize > 0);
    return mappedSize / elementSize;
}

bool isPageAligned(const void* address, size_t pageSize) {
    return (reinterpret_cast<uintptr_t>(address) % pageSize) == 0;
}

} // namespace autoarray
