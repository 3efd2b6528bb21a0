#ifndef SRC_AUTOARRAY_PAGE_MATH_HPP_
#define SRC_AUTOARRAY_PAGE_MATH_HPP_

#include <cstddef>

// Page-granular sizing arithmetic. Kept free of system calls so the rounding rules can be tested against any page size.
namespace autoarray {

// Number of whole elements of |elementSize| bytes that fit in one page.
size_t elementsPerPage(size_t elementSize, size_t pageSize);

// Number of pages needed to hold at least |elementCount| elements. Always at least one page, so an empty request still
// maps a page.
size_t pagesFor(size_t elementCount, size_t elementSize, size_t pageSize);

// Largest element count the functions below accept without overflowing the byte arithmetic.
size_t maxElementCount(size_t elementSize, size_t pageSize);

// Mapped byte size for |elementCount| elements, a non-zero multiple of |pageSize|.
size_t mappedSizeFor(size_t elementCount, size_t elementSize, size_t pageSize);

// Number of element slots backed by |mappedSize| bytes.
size_t capacityFor(size_t mappedSize, size_t elementSize);

bool isPageAligned(const void* address, size_t pageSize);

} // namespace autoarray

#endif // SRC_AUTOARRAY_PAGE_MATH_HPP_
