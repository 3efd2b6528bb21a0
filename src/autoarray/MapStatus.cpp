#include "autoarray/MapStatus.hpp"

#include "fmt/format.h"

#include <string.h>

namespace autoarray {

std::string MapStatus::toString() const {
    switch (error) {
    case MapError::kNone:
        return "ok";
    case MapError::kAddressOccupied:
        return fmt::format("address occupied (errno {}: {})", systemError, strerror(systemError));
    case MapError::kOther:
        return fmt::format("mapping failed (errno {}: {})", systemError, strerror(systemError));
    }
    return "unknown";
}

} // namespace autoarray
