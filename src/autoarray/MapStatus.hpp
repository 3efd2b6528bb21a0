#ifndef SRC_AUTOARRAY_MAP_STATUS_HPP_
#define SRC_AUTOARRAY_MAP_STATUS_HPP_

#include <string>

namespace autoarray {

enum class MapError {
    kNone,
    // A fixed-address request overlapped an existing mapping.
    kAddressOccupied,
    // Any other failure, the cause is in MapStatus::systemError.
    kOther
};

// Outcome of a mapping request. Carries the errno reported by the system for kOther failures.
struct MapStatus {
    MapStatus(): error(MapError::kNone), systemError(0) {}
    MapStatus(MapError e, int sysError): error(e), systemError(sysError) {}

    static MapStatus ok() { return MapStatus(); }
    static MapStatus addressOccupied(int sysError) { return MapStatus(MapError::kAddressOccupied, sysError); }
    static MapStatus other(int sysError) { return MapStatus(MapError::kOther, sysError); }

    bool isOk() const { return error == MapError::kNone; }
    bool isAddressOccupied() const { return error == MapError::kAddressOccupied; }

    // Human readable description, including strerror() text when there is a system error.
    std::string toString() const;

    MapError error;
    int systemError;
};

inline bool operator==(const MapStatus& a, const MapStatus& b) {
    return a.error == b.error && a.systemError == b.systemError;
}
inline bool operator!=(const MapStatus& a, const MapStatus& b) { return !(a == b); }

} // namespace autoarray

#endif // SRC_AUTOARRAY_MAP_STATUS_HPP_
