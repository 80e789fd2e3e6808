#pragma once

namespace pflow {

// World frame: Y up, Z along the vehicle axis (+Z towards the rear), meters.
struct Point3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

inline bool operator==(const Point3& a, const Point3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Point3& a, const Point3& b) {
    return !(a == b);
}

} // namespace pflow
