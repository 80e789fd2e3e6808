#include "TrailBuffer.h"

namespace pflow {

void TrailBuffer::reset(const Point3& rest_point) {
    for (Sample& s : rb_) {
        s.p = rest_point;
        s.flow_at_write_m = 0.0;
    }
    head_ = 0;
    flow_total_m_ = 0.0;
    dirty_ = true;
}

void TrailBuffer::advance(const Point3& head_point, double flow_dz_m) {
    // Aging: every stored sample picks up this frame's flow through the total.
    flow_total_m_ += flow_dz_m;

    // The new head takes over the oldest slot.
    head_ = (head_ == 0) ? (kLength - 1) : (head_ - 1);

    Sample& s = rb_[static_cast<std::size_t>(head_)];
    s.p = head_point;
    s.flow_at_write_m = flow_total_m_;

    dirty_ = true;
}

Point3 TrailBuffer::at(int k) const {
    if (k < 0 || k >= kLength) {
        return Point3{};
    }
    const Sample& s = rb_[static_cast<std::size_t>(slotIndex(k))];
    Point3 out = s.p;
    out.z = s.p.z + (flow_total_m_ - s.flow_at_write_m);
    return out;
}

void TrailBuffer::copyXYZ(float* dst) const {
    if (dst == nullptr) {
        return;
    }
    for (int k = 0; k < kLength; ++k) {
        const Point3 p = at(k);
        dst[3 * k + 0] = static_cast<float>(p.x);
        dst[3 * k + 1] = static_cast<float>(p.y);
        dst[3 * k + 2] = static_cast<float>(p.z);
    }
}

} // namespace pflow
