#pragma once

// TrailBuffer.h
//
// Fixed-capacity motion trail for one piston.
//
// Read order: at(0) is the newest sample ("now"), at(kLength-1) the oldest.
// Every advance() ages all samples by one slot and displaces them backwards
// along +Z by the frame's flow distance, then writes the new head.
//
// Storage is a ring with a head index; nothing is physically shifted. The
// flow displacement is not applied per sample either: each sample remembers
// the cumulative flow total at the moment it was written and reads back as
//
//     z = z_written + (flow_total_now - flow_total_at_write)
//
// so the head sample reads back bit-exactly (difference is 0.0) and, for
// non-negative flow, an aged sample's Z never decreases.
//
// No allocation after construction.

#include "Point3.h"

#include <array>
#include <cstddef>

namespace pflow {

class TrailBuffer {
public:
    static constexpr int kLength = 100;

    TrailBuffer() = default;
    explicit TrailBuffer(const Point3& rest_point) { reset(rest_point); }

    // All kLength samples become rest_point; flow history is discarded.
    void reset(const Point3& rest_point);

    // Shift towards the tail with +flow_dz_m on Z, then head_point into slot 0.
    // Total for finite inputs.
    void advance(const Point3& head_point, double flow_dz_m);

    // k in [0, kLength). Out-of-range k returns {0,0,0}.
    Point3 at(int k) const;

    static constexpr int size() noexcept { return kLength; }

    // Writes 3*kLength floats (x,y,z interleaved) in read order.
    // dst must hold at least floatCount() values.
    void copyXYZ(float* dst) const;
    static constexpr std::size_t floatCount() noexcept { return 3u * static_cast<std::size_t>(kLength); }

    // Set by reset()/advance(); the consumer clears it after re-uploading.
    bool isDirty() const noexcept { return dirty_; }
    void clearDirty() noexcept { dirty_ = false; }

    double flowTotal_m() const noexcept { return flow_total_m_; }

private:
    struct Sample {
        Point3 p{};
        double flow_at_write_m = 0.0;
    };

    int slotIndex(int k) const noexcept {
        const int i = head_ + k;
        return (i >= kLength) ? (i - kLength) : i;
    }

    std::array<Sample, kLength> rb_{};
    int head_ = 0;              // physical slot of at(0)
    double flow_total_m_ = 0.0; // sum of all flow_dz_m since reset
    bool dirty_ = true;
};

} // namespace pflow
