#pragma once

// ring/ring_geometry.h
//
// Square ring of ropes with a perimeter parameterization, and the position
// tracker that keeps both fighters inside it.
//
// Coordinate convention:
//   - Top-down view, origin at ring center, units are feet.
//   - Ropes form an axis-aligned square of half-width rope_half_ft.
//   - Fighter A starts on -X, fighter B on +X.
//
// Corner ordering (around the perimeter):
//   0: (-h, -h)
//   1: (+h, -h)
//   2: (+h, +h)
//   3: (-h, +h)
// Segments:
//   seg 0: 0 -> 1 (+X)
//   seg 1: 1 -> 2 (+Y)
//   seg 2: 2 -> 3 (-X)
//   seg 3: 3 -> 0 (-Y)

#include <array>
#include <cstddef>
#include <cstdint>

#include "Contracts.h"

namespace ringsim {
namespace ring {

struct Vec2d {
    double x = 0.0;
    double y = 0.0;
};

struct RingConfig {
    // Rope line, measured from center. A 20 ft ring by default.
    double rope_half_ft = 10.0;

    // Fighters are kept this far inside the rope line.
    double rope_inset_ft = 0.5;

    // Zone thresholds on |x| / |y|.
    double rope_zone_ft   = 8.0; // either axis beyond this: on the ropes
    double corner_zone_ft = 7.0; // both axes beyond this: in a corner
    double center_zone_ft = 3.0; // both axes within this: in the center
};

struct RingGeometryData {
    static constexpr int kNumCorners  = 4;
    static constexpr int kNumSegments = 4;

    double half_ft = 0.0;
    std::array<Vec2d, kNumCorners> corners_ft {};
    std::array<double, kNumSegments> seg_len_ft {{0.0, 0.0, 0.0, 0.0}};
    double perimeter_ft = 0.0;
};

class RingGeometry {
public:
    struct Projection {
        // Arc-length parameter along the ropes in [0, perimeter).
        double s_ft = 0.0;

        // Closest point on the ropes.
        Vec2d pos_ft {};

        // Distance from query point to the ropes (>= 0).
        double dist_ft = 0.0;

        int segment_idx = 0;
    };

    RingGeometry() { recompute(cfg_); }
    explicit RingGeometry(const RingConfig& cfg) { recompute(cfg); }

    // Rebuild corners and perimeter. Leaves the ring invalid for a
    // non-positive or non-finite half-width.
    void recompute(const RingConfig& cfg);

    bool isValid() const { return valid_; }
    const RingConfig& config() const { return cfg_; }
    const RingGeometryData& geometry() const { return geo_; }

    // Wrap s into [0, perimeter). Returns 0 for an invalid ring.
    double wrapS(double s_ft) const;

    // Signed smallest delta from s_from to s_to along the ropes.
    double shortestDeltaS(double s_from_ft, double s_to_ft) const;

    Vec2d evalPosition(double s_ft) const;

    // Unit direction of travel along the ropes at s.
    Vec2d evalTangent(double s_ft) const;

    // Nearest rope point to (x, y). s_hint_ft breaks ties at corners.
    Projection projectNearest(double x_ft, double y_ft, double s_hint_ft = 0.0) const;

    // Clamp a point into the fighting area (rope line minus inset).
    Vec2d clampInside(const Vec2d& p) const;

    bool isOnRopes(const Vec2d& p) const;
    bool isInCorner(const Vec2d& p) const;
    bool isInCenter(const Vec2d& p) const;

private:
    RingConfig cfg_ {};
    RingGeometryData geo_ {};
    bool valid_ = false;
};

// Fighter movement speeds in ft/s before attribute scaling.
struct MovementSpeeds {
    double forward_ftps    = 2.0;
    double backward_ftps   = 1.5;
    double lateral_ftps    = 1.2;
    double circling_ftps   = 1.0;
    double cutting_ftps    = 2.5;
    double retreating_ftps = 1.8;
};

// Distance bands used by the tracker's jitter and by logging.
enum class DistanceZone : std::uint8_t { Clinch = 0, Inside, Mid, Outside, Far };

DistanceZone zoneOf(double distance_ft);
const char* toString(DistanceZone z);

class RingPositionTracker : public PositionTracker {
public:
    static constexpr double kStartOffset_ft = 4.0;
    static constexpr double kMinSeparation_ft = 1.0;
    static constexpr double kCenterControlMargin_ft = 2.0;

    RingPositionTracker() = default;
    explicit RingPositionTracker(const RingConfig& cfg, const MovementSpeeds& speeds = MovementSpeeds{})
        : ring_(cfg), speeds_(speeds) {}

    void initializePositions() override;
    void resetForRound() override;
    void update(Fighter& a,
                Fighter& b,
                const Decision& decisionA,
                const Decision& decisionB,
                double dt,
                Rng& rng) override;

    double getDistance() const override;
    bool isOnRopes(Side s) const override;
    bool isInCorner(Side s) const override;
    bool isInCenter(Side s) const override;
    bool getCenterControl(Side& controller) const override;
    void separateFighters(double distance_ft) override;
    RingPoint position(Side s) const override;

    const RingGeometry& ring() const noexcept { return ring_; }

    // Attribute scaling of the base speed: foot speed, stamina and footwork.
    static double speedScale(const Fighter& f);

private:
    Vec2d step(Side s, const Fighter& f, const Decision& d, double dt) const;
    void preventOverlap();

    RingGeometry ring_ {};
    MovementSpeeds speeds_ {};
    std::array<Vec2d, 2> pos_ {{Vec2d{-kStartOffset_ft, 0.0}, Vec2d{kStartOffset_ft, 0.0}}};
    std::array<double, 2> ropeHint_ {{0.0, 0.0}};
};

} // namespace ring
} // namespace ringsim
