// ring/ring_geometry.cpp
//
// Implementation notes:
//   - Ring geometry is pure: recompute() is the only mutator.
//   - The tracker moves each fighter from its decision, clamps into the ring,
//     slides retreating fighters along the ropes and keeps a minimum gap.
//   - All jitter comes from the Rng passed to update().

#include "ring_geometry.h"

#include "Fighter.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ringsim {
namespace ring {

// Numeric stability thresholds
static constexpr double kEpsilon = 1e-12;
static constexpr double kMinHalfWidth = 1e-6;

// Lateral jitter per tick, feet, by distance zone.
static constexpr double kJitterMid_ft = 0.05;
static constexpr double kJitterInside_ft = 0.02;

static inline double clampd(double v, double lo, double hi) {
    if (!std::isfinite(v)) return lo;
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

static inline double sqr(double v) { return v * v; }

static inline Vec2d make_v2(double x, double y) {
    Vec2d out;
    out.x = x;
    out.y = y;
    return out;
}

static inline Vec2d sub_v2(const Vec2d& a, const Vec2d& b) { return make_v2(a.x - b.x, a.y - b.y); }

static inline double len_v2(const Vec2d& v) { return std::sqrt(v.x * v.x + v.y * v.y); }

static inline Vec2d norm_v2(const Vec2d& v, const Vec2d& fallback) {
    const double l = len_v2(v);
    if (l <= kEpsilon) return fallback;
    return make_v2(v.x / l, v.y / l);
}

void RingGeometry::recompute(const RingConfig& cfg) {
    cfg_ = cfg;
    valid_ = false;

    const double h = cfg.rope_half_ft;
    if (!std::isfinite(h) || h <= kMinHalfWidth) {
        return;
    }
    if (!std::isfinite(cfg.rope_inset_ft) || cfg.rope_inset_ft < 0.0 || cfg.rope_inset_ft >= h) {
        return;
    }

    geo_.half_ft = h;
    geo_.corners_ft[0] = make_v2(-h, -h);
    geo_.corners_ft[1] = make_v2(h, -h);
    geo_.corners_ft[2] = make_v2(h, h);
    geo_.corners_ft[3] = make_v2(-h, h);

    for (int i = 0; i < RingGeometryData::kNumSegments; ++i) {
        geo_.seg_len_ft[(std::size_t)i] = 2.0 * h;
    }
    geo_.perimeter_ft = 8.0 * h;

    valid_ = true;
}

double RingGeometry::wrapS(double s_ft) const {
    if (!valid_ || !std::isfinite(s_ft)) {
        return 0.0;
    }
    const double p = geo_.perimeter_ft;
    double w = std::fmod(s_ft, p);
    if (w < 0.0) w += p;
    if (w >= p - kEpsilon) w = 0.0;
    return w;
}

double RingGeometry::shortestDeltaS(double s_from_ft, double s_to_ft) const {
    if (!valid_) {
        return 0.0;
    }
    const double p = geo_.perimeter_ft;
    double d = wrapS(s_to_ft) - wrapS(s_from_ft);

    const double half = 0.5 * p;
    if (d > half) {
        d -= p;
    } else if (d <= -half) {
        d += p;
    }
    return d;
}

// Segment index for a wrapped s, and u in [0,1] along it.
static inline int segment_from_s(const RingGeometryData& g, double s_wrapped, double& u01) {
    double accum = 0.0;
    for (int seg = 0; seg < RingGeometryData::kNumSegments; ++seg) {
        const double L = g.seg_len_ft[(std::size_t)seg];
        const double next = accum + L;

        // Exact corner values map to the earlier segment.
        const bool is_last = (seg == RingGeometryData::kNumSegments - 1);
        if (is_last || s_wrapped <= next) {
            u01 = (L > kEpsilon) ? clampd((s_wrapped - accum) / L, 0.0, 1.0) : 0.0;
            return seg;
        }
        accum = next;
    }
    u01 = 0.0;
    return 0;
}

Vec2d RingGeometry::evalPosition(double s_ft) const {
    if (!valid_) {
        return make_v2(0.0, 0.0);
    }
    double u = 0.0;
    const int seg = segment_from_s(geo_, wrapS(s_ft), u);

    const Vec2d& a = geo_.corners_ft[(std::size_t)seg];
    const Vec2d& b = geo_.corners_ft[(std::size_t)((seg + 1) % RingGeometryData::kNumCorners)];
    return make_v2(a.x + u * (b.x - a.x), a.y + u * (b.y - a.y));
}

Vec2d RingGeometry::evalTangent(double s_ft) const {
    if (!valid_) {
        return make_v2(1.0, 0.0);
    }
    double u = 0.0;
    const int seg = segment_from_s(geo_, wrapS(s_ft), u);

    const Vec2d& a = geo_.corners_ft[(std::size_t)seg];
    const Vec2d& b = geo_.corners_ft[(std::size_t)((seg + 1) % RingGeometryData::kNumCorners)];
    return norm_v2(sub_v2(b, a), make_v2(1.0, 0.0));
}

RingGeometry::Projection RingGeometry::projectNearest(double x_ft, double y_ft, double s_hint_ft) const {
    Projection out;
    if (!valid_ || !std::isfinite(x_ft) || !std::isfinite(y_ft)) {
        return out;
    }

    struct Cand {
        double s_raw = 0.0; // may equal the perimeter at the closing corner
        Vec2d pos {};
        double d2 = 0.0;
        int seg = 0;
    };

    const double h = geo_.half_ft;
    const double side = 2.0 * h;
    Cand cands[RingGeometryData::kNumSegments];

    // Segment 0: y = -h, x from -h to +h
    {
        const double xc = clampd(x_ft, -h, h);
        cands[0].s_raw = (xc + h);
        cands[0].pos = make_v2(xc, -h);
        cands[0].d2 = sqr(x_ft - xc) + sqr(y_ft + h);
        cands[0].seg = 0;
    }
    // Segment 1: x = +h, y from -h to +h
    {
        const double yc = clampd(y_ft, -h, h);
        cands[1].s_raw = side + (yc + h);
        cands[1].pos = make_v2(h, yc);
        cands[1].d2 = sqr(x_ft - h) + sqr(y_ft - yc);
        cands[1].seg = 1;
    }
    // Segment 2: y = +h, x from +h to -h
    {
        const double xc = clampd(x_ft, -h, h);
        cands[2].s_raw = 2.0 * side + (h - xc);
        cands[2].pos = make_v2(xc, h);
        cands[2].d2 = sqr(x_ft - xc) + sqr(y_ft - h);
        cands[2].seg = 2;
    }
    // Segment 3: x = -h, y from +h to -h
    {
        const double yc = clampd(y_ft, -h, h);
        cands[3].s_raw = 3.0 * side + (h - yc);
        cands[3].pos = make_v2(-h, yc);
        cands[3].d2 = sqr(x_ft + h) + sqr(y_ft - yc);
        cands[3].seg = 3;
    }

    double best_d2 = cands[0].d2;
    for (int i = 1; i < RingGeometryData::kNumSegments; ++i) {
        best_d2 = std::min(best_d2, cands[i].d2);
    }

    // Ties (the center, the diagonals) resolve toward the hint.
    const double tol = 1e-12 * (1.0 + best_d2);
    const double hint_w = wrapS(s_hint_ft);

    double best_cost = std::numeric_limits<double>::infinity();
    int best_idx = 0;
    for (int i = 0; i < RingGeometryData::kNumSegments; ++i) {
        if (cands[i].d2 > best_d2 + tol) {
            continue;
        }
        const double cost = std::abs(shortestDeltaS(hint_w, wrapS(cands[i].s_raw)));
        if (cost < best_cost - 1e-15) {
            best_cost = cost;
            best_idx = i;
        }
    }

    const Cand& c = cands[best_idx];
    out.s_ft = wrapS(c.s_raw);
    out.pos_ft = c.pos;
    out.dist_ft = std::sqrt(std::max(0.0, c.d2));
    out.segment_idx = c.seg;
    return out;
}

Vec2d RingGeometry::clampInside(const Vec2d& p) const {
    if (!valid_) {
        return make_v2(0.0, 0.0);
    }
    const double lim = geo_.half_ft - cfg_.rope_inset_ft;
    return make_v2(clampd(p.x, -lim, lim), clampd(p.y, -lim, lim));
}

bool RingGeometry::isOnRopes(const Vec2d& p) const {
    return std::abs(p.x) > cfg_.rope_zone_ft || std::abs(p.y) > cfg_.rope_zone_ft;
}

bool RingGeometry::isInCorner(const Vec2d& p) const {
    return std::abs(p.x) > cfg_.corner_zone_ft && std::abs(p.y) > cfg_.corner_zone_ft;
}

bool RingGeometry::isInCenter(const Vec2d& p) const {
    return std::abs(p.x) < cfg_.center_zone_ft && std::abs(p.y) < cfg_.center_zone_ft;
}

// ============================================================
// Distance zones
// ============================================================

DistanceZone zoneOf(double distance_ft) {
    if (!std::isfinite(distance_ft) || distance_ft < 2.0) return DistanceZone::Clinch;
    if (distance_ft < 3.5) return DistanceZone::Inside;
    if (distance_ft < 5.0) return DistanceZone::Mid;
    if (distance_ft < 7.0) return DistanceZone::Outside;
    return DistanceZone::Far;
}

const char* toString(DistanceZone z) {
    switch (z) {
        case DistanceZone::Clinch:  return "clinch";
        case DistanceZone::Inside:  return "inside";
        case DistanceZone::Mid:     return "mid";
        case DistanceZone::Outside: return "outside";
        case DistanceZone::Far:     return "far";
    }
    return "unknown";
}

// ============================================================
// RingPositionTracker
// ============================================================

void RingPositionTracker::initializePositions() {
    pos_[0] = make_v2(-kStartOffset_ft, 0.0);
    pos_[1] = make_v2(kStartOffset_ft, 0.0);
    ropeHint_ = {{0.0, 0.0}};
}

void RingPositionTracker::resetForRound() {
    // Fighters come out of opposite corners' neutral lanes.
    initializePositions();
}

double RingPositionTracker::speedScale(const Fighter& f) {
    const AttributeSnapshot& at = f.attributes();
    const double footSpeed = 0.5 + at.speed.footSpeed / 100.0;
    const double stamina = 0.6 + f.getStaminaPercent() * 0.4;
    const double footwork = 0.8 + at.technical.footwork / 250.0;
    return clampd(footSpeed * stamina * footwork, 0.0, 4.0);
}

Vec2d RingPositionTracker::step(Side s, const Fighter& f, const Decision& d, double dt) const {
    const int i = sideIndex(s);
    const Vec2d& me = pos_[(std::size_t)i];
    const Vec2d& opp = pos_[(std::size_t)(1 - i)];

    if (f.isDown()) {
        return me;
    }

    const Vec2d toward = norm_v2(sub_v2(opp, me), make_v2(i == 0 ? 1.0 : -1.0, 0.0));
    const double scale = speedScale(f) * dt;

    Vec2d dir = make_v2(0.0, 0.0);
    double speed = 0.0;

    switch (d.action.type) {
        case ActionType::Move:
            switch (d.action.direction) {
                case MoveDirection::Forward:
                    if (d.action.cutting) {
                        // Aim between the opponent and the ring center to take away the exit.
                        dir = norm_v2(sub_v2(make_v2(opp.x * 0.8, opp.y * 0.8), me), toward);
                        speed = speeds_.cutting_ftps;
                    } else {
                        dir = toward;
                        speed = speeds_.forward_ftps;
                    }
                    break;
                case MoveDirection::Backward:
                    dir = make_v2(-toward.x, -toward.y);
                    speed = (f.subState() == SubState::Retreating) ? speeds_.retreating_ftps : speeds_.backward_ftps;
                    break;
                case MoveDirection::Left:
                    dir = make_v2(-toward.y, toward.x);
                    speed = (f.subState() == SubState::Circling) ? speeds_.circling_ftps : speeds_.lateral_ftps;
                    break;
                case MoveDirection::Right:
                    dir = make_v2(toward.y, -toward.x);
                    speed = (f.subState() == SubState::Circling) ? speeds_.circling_ftps : speeds_.lateral_ftps;
                    break;
                default:
                    break;
            }
            break;
        case ActionType::Clinch:
            dir = toward;
            speed = speeds_.forward_ftps;
            break;
        case ActionType::Punch:
        case ActionType::Combination:
            // Stepping in behind the punch when out of range.
            if (len_v2(sub_v2(opp, me)) > 4.5) {
                dir = toward;
                speed = speeds_.forward_ftps * 0.5;
            }
            break;
        default:
            break;
    }

    Vec2d next = make_v2(me.x + dir.x * speed * scale, me.y + dir.y * speed * scale);

    // Backing into the ropes turns into sliding along them, away from the opponent.
    const Vec2d clamped = ring_.clampInside(next);
    const bool hitRopes = std::abs(clamped.x - next.x) > kEpsilon || std::abs(clamped.y - next.y) > kEpsilon;
    if (hitRopes && d.action.type == ActionType::Move && d.action.direction == MoveDirection::Backward) {
        const RingGeometry::Projection pr = ring_.projectNearest(clamped.x, clamped.y, ropeHint_[(std::size_t)i]);
        Vec2d t = ring_.evalTangent(pr.s_ft);
        const double along = t.x * (-toward.x) + t.y * (-toward.y);
        if (along < 0.0) t = make_v2(-t.x, -t.y);
        const double slide = speed * scale * 0.6;
        next = ring_.clampInside(make_v2(clamped.x + t.x * slide, clamped.y + t.y * slide));
    } else {
        next = clamped;
    }
    return next;
}

void RingPositionTracker::update(Fighter& a,
                                 Fighter& b,
                                 const Decision& decisionA,
                                 const Decision& decisionB,
                                 double dt,
                                 Rng& rng) {
    if (!std::isfinite(dt) || dt <= 0.0 || !ring_.isValid()) {
        return;
    }

    const Vec2d nextA = step(Side::A, a, decisionA, dt);
    const Vec2d nextB = step(Side::B, b, decisionB, dt);
    pos_[0] = nextA;
    pos_[1] = nextB;

    const DistanceZone zone = zoneOf(getDistance());
    if (zone != DistanceZone::Clinch) {
        const double j = (zone == DistanceZone::Inside) ? kJitterInside_ft : kJitterMid_ft;
        for (std::size_t i = 0; i < 2; ++i) {
            const Fighter& f = (i == 0) ? a : b;
            if (f.isDown()) continue;
            const double jx = rng.uniform(-j, j);
            const double jy = rng.uniform(-j, j);
            pos_[i] = ring_.clampInside(make_v2(pos_[i].x + jx, pos_[i].y + jy));
        }
    }

    preventOverlap();

    for (std::size_t i = 0; i < 2; ++i) {
        ropeHint_[i] = ring_.projectNearest(pos_[i].x, pos_[i].y, ropeHint_[i]).s_ft;
    }
}

void RingPositionTracker::preventOverlap() {
    const Vec2d d = sub_v2(pos_[1], pos_[0]);
    const double dist = len_v2(d);
    if (dist >= kMinSeparation_ft) {
        return;
    }
    const Vec2d n = norm_v2(d, make_v2(1.0, 0.0));
    const double push = 0.5 * (kMinSeparation_ft - dist);
    pos_[0] = ring_.clampInside(make_v2(pos_[0].x - n.x * push, pos_[0].y - n.y * push));
    pos_[1] = ring_.clampInside(make_v2(pos_[1].x + n.x * push, pos_[1].y + n.y * push));

    // Both pinned in the same corner: shift B along the other axis.
    if (len_v2(sub_v2(pos_[1], pos_[0])) < kMinSeparation_ft - 1e-9) {
        const double sy = (pos_[1].y > 0.0) ? -1.0 : 1.0;
        pos_[1] = ring_.clampInside(make_v2(pos_[1].x, pos_[0].y + sy * kMinSeparation_ft));
    }
}

double RingPositionTracker::getDistance() const {
    return len_v2(sub_v2(pos_[1], pos_[0]));
}

bool RingPositionTracker::isOnRopes(Side s) const {
    return ring_.isOnRopes(pos_[(std::size_t)sideIndex(s)]);
}

bool RingPositionTracker::isInCorner(Side s) const {
    return ring_.isInCorner(pos_[(std::size_t)sideIndex(s)]);
}

bool RingPositionTracker::isInCenter(Side s) const {
    return ring_.isInCenter(pos_[(std::size_t)sideIndex(s)]);
}

bool RingPositionTracker::getCenterControl(Side& controller) const {
    const double ra = len_v2(pos_[0]);
    const double rb = len_v2(pos_[1]);
    if (rb - ra > kCenterControlMargin_ft) {
        controller = Side::A;
        return true;
    }
    if (ra - rb > kCenterControlMargin_ft) {
        controller = Side::B;
        return true;
    }
    return false;
}

void RingPositionTracker::separateFighters(double distance_ft) {
    if (!std::isfinite(distance_ft) || distance_ft <= 0.0) {
        return;
    }
    const Vec2d mid = make_v2(0.5 * (pos_[0].x + pos_[1].x), 0.5 * (pos_[0].y + pos_[1].y));
    const Vec2d n = norm_v2(sub_v2(pos_[1], pos_[0]), make_v2(1.0, 0.0));
    const double half = 0.5 * distance_ft;

    pos_[0] = ring_.clampInside(make_v2(mid.x - n.x * half, mid.y - n.y * half));
    pos_[1] = ring_.clampInside(make_v2(mid.x + n.x * half, mid.y + n.y * half));
    preventOverlap();
}

RingPoint RingPositionTracker::position(Side s) const {
    const Vec2d& p = pos_[(std::size_t)sideIndex(s)];
    RingPoint out;
    out.x = p.x;
    out.y = p.y;
    return out;
}

} // namespace ring
} // namespace ringsim
