#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace segment_reshape::geom_common {

// z is NaN when the vertex carries no Z value.
struct Pt {
  double x;
  double y;
  double z = std::numeric_limits<double>::quiet_NaN();
};

struct BBox {
  double minx{std::numeric_limits<double>::infinity()};
  double miny{std::numeric_limits<double>::infinity()};
  double maxx{-std::numeric_limits<double>::infinity()};
  double maxy{-std::numeric_limits<double>::infinity()};
};

static inline bool has_z(const Pt &p) { return !std::isnan(p.z); }

static inline bool is_finite_xy(const Pt &p) { return std::isfinite(p.x) && std::isfinite(p.y); }

// Coincidence test used everywhere vertices are compared. Z is ignored.
static inline bool same_xy(const Pt &a, const Pt &b, double eps) {
  return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps;
}

static inline double dist2(const Pt &a, const Pt &b) {
  const double dx = a.x - b.x;
  const double dy = a.y - b.y;
  return dx * dx + dy * dy;
}

static inline double dist2_point_seg(const Pt &p, const Pt &a, const Pt &b) {
  const double vx = b.x - a.x;
  const double vy = b.y - a.y;
  const double wx = p.x - a.x;
  const double wy = p.y - a.y;
  const double c1 = vx * wx + vy * wy;
  if (c1 <= 0.0) {
    return dist2(p, a);
  }
  const double c2 = vx * vx + vy * vy;
  if (c2 <= 0.0) {
    return dist2(p, a);
  }
  const double t = c1 / c2;
  if (t >= 1.0) {
    return dist2(p, b);
  }
  return dist2(p, Pt{a.x + t * vx, a.y + t * vy});
}

static inline bool bbox_intersects(const BBox &a, const BBox &b) {
  return !(a.maxx < b.minx || a.minx > b.maxx || a.maxy < b.miny || a.miny > b.maxy);
}

static inline BBox bbox_empty() {
  return BBox{std::numeric_limits<double>::infinity(),
              std::numeric_limits<double>::infinity(),
              -std::numeric_limits<double>::infinity(),
              -std::numeric_limits<double>::infinity()};
}

static inline bool bbox_is_empty(const BBox &bb) { return bb.minx > bb.maxx || bb.miny > bb.maxy; }

static inline void bbox_expand(BBox &bb, const Pt &p) {
  bb.minx = std::min(bb.minx, p.x);
  bb.miny = std::min(bb.miny, p.y);
  bb.maxx = std::max(bb.maxx, p.x);
  bb.maxy = std::max(bb.maxy, p.y);
}

static inline void bbox_merge(BBox &bb, const BBox &other) {
  bb.minx = std::min(bb.minx, other.minx);
  bb.miny = std::min(bb.miny, other.miny);
  bb.maxx = std::max(bb.maxx, other.maxx);
  bb.maxy = std::max(bb.maxy, other.maxy);
}

static inline BBox bbox_buffered(const BBox &bb, double r) {
  return BBox{bb.minx - r, bb.miny - r, bb.maxx + r, bb.maxy + r};
}

static inline BBox bbox_around(const Pt &p, double r) { return BBox{p.x - r, p.y - r, p.x + r, p.y + r}; }

static inline double bbox_area(const BBox &b) {
  if (bbox_is_empty(b)) {
    return 0.0;
  }
  return (b.maxx - b.minx) * (b.maxy - b.miny);
}

static inline BBox bbox_of_parts(const std::vector<std::vector<Pt>> &parts) {
  auto bb = bbox_empty();
  for (const auto &pts : parts) {
    for (const auto &p : pts) {
      bbox_expand(bb, p);
    }
  }
  return bb;
}

static inline std::uint64_t pack_key(std::int64_t ix, std::int64_t iy) {
  const std::uint64_t ux = static_cast<std::uint64_t>(static_cast<std::uint32_t>(ix));
  const std::uint64_t uy = static_cast<std::uint64_t>(static_cast<std::uint32_t>(iy));
  return (ux << 32) ^ uy;
}

static inline std::int64_t grid_i(double v, double cell) {
  const double q = std::floor(v / cell);
  if (!std::isfinite(q) || std::fabs(q) > 9.0e18) {
    return 0;
  }
  return static_cast<std::int64_t>(q);
}

}  // namespace segment_reshape::geom_common
