#include "segment_reshape/part_index.h"

#include <string>

#include "segment_reshape/errors.h"

namespace segment_reshape {

PartIndex::PartIndex(std::size_t part, const std::vector<Pt> &pts, double eps) : part_(part), closed_(false) {
  if (pts.size() < 2) {
    throw InvalidGeometryError("part " + std::to_string(part) + " has " + std::to_string(pts.size()) +
                               " vertices, at least 2 required");
  }
  closed_ = geom_common::same_xy(pts.front(), pts.back(), eps);
  if (closed_ && pts.size() < 4) {
    throw InvalidGeometryError("ring " + std::to_string(part) + " has " + std::to_string(pts.size()) +
                               " vertices, at least 4 required");
  }
  verts_.assign(pts.begin(), closed_ ? pts.end() - 1 : pts.end());
}

std::size_t PartIndex::wrap(long long i) const {
  const long long n = static_cast<long long>(verts_.size());
  long long r = i % n;
  if (r < 0) {
    r += n;
  }
  return static_cast<std::size_t>(r);
}

bool PartIndex::step(std::size_t from, int delta, std::size_t &out) const {
  const long long next = static_cast<long long>(from) + delta;
  if (closed_) {
    out = wrap(next);
    return true;
  }
  if (next < 0 || next >= static_cast<long long>(verts_.size())) {
    return false;
  }
  out = static_cast<std::size_t>(next);
  return true;
}

std::vector<Pt> PartIndex::materialize() const {
  std::vector<Pt> out = verts_;
  if (closed_) {
    out.push_back(verts_.front());
  }
  return out;
}

std::vector<PartIndex> build_part_index(const Feature &feature, double eps) {
  std::vector<PartIndex> out;
  out.reserve(feature.parts.size());
  for (std::size_t p = 0; p < feature.parts.size(); ++p) {
    try {
      out.emplace_back(p, feature.parts[p], eps);
    } catch (const InvalidGeometryError &e) {
      throw InvalidGeometryError("feature " + feature.fid + ": " + e.what());
    }
  }
  return out;
}

}  // namespace segment_reshape
