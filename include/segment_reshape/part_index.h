#pragma once

#include <cstddef>
#include <vector>

#include "segment_reshape/feature.h"

namespace segment_reshape {

// Read-only view of one part. Closed rings keep only their logical vertices
// (the duplicated closing vertex is dropped) and are indexed cyclically.
class PartIndex {
 public:
  PartIndex(std::size_t part, const std::vector<Pt> &pts, double eps);

  std::size_t part() const { return part_; }
  // Stored vertex count, closing vertex included for rings.
  std::size_t vertex_count() const { return closed_ ? verts_.size() + 1 : verts_.size(); }
  std::size_t logical_count() const { return verts_.size(); }
  bool closed() const { return closed_; }

  const Pt &at(std::size_t i) const { return verts_[i]; }
  std::size_t wrap(long long i) const;

  // Moves `delta` (+1/-1) from `from`. Chains stop at their ends, rings wrap.
  bool step(std::size_t from, int delta, std::size_t &out) const;

  const std::vector<Pt> &logical() const { return verts_; }
  std::vector<Pt> materialize() const;

 private:
  std::size_t part_;
  bool closed_;
  std::vector<Pt> verts_;
};

// Throws InvalidGeometryError for parts with too few vertices.
std::vector<PartIndex> build_part_index(const Feature &feature, double eps);

}  // namespace segment_reshape
