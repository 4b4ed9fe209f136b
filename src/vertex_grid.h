#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "segment_reshape/part_index.h"

namespace segment_reshape {

struct VertexRef {
  std::size_t feature;
  std::size_t part;
  std::size_t vertex;  // logical index
};

// Hash grid over every logical vertex of the candidate parts. Cells are at
// least eps wide, so a coincident vertex is always in the 3x3 neighbourhood.
class VertexGrid {
 public:
  explicit VertexGrid(double eps);

  void add_part(std::size_t feature, const PartIndex &part);

  // All vertices equal to p, sorted by (feature, part, vertex).
  std::vector<VertexRef> query(const Pt &p) const;

 private:
  struct Entry {
    VertexRef ref;
    Pt p;
  };

  double eps_;
  double cell_;
  std::unordered_map<std::uint64_t, std::vector<Entry>> cells_;
};

}  // namespace segment_reshape
