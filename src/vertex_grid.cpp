#include "vertex_grid.h"

#include <algorithm>
#include <tuple>

namespace segment_reshape {

using namespace geom_common;

VertexGrid::VertexGrid(double eps) : eps_(eps), cell_(std::max(eps, 1e-9)) {}

void VertexGrid::add_part(std::size_t feature, const PartIndex &part) {
  for (std::size_t i = 0; i < part.logical_count(); ++i) {
    const Pt &p = part.at(i);
    const auto key = pack_key(grid_i(p.x, cell_), grid_i(p.y, cell_));
    cells_[key].push_back(Entry{VertexRef{feature, part.part(), i}, p});
  }
}

std::vector<VertexRef> VertexGrid::query(const Pt &p) const {
  std::vector<VertexRef> out;
  const auto ix = grid_i(p.x, cell_);
  const auto iy = grid_i(p.y, cell_);
  for (std::int64_t dx = -1; dx <= 1; ++dx) {
    for (std::int64_t dy = -1; dy <= 1; ++dy) {
      auto it = cells_.find(pack_key(ix + dx, iy + dy));
      if (it == cells_.end()) {
        continue;
      }
      for (const auto &e : it->second) {
        if (same_xy(e.p, p, eps_)) {
          out.push_back(e.ref);
        }
      }
    }
  }
  std::sort(out.begin(), out.end(), [](const VertexRef &a, const VertexRef &b) {
    return std::tie(a.feature, a.part, a.vertex) < std::tie(b.feature, b.part, b.vertex);
  });
  // neighbouring keys can alias for very large coordinates
  out.erase(std::unique(out.begin(), out.end(),
                        [](const VertexRef &a, const VertexRef &b) {
                          return a.feature == b.feature && a.part == b.part && a.vertex == b.vertex;
                        }),
            out.end());
  return out;
}

}  // namespace segment_reshape
