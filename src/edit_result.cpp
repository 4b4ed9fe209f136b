#include "segment_reshape/edit_result.h"

#include <utility>

namespace segment_reshape {

const FeatureEdit *EditResult::find(const std::string &fid) const {
  for (const auto &e : edits) {
    if (e.fid == fid) {
      return &e;
    }
  }
  return nullptr;
}

EditResult assemble(const std::vector<Feature> &features, const std::vector<UpdatedGeometry> &updates) {
  EditResult res;
  for (const auto &u : updates) {
    res.warnings.insert(res.warnings.end(), u.warnings.begin(), u.warnings.end());
    if (!u.ok) {
      res.failures.push_back(Issue{"disjoint_edit", u.error_point, u.error, u.fid});
      continue;
    }
    if (u.feature >= features.size()) {
      throw InvalidGeometryError("update for feature " + u.fid + " has no source feature");
    }
    FeatureEdit e{u.fid, u.feature, features[u.feature], u.kind};
    e.feature.parts = u.parts;
    refresh_bbox(e.feature);
    res.edits.push_back(std::move(e));
  }
  return res;
}

EditResult reshape_segment(const std::vector<Feature> &features, const CommonSegment &segment,
                           const std::vector<Pt> &new_chain, const ReshapeConfig &cfg) {
  return assemble(features, apply_reshape(features, segment, new_chain, cfg));
}

}  // namespace segment_reshape
