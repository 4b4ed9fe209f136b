#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "segment_reshape/errors.h"
#include "segment_reshape/feature.h"
#include "segment_reshape/reshape_editor.h"

namespace segment_reshape {

struct FeatureEdit {
  std::string fid;
  std::size_t index;  // position in the candidate list
  Feature feature;  // full updated copy, attributes untouched
  AnchorKind kind;
};

struct EditResult {
  std::vector<FeatureEdit> edits;
  std::vector<Issue> failures;  // kind "disjoint_edit", one per failed feature
  std::vector<Issue> warnings;

  const FeatureEdit *find(const std::string &fid) const;
  bool complete() const { return failures.empty(); }
};

// Groups the editor output back under the owning features. Failed features get
// a failure entry instead of an edit.
EditResult assemble(const std::vector<Feature> &features, const std::vector<UpdatedGeometry> &updates);

// apply_reshape followed by assemble.
EditResult reshape_segment(const std::vector<Feature> &features, const CommonSegment &segment,
                           const std::vector<Pt> &new_chain, const ReshapeConfig &cfg = ReshapeConfig{});

}  // namespace segment_reshape
