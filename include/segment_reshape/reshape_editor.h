#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "segment_reshape/errors.h"
#include "segment_reshape/feature.h"
#include "segment_reshape/reshape_config.h"
#include "segment_reshape/segment_matcher.h"

namespace segment_reshape {

enum class AnchorKind { FullSpan, EndpointOnly };

const char *anchor_kind_name(AnchorKind kind);

// New geometry of one anchored feature. `parts` is the complete part list of the
// feature (untouched parts copied through); on failure it is the original.
struct UpdatedGeometry {
  std::size_t feature;
  std::string fid;
  std::vector<std::vector<Pt>> parts;
  AnchorKind kind;
  bool ok = true;
  std::string error;
  Pt error_point{0.0, 0.0};
  std::vector<Issue> warnings;
};

// Replaces `count` logical vertices of `part` starting at `first` (in the part's
// own order, wrapping on rings) with `chain`, which must already be oriented
// like the part. Missing Z in the chain is filled with cfg.default_z.
// Throws InvalidGeometryError for a bad range and DisjointEditError when the
// result would be degenerate.
std::vector<Pt> splice_part(const std::vector<Pt> &part, std::size_t first, std::size_t count,
                            const std::vector<Pt> &chain, const ReshapeConfig &cfg = ReshapeConfig{},
                            const std::string &fid = "");

// One entry per anchored feature, in anchor order. Throws InvalidGeometryError
// for an empty or non-finite chain; per-feature DisjointEditError is recorded in
// the entry and does not stop the other features.
std::vector<UpdatedGeometry> apply_reshape(const std::vector<Feature> &features, const CommonSegment &segment,
                                           const std::vector<Pt> &new_chain,
                                           const ReshapeConfig &cfg = ReshapeConfig{});

}  // namespace segment_reshape
