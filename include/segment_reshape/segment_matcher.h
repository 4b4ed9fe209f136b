#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "segment_reshape/feature.h"
#include "segment_reshape/reshape_config.h"

namespace segment_reshape {

// A part that runs along the whole common segment.
struct FullSpanAnchor {
  std::size_t feature;  // index into the candidate list
  std::string fid;
  std::size_t part;
  // Logical vertex indices, one per common segment point, in segment order.
  std::vector<std::size_t> vertex_indices;
  // +1 when the part is traversed the same way as the segment, -1 otherwise.
  int direction;
  // The run crosses the closing vertex of a ring.
  bool wraps;
};

// A part that only touches one end of the common segment.
struct EndpointAnchor {
  std::size_t feature;
  std::string fid;
  std::size_t part;
  std::size_t vertex_index;
  bool is_start;
};

struct CommonSegment {
  std::vector<Pt> points;  // x/y from the seed part, z unset
  // The run covers a whole ring; points (and anchor indices) repeat the first entry.
  bool closed = false;
  std::size_t seed_feature = 0;
  std::size_t seed_part = 0;
  std::vector<FullSpanAnchor> full_span;  // seed first
  std::vector<EndpointAnchor> endpoints;
};

struct MatchStats {
  int candidate_parts = 0;
  int vertices_indexed = 0;
  int participants = 0;

  // Debug counters for the walk
  std::int64_t walk_steps = 0;
  std::int64_t wrap_stops = 0;
  std::int64_t touch_breaks = 0;
  std::int64_t consensus_stops = 0;
};

// Returns std::nullopt when no vertex lies within the trigger tolerance or
// fewer than two features touch the run. Throws InvalidGeometryError for
// malformed candidate parts.
std::optional<CommonSegment> find_common_segment(const Pt &trigger, const std::vector<Feature> &candidates,
                                                 const ReshapeConfig &cfg = ReshapeConfig{},
                                                 MatchStats *stats = nullptr);

}  // namespace segment_reshape
