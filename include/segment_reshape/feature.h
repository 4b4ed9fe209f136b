#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "segment_reshape/geom_common.h"

namespace segment_reshape {

using geom_common::BBox;
using geom_common::Pt;

// Snapshot of one feature as handed over by the owning layer. The engine never
// mutates a Feature it was given; edits come back as copies.
struct Feature {
  std::string fid;
  // "LineString" | "MultiLineString" | "Polygon" | "MultiPolygon"
  std::string geometry_type;
  // One vertex sequence per line part or polygon ring. Rings repeat their first
  // vertex at the end.
  std::vector<std::vector<Pt>> parts;
  // Polygon types only: how many consecutive entries of `parts` make up each
  // polygon (exterior ring first, then holes).
  std::vector<std::size_t> rings_per_polygon;
  std::unordered_map<std::string, std::string> attributes;
  // Keys whose value in `attributes` is JSON text (number, bool, array, object)
  // rather than a plain string.
  std::unordered_set<std::string> json_attributes;
  BBox bb;
};

Feature make_feature(std::string fid, std::vector<std::vector<Pt>> parts, std::string geometry_type = "");

void refresh_bbox(Feature &f);

bool is_polygon_type(const std::string &geometry_type);

}  // namespace segment_reshape
