#include "segment_reshape/feature.h"

#include <utility>

namespace segment_reshape {

bool is_polygon_type(const std::string &geometry_type) {
  return geometry_type == "Polygon" || geometry_type == "MultiPolygon";
}

Feature make_feature(std::string fid, std::vector<std::vector<Pt>> parts, std::string geometry_type) {
  Feature f;
  f.fid = std::move(fid);
  f.parts = std::move(parts);
  if (geometry_type.empty()) {
    geometry_type = f.parts.size() > 1 ? "MultiLineString" : "LineString";
  }
  f.geometry_type = std::move(geometry_type);
  if (f.geometry_type == "Polygon") {
    f.rings_per_polygon.push_back(f.parts.size());
  } else if (f.geometry_type == "MultiPolygon") {
    // without explicit grouping every ring is its own polygon
    f.rings_per_polygon.assign(f.parts.size(), 1);
  }
  refresh_bbox(f);
  return f;
}

void refresh_bbox(Feature &f) { f.bb = geom_common::bbox_of_parts(f.parts); }

}  // namespace segment_reshape
