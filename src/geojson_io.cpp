#include "segment_reshape/geojson_io.h"

#include <cmath>
#include <fstream>
#include <iostream>
#include <numeric>
#include <utility>

#include "reshape_log.h"
#include "segment_reshape/errors.h"

namespace segment_reshape {

using json = nlohmann::json;

namespace {

std::vector<Pt> positions_from_json(const json &coords, const std::string &what) {
  if (!coords.is_array()) {
    throw InvalidGeometryError(what + ": coordinates must be an array of positions");
  }
  std::vector<Pt> out;
  out.reserve(coords.size());
  for (const auto &c : coords) {
    out.push_back(pt_from_json(c));
  }
  return out;
}

std::vector<std::vector<Pt>> parts_from_json(const json &coords, const std::string &what) {
  if (!coords.is_array()) {
    throw InvalidGeometryError(what + ": coordinates must be an array of parts");
  }
  std::vector<std::vector<Pt>> out;
  for (const auto &c : coords) {
    out.push_back(positions_from_json(c, what));
  }
  return out;
}

std::string scalar_text(const json &v) {
  if (v.is_string()) {
    return v.get<std::string>();
  }
  return v.dump();
}

json positions_to_json(const std::vector<Pt> &pts) {
  json arr = json::array();
  for (const auto &p : pts) {
    arr.push_back(pt_to_json(p));
  }
  return arr;
}

// Feature geometry keeps one dimension: once any vertex carries Z, all do.
json positions_to_json(const std::vector<Pt> &pts, bool force_z, double default_z) {
  if (!force_z) {
    return positions_to_json(pts);
  }
  json arr = json::array();
  for (const auto &p : pts) {
    arr.push_back(json::array({p.x, p.y, geom_common::has_z(p) ? p.z : default_z}));
  }
  return arr;
}

json parts_to_json(const std::vector<std::vector<Pt>> &parts, std::size_t first, std::size_t count, bool force_z,
                   double default_z) {
  json arr = json::array();
  for (std::size_t i = first; i < first + count && i < parts.size(); ++i) {
    arr.push_back(positions_to_json(parts[i], force_z, default_z));
  }
  return arr;
}

bool any_z(const Feature &f) {
  for (const auto &part : f.parts) {
    for (const auto &p : part) {
      if (geom_common::has_z(p)) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace

Pt pt_from_json(const json &j) {
  if (!j.is_array() || j.size() < 2 || !j[0].is_number() || !j[1].is_number()) {
    throw InvalidGeometryError("position must be [x, y] or [x, y, z], got " + j.dump());
  }
  Pt p{j[0].get<double>(), j[1].get<double>()};
  if (j.size() > 2 && j[2].is_number()) {
    p.z = j[2].get<double>();
  }
  return p;
}

Feature feature_from_geojson(const json &j, std::size_t ordinal) {
  if (!j.is_object()) {
    throw InvalidGeometryError("feature " + std::to_string(ordinal) + " is not an object");
  }
  Feature f;
  if (j.contains("id") && (j["id"].is_string() || j["id"].is_number())) {
    f.fid = scalar_text(j["id"]);
  } else if (j.contains("properties") && j["properties"].is_object() && j["properties"].contains("id") &&
             (j["properties"]["id"].is_string() || j["properties"]["id"].is_number())) {
    f.fid = scalar_text(j["properties"]["id"]);
  } else {
    f.fid = "feature_" + std::to_string(ordinal);
  }

  if (j.contains("properties") && j["properties"].is_object()) {
    for (auto it = j["properties"].begin(); it != j["properties"].end(); ++it) {
      if (it.value().is_null()) {
        continue;
      }
      f.attributes[it.key()] = scalar_text(it.value());
      if (!it.value().is_string()) {
        f.json_attributes.insert(it.key());
      }
    }
  }

  const json geom = j.value("geometry", json());
  if (!geom.is_object()) {
    return f;
  }
  const std::string gtype = geom.value("type", "");
  const json coords = geom.value("coordinates", json());
  const std::string what = "feature " + f.fid;
  if (gtype == "LineString") {
    f.parts.push_back(positions_from_json(coords, what));
  } else if (gtype == "MultiLineString" || gtype == "Polygon") {
    f.parts = parts_from_json(coords, what);
    if (gtype == "Polygon") {
      f.rings_per_polygon.push_back(f.parts.size());
    }
  } else if (gtype == "MultiPolygon") {
    if (!coords.is_array()) {
      throw InvalidGeometryError(what + ": coordinates must be an array of polygons");
    }
    for (const auto &poly : coords) {
      auto rings = parts_from_json(poly, what);
      f.rings_per_polygon.push_back(rings.size());
      for (auto &r : rings) {
        f.parts.push_back(std::move(r));
      }
    }
  } else {
    SEGMENT_RESHAPE_LOG_DEBUG("feature %s: geometry type '%s' is not editable", f.fid.c_str(), gtype.c_str());
    return f;
  }
  f.geometry_type = gtype;
  refresh_bbox(f);
  return f;
}

std::vector<Feature> features_from_geojson(const json &doc) {
  const json *arr = nullptr;
  if (doc.is_object() && doc.value("type", "") == "FeatureCollection" && doc.contains("features")) {
    arr = &doc["features"];
  } else if (doc.is_array()) {
    arr = &doc;
  }
  if (!arr || !arr->is_array()) {
    throw InvalidGeometryError("expected a FeatureCollection or an array of features");
  }
  std::vector<Feature> out;
  for (std::size_t i = 0; i < arr->size(); ++i) {
    Feature f = feature_from_geojson((*arr)[i], i);
    if (!f.parts.empty()) {
      out.push_back(std::move(f));
    }
  }
  return out;
}

bool load_features_geojson(const std::string &path, std::vector<Feature> &out) {
  std::ifstream ifs(path);
  if (!ifs) {
    std::cerr << "Failed to open file: " << path << std::endl;
    return false;
  }
  json doc;
  try {
    ifs >> doc;
  } catch (const json::exception &e) {
    std::cerr << "Failed to parse JSON: " << e.what() << std::endl;
    return false;
  }
  try {
    out = features_from_geojson(doc);
  } catch (const InvalidGeometryError &e) {
    std::cerr << "Invalid GeoJSON in " << path << ": " << e.what() << std::endl;
    return false;
  }
  return true;
}

std::vector<Pt> chain_from_json(const json &j) {
  if (j.is_array()) {
    return positions_from_json(j, "chain");
  }
  if (j.is_object() && j.value("type", "") == "Feature" && j.contains("geometry")) {
    return chain_from_json(j["geometry"]);
  }
  if (j.is_object() && j.value("type", "") == "LineString") {
    return positions_from_json(j.value("coordinates", json()), "chain");
  }
  throw InvalidGeometryError("chain must be an array of positions or a LineString");
}

bool load_chain_json(const std::string &path, std::vector<Pt> &out) {
  std::ifstream ifs(path);
  if (!ifs) {
    std::cerr << "Failed to open file: " << path << std::endl;
    return false;
  }
  json doc;
  try {
    ifs >> doc;
    out = chain_from_json(doc);
  } catch (const json::exception &e) {
    std::cerr << "Failed to parse JSON: " << e.what() << std::endl;
    return false;
  } catch (const InvalidGeometryError &e) {
    std::cerr << "Invalid chain in " << path << ": " << e.what() << std::endl;
    return false;
  }
  return true;
}

json pt_to_json(const Pt &p) {
  if (geom_common::has_z(p)) {
    return json::array({p.x, p.y, p.z});
  }
  return json::array({p.x, p.y});
}

json feature_to_geojson(const Feature &f, double default_z) {
  const bool force_z = any_z(f);
  json geom;
  geom["type"] = f.geometry_type;
  if (f.geometry_type == "LineString") {
    geom["coordinates"] = f.parts.empty() ? json::array() : positions_to_json(f.parts.front(), force_z, default_z);
  } else if (f.geometry_type == "MultiPolygon") {
    std::vector<std::size_t> groups = f.rings_per_polygon;
    if (std::accumulate(groups.begin(), groups.end(), std::size_t{0}) != f.parts.size()) {
      groups.assign(f.parts.size(), 1);
    }
    json polys = json::array();
    std::size_t first = 0;
    for (auto n : groups) {
      polys.push_back(parts_to_json(f.parts, first, n, force_z, default_z));
      first += n;
    }
    geom["coordinates"] = polys;
  } else {
    geom["coordinates"] = parts_to_json(f.parts, 0, f.parts.size(), force_z, default_z);
  }

  json props = json::object();
  for (const auto &kv : f.attributes) {
    props[kv.first] = f.json_attributes.count(kv.first) ? json::parse(kv.second) : json(kv.second);
  }
  return json{{"type", "Feature"}, {"id", f.fid}, {"properties", props}, {"geometry", geom}};
}

json common_segment_to_json(const CommonSegment &seg) {
  json full = json::array();
  for (const auto &a : seg.full_span) {
    full.push_back({{"fid", a.fid},
                    {"feature", a.feature},
                    {"part", a.part},
                    {"vertex_indices", a.vertex_indices},
                    {"direction", a.direction},
                    {"wraps", a.wraps}});
  }
  json ends = json::array();
  for (const auto &a : seg.endpoints) {
    ends.push_back({{"fid", a.fid},
                    {"feature", a.feature},
                    {"part", a.part},
                    {"vertex_index", a.vertex_index},
                    {"is_start", a.is_start}});
  }
  return json{{"points", positions_to_json(seg.points)},
              {"closed", seg.closed},
              {"seed_feature", seg.seed_feature},
              {"seed_part", seg.seed_part},
              {"full_span", full},
              {"endpoints", ends}};
}

json issue_to_json(const Issue &issue) {
  return json{{"kind", issue.kind}, {"fid", issue.fid}, {"message", issue.message}, {"point", pt_to_json(issue.point)}};
}

json edit_result_to_json(const EditResult &res, double default_z) {
  json edits = json::array();
  for (const auto &e : res.edits) {
    edits.push_back({{"fid", e.fid}, {"kind", anchor_kind_name(e.kind)}, {"feature", feature_to_geojson(e.feature, default_z)}});
  }
  json failures = json::array();
  for (const auto &i : res.failures) {
    failures.push_back(issue_to_json(i));
  }
  json warnings = json::array();
  for (const auto &i : res.warnings) {
    warnings.push_back(issue_to_json(i));
  }
  return json{{"edits", edits}, {"failures", failures}, {"warnings", warnings}, {"complete", res.complete()}};
}

}  // namespace segment_reshape
