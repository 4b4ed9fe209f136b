#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

#include "segment_reshape/edit_result.h"
#include "segment_reshape/errors.h"
#include "segment_reshape/feature_rtree.h"
#include "segment_reshape/geojson_io.h"
#include "segment_reshape/reshape_config.h"
#include "segment_reshape/reshape_editor.h"
#include "segment_reshape/segment_matcher.h"

namespace py = pybind11;

namespace {

using segment_reshape::Feature;
using segment_reshape::Pt;

static Pt parse_pt(const py::handle &h) {
  if (!py::isinstance<py::sequence>(h) || py::isinstance<py::str>(h)) {
    throw segment_reshape::InvalidGeometryError("position must be a sequence (x, y[, z])");
  }
  auto seq = h.cast<py::sequence>();
  if (seq.size() < 2) {
    throw segment_reshape::InvalidGeometryError("position needs at least x and y");
  }
  Pt p{py::float_(seq[0]), py::float_(seq[1])};
  if (seq.size() > 2 && !seq[2].is_none()) {
    p.z = py::float_(seq[2]);
  }
  return p;
}

static std::vector<Pt> parse_positions(const py::handle &h) {
  std::vector<Pt> pts;
  for (auto xy : h.cast<py::list>()) {
    pts.push_back(parse_pt(xy));
  }
  return pts;
}

// GeoJSON-like feature dicts -> engine features. `source` maps each returned
// feature back to its position in `features`; dicts without line or polygon
// geometry are skipped.
static std::vector<Feature> extract_features(const py::list &features, std::vector<std::size_t> &source) {
  std::vector<Feature> out;
  out.reserve(features.size());
  source.clear();

  std::size_t ordinal = 0;
  for (auto item : features) {
    const std::size_t pos = ordinal++;
    if (!py::isinstance<py::dict>(item)) {
      continue;
    }
    auto f = item.cast<py::dict>();
    if (!f.contains("geometry") || !py::isinstance<py::dict>(f["geometry"])) {
      continue;
    }
    auto geom = f["geometry"].cast<py::dict>();
    if (!geom.contains("type") || !geom.contains("coordinates")) {
      continue;
    }
    const std::string gtype = py::str(geom["type"]);

    Feature fe;
    if (f.contains("id") && !f["id"].is_none()) {
      fe.fid = py::str(f["id"]);
    } else if (f.contains("properties") && py::isinstance<py::dict>(f["properties"])) {
      auto props = f["properties"].cast<py::dict>();
      if (props.contains("id") && !props["id"].is_none()) {
        fe.fid = py::str(props["id"]);
      }
    }
    if (fe.fid.empty()) {
      fe.fid = "feature_" + std::to_string(pos);
    }
    if (f.contains("properties") && py::isinstance<py::dict>(f["properties"])) {
      for (auto kv : f["properties"].cast<py::dict>()) {
        if (!kv.second.is_none()) {
          fe.attributes[py::str(kv.first)] = py::str(kv.second);
        }
      }
    }

    const py::object coords = geom["coordinates"];
    if (gtype == "LineString") {
      fe.parts.push_back(parse_positions(coords));
    } else if (gtype == "MultiLineString" || gtype == "Polygon") {
      for (auto part : coords.cast<py::list>()) {
        fe.parts.push_back(parse_positions(part));
      }
      if (gtype == "Polygon") {
        fe.rings_per_polygon.push_back(fe.parts.size());
      }
    } else if (gtype == "MultiPolygon") {
      for (auto poly : coords.cast<py::list>()) {
        std::size_t rings = 0;
        for (auto ring : poly.cast<py::list>()) {
          fe.parts.push_back(parse_positions(ring));
          ++rings;
        }
        fe.rings_per_polygon.push_back(rings);
      }
    } else {
      continue;
    }
    if (fe.parts.empty()) {
      continue;
    }
    fe.geometry_type = gtype;
    segment_reshape::refresh_bbox(fe);
    out.push_back(std::move(fe));
    source.push_back(pos);
  }
  return out;
}

static segment_reshape::ReshapeConfig make_config(const py::object &eps, const py::object &trigger_tolerance,
                                                  const py::object &default_z, const py::object &snap_endpoints) {
  auto cfg = segment_reshape::config_from_env();
  if (!eps.is_none()) {
    cfg.eps = eps.cast<double>();
  }
  if (!trigger_tolerance.is_none()) {
    cfg.trigger_tolerance = trigger_tolerance.cast<double>();
  }
  if (!default_z.is_none()) {
    cfg.default_z = default_z.cast<double>();
  }
  if (!snap_endpoints.is_none()) {
    cfg.snap_endpoint_anchors = snap_endpoints.cast<bool>();
  }
  return segment_reshape::sanitized(cfg);
}

static py::object json_to_py(const nlohmann::json &j) {
  if (j.is_array()) {
    py::list l;
    for (const auto &v : j) {
      l.append(json_to_py(v));
    }
    return std::move(l);
  }
  if (j.is_object()) {
    py::dict d;
    for (auto it = j.begin(); it != j.end(); ++it) {
      d[py::str(it.key())] = json_to_py(it.value());
    }
    return std::move(d);
  }
  if (j.is_boolean()) {
    return py::bool_(j.get<bool>());
  }
  if (j.is_number_integer()) {
    return py::int_(j.get<long long>());
  }
  if (j.is_number()) {
    return py::float_(j.get<double>());
  }
  if (j.is_string()) {
    return py::str(j.get<std::string>());
  }
  return py::none();
}

static py::dict issue_to_py(const segment_reshape::Issue &iss) {
  py::dict it;
  it["kind"] = iss.kind;
  it["fid"] = iss.fid;
  it["point"] = py::make_tuple(iss.point.x, iss.point.y);
  it["message"] = iss.message;
  return it;
}

static py::dict segment_to_py(const segment_reshape::CommonSegment &seg, const std::vector<std::size_t> &source) {
  py::list points;
  for (const auto &p : seg.points) {
    points.append(py::make_tuple(p.x, p.y));
  }
  py::list full_span;
  for (const auto &a : seg.full_span) {
    py::dict d;
    d["fid"] = a.fid;
    d["index"] = source[a.feature];
    d["part"] = a.part;
    d["vertex_indices"] = a.vertex_indices;
    d["direction"] = a.direction;
    d["wraps"] = a.wraps;
    full_span.append(std::move(d));
  }
  py::list endpoints;
  for (const auto &a : seg.endpoints) {
    py::dict d;
    d["fid"] = a.fid;
    d["index"] = source[a.feature];
    d["part"] = a.part;
    d["vertex_index"] = a.vertex_index;
    d["is_start"] = a.is_start;
    endpoints.append(std::move(d));
  }
  py::dict out;
  out["segment"] = points;
  out["closed"] = seg.closed;
  out["full_span"] = full_span;
  out["endpoints"] = endpoints;
  return out;
}

static py::dict stats_to_py(const segment_reshape::MatchStats &st) {
  py::dict stats;
  stats["candidate_parts"] = st.candidate_parts;
  stats["vertices_indexed"] = st.vertices_indexed;
  stats["participants"] = st.participants;
  stats["walk_steps"] = st.walk_steps;
  stats["wrap_stops"] = st.wrap_stops;
  stats["touch_breaks"] = st.touch_breaks;
  stats["consensus_stops"] = st.consensus_stops;
  return stats;
}

py::object find_common_segment_cpp(const py::list &features, const py::object &trigger, const py::object &eps,
                                   const py::object &trigger_tolerance) {
  std::vector<std::size_t> source;
  const auto layer = extract_features(features, source);
  const auto cfg = make_config(eps, trigger_tolerance, py::none(), py::none());
  segment_reshape::MatchStats stats;
  const auto seg = segment_reshape::find_common_segment(parse_pt(trigger), layer, cfg, &stats);
  if (!seg) {
    return py::none();
  }
  py::dict out = segment_to_py(*seg, source);
  out["stats"] = stats_to_py(stats);
  return std::move(out);
}

py::dict reshape_cpp(const py::list &features, const py::object &trigger, const py::object &new_chain,
                     const py::object &eps, const py::object &trigger_tolerance, const py::object &default_z,
                     const py::object &snap_endpoints) {
  std::vector<std::size_t> source;
  const auto layer = extract_features(features, source);
  const auto cfg = make_config(eps, trigger_tolerance, default_z, snap_endpoints);
  const auto chain = parse_positions(new_chain);

  segment_reshape::MatchStats stats;
  const auto seg = segment_reshape::find_common_segment(parse_pt(trigger), layer, cfg, &stats);
  if (!seg) {
    py::dict counts;
    counts["edited"] = 0;
    counts["full_span"] = 0;
    counts["endpoint_only"] = 0;
    counts["failed"] = 0;
    counts["warnings"] = 0;
    py::dict out;
    out["action"] = "noop";
    out["message"] = "no common segment at the trigger point";
    out["edits"] = py::list();
    out["failures"] = py::list();
    out["warnings"] = py::list();
    out["counts"] = counts;
    out["stats"] = stats_to_py(stats);
    return out;
  }

  const auto res = segment_reshape::reshape_segment(layer, *seg, chain, cfg);

  int full_span = 0;
  int endpoint_only = 0;
  py::list edits;
  for (const auto &e : res.edits) {
    const std::size_t pos = source[e.index];
    py::dict f;
    f["type"] = "Feature";
    f["id"] = e.fid;
    f["index"] = pos;
    f["kind"] = segment_reshape::anchor_kind_name(e.kind);
    // attributes go back exactly as the caller passed them
    auto orig = features[pos].cast<py::dict>();
    f["properties"] = orig.contains("properties") ? py::object(orig["properties"]) : py::object(py::dict());
    f["geometry"] = json_to_py(segment_reshape::feature_to_geojson(e.feature, cfg.default_z)["geometry"]);
    edits.append(std::move(f));
    if (e.kind == segment_reshape::AnchorKind::FullSpan) {
      ++full_span;
    } else {
      ++endpoint_only;
    }
  }
  py::list failures;
  for (const auto &iss : res.failures) {
    failures.append(issue_to_py(iss));
  }
  py::list warnings;
  for (const auto &iss : res.warnings) {
    warnings.append(issue_to_py(iss));
  }

  std::string msg = "reshaped " + std::to_string(res.edits.size()) + " features";
  if (!res.failures.empty()) {
    msg += ", " + std::to_string(res.failures.size()) + " failed";
  }

  py::dict counts;
  counts["edited"] = static_cast<int>(res.edits.size());
  counts["full_span"] = full_span;
  counts["endpoint_only"] = endpoint_only;
  counts["failed"] = static_cast<int>(res.failures.size());
  counts["warnings"] = static_cast<int>(res.warnings.size());

  py::dict out;
  out["action"] = "reshape";
  out["message"] = msg;
  out["segment"] = segment_to_py(*seg, source);
  out["edits"] = edits;
  out["failures"] = failures;
  out["warnings"] = warnings;
  out["counts"] = counts;
  out["stats"] = stats_to_py(stats);
  return out;
}

py::list select_candidates_cpp(const py::list &features, const py::object &trigger, double radius) {
  std::vector<std::size_t> source;
  const auto layer = extract_features(features, source);
  py::list out;
  for (auto i : segment_reshape::select_candidates(layer, parse_pt(trigger), radius)) {
    out.append(source[i]);
  }
  return out;
}

py::list splice_part_cpp(const py::list &part, std::size_t first, std::size_t count, const py::list &chain,
                         double default_z, double eps) {
  segment_reshape::ReshapeConfig cfg;
  cfg.default_z = default_z;
  cfg.eps = eps;
  const auto out = segment_reshape::splice_part(parse_positions(part), first, count, parse_positions(chain),
                                                segment_reshape::sanitized(cfg));
  py::list coords;
  for (const auto &p : out) {
    coords.append(py::make_tuple(p.x, p.y, p.z));
  }
  return coords;
}

}  // namespace

PYBIND11_MODULE(segment_reshape_cpp, m) {
  m.doc() = "Common segment matching and reshape core (C++)";

  py::register_exception<segment_reshape::InvalidGeometryError>(m, "InvalidGeometryError", PyExc_ValueError);
  py::register_exception<segment_reshape::DisjointEditError>(m, "DisjointEditError", PyExc_RuntimeError);

  m.def(
      "find_common_segment",
      &find_common_segment_cpp,
      py::arg("features"),
      py::arg("trigger"),
      py::arg("eps") = py::none(),
      py::arg("trigger_tolerance") = py::none(),
      "Find the common segment at trigger; returns {segment, closed, full_span, endpoints, stats} or None.");

  m.def(
      "reshape",
      &reshape_cpp,
      py::arg("features"),
      py::arg("trigger"),
      py::arg("new_chain"),
      py::arg("eps") = py::none(),
      py::arg("trigger_tolerance") = py::none(),
      py::arg("default_z") = py::none(),
      py::arg("snap_endpoints") = py::none(),
      "Replace the common segment at trigger with new_chain in every feature sharing it.");

  m.def(
      "select_candidates",
      &select_candidates_cpp,
      py::arg("features"),
      py::arg("trigger"),
      py::arg("radius"),
      "Indices of features whose bbox is near trigger, widened by the bboxes of those hits.");

  m.def(
      "splice_part",
      &splice_part_cpp,
      py::arg("part"),
      py::arg("first"),
      py::arg("count"),
      py::arg("chain"),
      py::arg("default_z") = 0.0,
      py::arg("eps") = 1e-9,
      "Replace count vertices of part starting at first with chain.");
}
