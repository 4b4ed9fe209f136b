#include "segment_reshape/reshape_editor.h"

#include <algorithm>
#include <map>

#include "reshape_log.h"

namespace segment_reshape {

using namespace geom_common;

namespace {

bool ring_closed(const std::vector<Pt> &part, double eps) {
  return part.size() >= 4 && same_xy(part.front(), part.back(), eps);
}

// Rejects parts that lost their shape: coincident neighbours or too few vertices.
// `logical` excludes the closing vertex of a ring.
void ensure_valid(const std::vector<Pt> &logical, bool ring, double eps, const std::string &fid) {
  const std::size_t need = ring ? 3 : 2;
  if (logical.size() < need) {
    throw DisjointEditError(fid, "feature " + fid + ": edit leaves " + std::to_string(logical.size()) +
                                     " vertices in a " + (ring ? "ring" : "line"));
  }
  for (std::size_t i = 0; i + 1 < logical.size(); ++i) {
    if (same_xy(logical[i], logical[i + 1], eps)) {
      throw DisjointEditError(fid, "feature " + fid + ": duplicate consecutive vertex at " + std::to_string(i + 1));
    }
  }
  if (ring && same_xy(logical.back(), logical.front(), eps)) {
    throw DisjointEditError(fid, "feature " + fid + ": ring closes on a duplicate vertex");
  }
}

std::vector<Pt> with_z(const std::vector<Pt> &chain, double default_z) {
  std::vector<Pt> out = chain;
  for (auto &p : out) {
    if (!has_z(p)) {
      p.z = default_z;
    }
  }
  return out;
}

}  // namespace

const char *anchor_kind_name(AnchorKind kind) {
  return kind == AnchorKind::FullSpan ? "full_span" : "endpoint_only";
}

std::vector<Pt> splice_part(const std::vector<Pt> &part, std::size_t first, std::size_t count,
                            const std::vector<Pt> &chain, const ReshapeConfig &cfg, const std::string &fid) {
  if (part.size() < 2) {
    throw InvalidGeometryError("feature " + fid + ": cannot splice into a part of " + std::to_string(part.size()) +
                               " vertices");
  }
  if (chain.empty()) {
    throw InvalidGeometryError("feature " + fid + ": empty replacement chain");
  }
  const bool ring = ring_closed(part, cfg.eps);
  const std::vector<Pt> logical(part.begin(), ring ? part.end() - 1 : part.end());
  const std::size_t n = logical.size();
  if (count == 0 || count > n || first >= n || (!ring && first + count > n)) {
    throw InvalidGeometryError("feature " + fid + ": run [" + std::to_string(first) + ", +" + std::to_string(count) +
                               ") outside part of " + std::to_string(n) + " vertices");
  }

  const std::vector<Pt> fill = with_z(chain, cfg.default_z);
  std::vector<Pt> out;
  out.reserve(n - count + fill.size() + 1);
  if (ring && count == n) {
    out = fill;
    if (out.size() > 1 && same_xy(out.front(), out.back(), cfg.eps)) {
      out.pop_back();
    }
  } else if (first + count <= n) {
    out.insert(out.end(), logical.begin(), logical.begin() + first);
    out.insert(out.end(), fill.begin(), fill.end());
    out.insert(out.end(), logical.begin() + first + count, logical.end());
  } else {
    // run crosses the closing vertex: the ring now starts on the chain
    const std::size_t end = first + count - n;
    out.insert(out.end(), fill.begin(), fill.end());
    out.insert(out.end(), logical.begin() + end, logical.begin() + first);
  }

  ensure_valid(out, ring, cfg.eps, fid);
  if (ring) {
    out.push_back(out.front());
  }
  return out;
}

std::vector<UpdatedGeometry> apply_reshape(const std::vector<Feature> &features, const CommonSegment &segment,
                                           const std::vector<Pt> &new_chain, const ReshapeConfig &cfg_in) {
  const ReshapeConfig cfg = sanitized(cfg_in);
  if (new_chain.empty()) {
    throw InvalidGeometryError("empty replacement chain");
  }
  for (std::size_t i = 0; i < new_chain.size(); ++i) {
    if (!is_finite_xy(new_chain[i])) {
      throw InvalidGeometryError("replacement chain vertex " + std::to_string(i) + " is not finite");
    }
  }
  if (segment.points.empty()) {
    throw InvalidGeometryError("empty common segment");
  }
  if (segment.closed && segment.points.size() < 4) {
    throw InvalidGeometryError("closed common segment needs at least 4 points, got " +
                               std::to_string(segment.points.size()));
  }
  const std::size_t run = segment.closed ? segment.points.size() - 1 : segment.points.size();

  std::vector<UpdatedGeometry> out;
  std::map<std::size_t, std::size_t> slot;
  auto entry = [&](std::size_t feature, std::size_t part) -> UpdatedGeometry & {
    if (feature >= features.size() || part >= features[feature].parts.size()) {
      throw InvalidGeometryError("anchor refers to feature " + std::to_string(feature) + " part " +
                                 std::to_string(part) + " which is not in the candidate list");
    }
    auto it = slot.find(feature);
    if (it == slot.end()) {
      it = slot.emplace(feature, out.size()).first;
      UpdatedGeometry u;
      u.feature = feature;
      u.fid = features[feature].fid;
      u.parts = features[feature].parts;
      u.kind = AnchorKind::EndpointOnly;
      out.push_back(std::move(u));
    }
    return out[it->second];
  };
  auto fail = [&](UpdatedGeometry &u, const DisjointEditError &e, const Pt &where) {
    SEGMENT_RESHAPE_LOG_WARN("%s", e.what());
    u.ok = false;
    u.error = e.what();
    u.error_point = where;
    u.parts = features[u.feature].parts;
  };

  std::vector<Pt> reversed(new_chain.rbegin(), new_chain.rend());
  for (const auto &a : segment.full_span) {
    UpdatedGeometry &u = entry(a.feature, a.part);
    u.kind = AnchorKind::FullSpan;
    if (!u.ok) {
      continue;
    }
    if (a.vertex_indices.size() != segment.points.size()) {
      throw InvalidGeometryError("anchor of feature " + a.fid + " does not span the common segment");
    }
    const std::size_t first = a.direction > 0 ? a.vertex_indices.front() : a.vertex_indices[run - 1];
    try {
      u.parts[a.part] = splice_part(u.parts[a.part], first, run, a.direction > 0 ? new_chain : reversed, cfg, u.fid);
    } catch (const DisjointEditError &e) {
      fail(u, e, new_chain.front());
    }
  }

  for (const auto &a : segment.endpoints) {
    UpdatedGeometry &u = entry(a.feature, a.part);
    if (!u.ok) {
      continue;
    }
    auto &pts = u.parts[a.part];
    if (a.vertex_index >= pts.size()) {
      throw InvalidGeometryError("endpoint anchor of feature " + a.fid + " is outside its part");
    }
    const Pt &target = a.is_start ? new_chain.front() : new_chain.back();
    const Pt original = pts[a.vertex_index];
    if (same_xy(original, target, cfg.eps)) {
      continue;
    }
    u.warnings.push_back(Issue{"coordinate_mismatch", original,
                               "shared endpoint does not match the " + std::string(a.is_start ? "start" : "end") +
                                   " of the new chain",
                               u.fid});
    if (!cfg.snap_endpoint_anchors) {
      continue;
    }
    const bool ring = ring_closed(pts, cfg.eps);
    const Pt moved{target.x, target.y, has_z(target) ? target.z : original.z};
    pts[a.vertex_index] = moved;
    if (ring && (a.vertex_index == 0 || a.vertex_index + 1 == pts.size())) {
      pts.front() = moved;
      pts.back() = moved;
    }
    try {
      ensure_valid(std::vector<Pt>(pts.begin(), ring ? pts.end() - 1 : pts.end()), ring, cfg.eps, u.fid);
    } catch (const DisjointEditError &e) {
      fail(u, e, moved);
    }
  }

  return out;
}

}  // namespace segment_reshape
