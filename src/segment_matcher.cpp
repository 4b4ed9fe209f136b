#include "segment_reshape/segment_matcher.h"

#include <limits>
#include <set>
#include <utility>

#include "reshape_log.h"
#include "segment_reshape/part_index.h"
#include "vertex_grid.h"

namespace segment_reshape {

using namespace geom_common;

namespace {

using PartKey = std::pair<std::size_t, std::size_t>;

// A part sharing the primary seed edge. It must follow the seed along the
// whole run, in its own direction.
struct Participant {
  std::size_t feature;
  std::size_t part;
  std::size_t start;
  int orient;
};

// State of the walk in one direction.
struct WalkState {
  int dir;
  std::size_t seed_pos;
  std::vector<std::size_t> pos;
  bool alive = true;
  std::vector<std::size_t> seed_trail;
  std::vector<std::vector<std::size_t>> trails;
};

// +1 if the part at `v` continues towards `neighbor` the same way the seed
// does, -1 if it runs the other way, 0 if the edge is not shared.
int edge_orientation(const PartIndex &part, std::size_t v, const Pt &neighbor, int seed_dir, double eps) {
  std::size_t n = 0;
  if (part.step(v, seed_dir, n) && same_xy(part.at(n), neighbor, eps)) {
    return 1;
  }
  if (part.step(v, -seed_dir, n) && same_xy(part.at(n), neighbor, eps)) {
    return -1;
  }
  return 0;
}

FullSpanAnchor make_anchor(const Feature &f, std::size_t feature, std::size_t part, std::vector<std::size_t> indices,
                           int dir, bool closed) {
  FullSpanAnchor a{feature, f.fid, part, std::move(indices), dir, false};
  for (std::size_t k = 0; k + 1 < a.vertex_indices.size(); ++k) {
    const long long here = static_cast<long long>(a.vertex_indices[k]);
    const long long next = static_cast<long long>(a.vertex_indices[k + 1]);
    if (next != here + dir) {
      a.wraps = true;
      break;
    }
  }
  if (closed) {
    a.vertex_indices.push_back(a.vertex_indices.front());
  }
  return a;
}

std::vector<std::size_t> joined(const std::vector<std::size_t> &back_trail, std::size_t start,
                                const std::vector<std::size_t> &fwd_trail) {
  std::vector<std::size_t> out(back_trail.rbegin(), back_trail.rend());
  out.push_back(start);
  out.insert(out.end(), fwd_trail.begin(), fwd_trail.end());
  return out;
}

}  // namespace

std::optional<CommonSegment> find_common_segment(const Pt &trigger, const std::vector<Feature> &candidates,
                                                 const ReshapeConfig &cfg_in, MatchStats *stats) {
  MatchStats local;
  MatchStats &st = stats ? *stats : local;
  st = MatchStats{};
  const ReshapeConfig cfg = sanitized(cfg_in);
  const double eps = cfg.eps;

  std::vector<std::vector<PartIndex>> index;
  index.reserve(candidates.size());
  VertexGrid grid(eps);
  for (std::size_t f = 0; f < candidates.size(); ++f) {
    index.push_back(build_part_index(candidates[f], eps));
    for (const auto &pi : index.back()) {
      grid.add_part(f, pi);
      st.candidate_parts++;
      st.vertices_indexed += static_cast<int>(pi.logical_count());
    }
  }

  // Seed: nearest vertex within tolerance, first candidate wins ties.
  const double tol2 = cfg.trigger_tolerance * cfg.trigger_tolerance;
  double best = std::numeric_limits<double>::infinity();
  bool found = false;
  std::size_t sf = 0, sp = 0, si = 0;
  for (std::size_t f = 0; f < index.size(); ++f) {
    for (const auto &pi : index[f]) {
      for (std::size_t i = 0; i < pi.logical_count(); ++i) {
        const double d = dist2(trigger, pi.at(i));
        if (d <= tol2 && d < best) {
          best = d;
          found = true;
          sf = f;
          sp = pi.part();
          si = i;
        }
      }
    }
  }
  if (!found) {
    SEGMENT_RESHAPE_LOG_DEBUG("no vertex within %g of (%g, %g)", cfg.trigger_tolerance, trigger.x, trigger.y);
    return std::nullopt;
  }

  const PartIndex &seed = index[sf][sp];
  const Pt &s = seed.at(si);
  std::size_t fi = 0, bi = 0;
  const bool has_f = seed.step(si, +1, fi);
  const bool has_b = seed.step(si, -1, bi);

  auto is_seed_part = [&](const VertexRef &r) { return r.feature == sf && r.part == sp; };

  std::vector<VertexRef> occ;
  for (const auto &r : grid.query(s)) {
    if (!is_seed_part(r)) {
      occ.push_back(r);
    }
  }

  std::vector<int> fwd_o(occ.size(), 0);
  std::vector<int> bwd_o(occ.size(), 0);
  bool fwd_shared = false;
  bool bwd_shared = false;
  for (std::size_t k = 0; k < occ.size(); ++k) {
    const PartIndex &cp = index[occ[k].feature][occ[k].part];
    if (has_f) {
      fwd_o[k] = edge_orientation(cp, occ[k].vertex, seed.at(fi), +1, eps);
      fwd_shared = fwd_shared || fwd_o[k] != 0;
    }
    if (has_b) {
      bwd_o[k] = edge_orientation(cp, occ[k].vertex, seed.at(bi), -1, eps);
      bwd_shared = bwd_shared || bwd_o[k] != 0;
    }
  }

  int primary = 0;
  if (fwd_shared && bwd_shared) {
    const double df = dist2_point_seg(trigger, s, seed.at(fi));
    const double db = dist2_point_seg(trigger, seed.at(bi), s);
    primary = db < df ? -1 : 1;
  } else if (fwd_shared) {
    primary = 1;
  } else if (bwd_shared) {
    primary = -1;
  }

  std::vector<Participant> parts;
  std::set<PartKey> participant_parts;
  if (primary != 0) {
    const auto &orients = primary > 0 ? fwd_o : bwd_o;
    for (std::size_t k = 0; k < occ.size(); ++k) {
      const PartKey key{occ[k].feature, occ[k].part};
      if (orients[k] != 0 && participant_parts.insert(key).second) {
        parts.push_back(Participant{occ[k].feature, occ[k].part, occ[k].vertex, orients[k]});
      }
    }
  }
  st.participants = static_cast<int>(parts.size());

  auto is_outsider = [&](const VertexRef &r) {
    return !is_seed_part(r) && participant_parts.count(PartKey{r.feature, r.part}) == 0;
  };

  bool touchers_at_seed = false;
  for (const auto &r : occ) {
    touchers_at_seed = touchers_at_seed || is_outsider(r);
  }

  std::vector<std::size_t> starts;
  for (const auto &p : parts) {
    starts.push_back(p.start);
  }
  WalkState fwd{+1, si, starts};
  WalkState bwd{-1, si, starts};
  fwd.trails.resize(parts.size());
  bwd.trails.resize(parts.size());
  if (primary == 0) {
    fwd.alive = false;
    bwd.alive = false;
  } else if (touchers_at_seed) {
    // the seed vertex is a junction, the run starts there
    (primary > 0 ? bwd : fwd).alive = false;
  }

  std::size_t run_len = 1;
  bool touched = false;

  auto advance = [&](WalkState &w) {
    if (seed.closed() && run_len >= seed.logical_count()) {
      w.alive = false;
      st.wrap_stops++;
      return;
    }
    std::size_t next = 0;
    if (!seed.step(w.seed_pos, w.dir, next)) {
      w.alive = false;
      return;
    }
    std::vector<std::size_t> npos(parts.size());
    for (std::size_t k = 0; k < parts.size(); ++k) {
      const PartIndex &pp = index[parts[k].feature][parts[k].part];
      const bool exhausted = pp.closed() && run_len >= pp.logical_count();
      if (exhausted || !pp.step(w.pos[k], parts[k].orient * w.dir, npos[k]) ||
          !same_xy(pp.at(npos[k]), seed.at(next), eps)) {
        w.alive = false;
        st.consensus_stops++;
        return;
      }
    }
    w.seed_pos = next;
    w.pos = npos;
    w.seed_trail.push_back(next);
    for (std::size_t k = 0; k < parts.size(); ++k) {
      w.trails[k].push_back(npos[k]);
    }
    ++run_len;
    st.walk_steps++;
    for (const auto &r : grid.query(seed.at(next))) {
      if (is_outsider(r)) {
        w.alive = false;
        touched = true;
        st.touch_breaks++;
        break;
      }
    }
  };

  while (fwd.alive || bwd.alive) {
    if (fwd.alive) {
      advance(fwd);
    }
    if (bwd.alive) {
      advance(bwd);
    }
  }

  bool closed = seed.closed() && run_len == seed.logical_count() && !parts.empty() && !touched && !touchers_at_seed;
  for (std::size_t k = 0; closed && k < parts.size(); ++k) {
    const PartIndex &pp = index[parts[k].feature][parts[k].part];
    std::size_t after = 0;
    closed = pp.closed() && pp.logical_count() == run_len && pp.step(fwd.pos[k], parts[k].orient, after) &&
             after == bwd.pos[k];
  }

  CommonSegment seg;
  seg.closed = closed;
  seg.seed_feature = sf;
  seg.seed_part = sp;
  const auto seed_run = joined(bwd.seed_trail, si, fwd.seed_trail);
  for (auto idx : seed_run) {
    seg.points.push_back(Pt{seed.at(idx).x, seed.at(idx).y});
  }
  if (closed) {
    seg.points.push_back(seg.points.front());
  }

  seg.full_span.push_back(make_anchor(candidates[sf], sf, sp, seed_run, 1, closed));
  for (std::size_t k = 0; k < parts.size(); ++k) {
    seg.full_span.push_back(make_anchor(candidates[parts[k].feature], parts[k].feature, parts[k].part,
                                        joined(bwd.trails[k], parts[k].start, fwd.trails[k]), parts[k].orient,
                                        closed));
  }

  if (!closed) {
    auto add_endpoints = [&](const Pt &p, bool is_start) {
      for (const auto &r : grid.query(p)) {
        if (is_outsider(r)) {
          seg.endpoints.push_back(EndpointAnchor{r.feature, candidates[r.feature].fid, r.part, r.vertex, is_start});
        }
      }
    };
    add_endpoints(seg.points.front(), true);
    if (seg.points.size() > 1) {
      add_endpoints(seg.points.back(), false);
    }
  }

  std::set<std::size_t> anchored;
  for (const auto &a : seg.full_span) {
    anchored.insert(a.feature);
  }
  for (const auto &a : seg.endpoints) {
    anchored.insert(a.feature);
  }
  if (anchored.size() < 2) {
    SEGMENT_RESHAPE_LOG_DEBUG("vertex of %s at (%g, %g) is not shared", candidates[sf].fid.c_str(), s.x, s.y);
    return std::nullopt;
  }

  SEGMENT_RESHAPE_LOG_DEBUG("common segment: %zu points, %zu full span, %zu endpoint anchors%s", seg.points.size(),
                            seg.full_span.size(), seg.endpoints.size(), closed ? " (closed)" : "");
  return seg;
}

}  // namespace segment_reshape
