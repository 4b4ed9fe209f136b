#include "segment_reshape/feature_rtree.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <set>

namespace segment_reshape {

using namespace geom_common;

namespace {

double enlargement_needed(const BBox &box, const BBox &add) {
  BBox merged = box;
  bbox_merge(merged, add);
  return bbox_area(merged) - bbox_area(box);
}

}  // namespace

FeatureRTree::FeatureRTree(std::size_t max_entries_per_node)
    : max_entries_per_node_(std::max<std::size_t>(2, max_entries_per_node)) {}

void FeatureRTree::split(RTreeNode &node) {
  const std::size_t n = node.entries.size();
  if (n <= 1) {
    return;
  }

  // Linear split: seeds are the pair with the largest normalised separation on
  // either axis, the rest go where the box grows least.
  struct SeedPick {
    int a = -1;
    int b = -1;
    double sep = 0.0;
  };

  const auto pick_seeds_axis = [&](bool use_x) -> SeedPick {
    double min_low = std::numeric_limits<double>::infinity();
    double max_high = -std::numeric_limits<double>::infinity();
    double max_low = -std::numeric_limits<double>::infinity();
    double min_high = std::numeric_limits<double>::infinity();
    SeedPick out;
    for (std::size_t i = 0; i < n; ++i) {
      const auto &b = node.entries[i].bb;
      const double low = use_x ? b.minx : b.miny;
      const double high = use_x ? b.maxx : b.maxy;
      min_low = std::min(min_low, low);
      max_high = std::max(max_high, high);
      if (low > max_low) {
        max_low = low;
        out.a = static_cast<int>(i);
      }
      if (high < min_high) {
        min_high = high;
        out.b = static_cast<int>(i);
      }
    }
    const double width = std::max(1e-12, max_high - min_low);
    out.sep = std::max(0.0, (max_low - min_high) / width);
    return out;
  };

  const SeedPick sx = pick_seeds_axis(true);
  const SeedPick sy = pick_seeds_axis(false);
  const SeedPick s = (sy.sep > sx.sep) ? sy : sx;
  int seed_a = s.a;
  int seed_b = s.b;
  if (seed_a < 0 || seed_b < 0) {
    return;
  }
  if (seed_a == seed_b) {
    // degenerate: take the entry whose centre is farthest from seed_a
    const auto &ba = node.entries[static_cast<std::size_t>(seed_a)].bb;
    const Pt ca{(ba.minx + ba.maxx) * 0.5, (ba.miny + ba.maxy) * 0.5};
    double best_d2 = -1.0;
    for (std::size_t i = 0; i < n; ++i) {
      if (static_cast<int>(i) == seed_a) {
        continue;
      }
      const auto &bb = node.entries[i].bb;
      const double d2 = dist2(ca, Pt{(bb.minx + bb.maxx) * 0.5, (bb.miny + bb.maxy) * 0.5});
      if (d2 > best_d2) {
        best_d2 = d2;
        seed_b = static_cast<int>(i);
      }
    }
    if (seed_a == seed_b) {
      return;
    }
  }

  auto left = std::make_unique<RTreeNode>();
  auto right = std::make_unique<RTreeNode>();
  left->parent = &node;
  right->parent = &node;

  const auto push = [](RTreeNode &dst, const RTreeEntry &e) {
    dst.entries.push_back(e);
    bbox_merge(dst.bb, e.bb);
  };
  push(*left, node.entries[static_cast<std::size_t>(seed_a)]);
  push(*right, node.entries[static_cast<std::size_t>(seed_b)]);

  const std::size_t min_fill = (n + 1) / 2 - 1;
  std::size_t remaining = n - 2;
  for (std::size_t k = 0; k < n; ++k) {
    if (static_cast<int>(k) == seed_a || static_cast<int>(k) == seed_b) {
      continue;
    }
    const auto &e = node.entries[k];
    if (left->entries.size() + remaining <= min_fill) {
      push(*left, e);
    } else if (right->entries.size() + remaining <= min_fill) {
      push(*right, e);
    } else {
      const double el = enlargement_needed(left->bb, e.bb);
      const double er = enlargement_needed(right->bb, e.bb);
      if (el < er) {
        push(*left, e);
      } else if (er < el) {
        push(*right, e);
      } else {
        const double al = bbox_area(left->bb);
        const double ar = bbox_area(right->bb);
        if (al < ar || (al == ar && left->entries.size() <= right->entries.size())) {
          push(*left, e);
        } else {
          push(*right, e);
        }
      }
    }
    --remaining;
  }

  node.entries.clear();
  node.left = std::move(left);
  node.right = std::move(right);
  recompute_bbox(node);
}

void FeatureRTree::insert(const BBox &bb, std::size_t id) {
  RTreeNode *current = &root_;
  while (current->left && current->right) {
    const double enlarge_left = enlargement_needed(current->left->bb, bb);
    const double enlarge_right = enlargement_needed(current->right->bb, bb);
    if (enlarge_left < enlarge_right) {
      current = current->left.get();
    } else if (enlarge_right < enlarge_left) {
      current = current->right.get();
    } else if (bbox_area(current->left->bb) <= bbox_area(current->right->bb)) {
      current = current->left.get();
    } else {
      current = current->right.get();
    }
  }
  current->entries.push_back(RTreeEntry{bb, id});
  bbox_merge(current->bb, bb);
  ++size_;

  if (current->entries.size() > max_entries_per_node_) {
    split(*current);
  }

  // ancestors must cover the new entry
  for (RTreeNode *n = current; n; n = n->parent) {
    recompute_bbox(*n);
  }
}

void FeatureRTree::recompute_bbox(RTreeNode &node) {
  node.bb = bbox_empty();
  if (node.left || node.right) {
    if (node.left) {
      bbox_merge(node.bb, node.left->bb);
    }
    if (node.right) {
      bbox_merge(node.bb, node.right->bb);
    }
    return;
  }
  for (const auto &e : node.entries) {
    bbox_merge(node.bb, e.bb);
  }
}

void FeatureRTree::query_box(const BBox &box, std::vector<std::size_t> &out_ids) const {
  std::function<void(const RTreeNode *)> dfs = [&](const RTreeNode *node) {
    if (!node || bbox_is_empty(node->bb) || !bbox_intersects(node->bb, box)) {
      return;
    }
    if (!node->left && !node->right) {
      for (const auto &e : node->entries) {
        if (bbox_intersects(e.bb, box)) {
          out_ids.push_back(e.id);
        }
      }
      return;
    }
    dfs(node->left.get());
    dfs(node->right.get());
  };
  dfs(&root_);
}

int FeatureRTree::depth() const {
  std::function<int(const RTreeNode *)> walk = [&](const RTreeNode *node) -> int {
    if (!node) {
      return 0;
    }
    return 1 + std::max(walk(node->left.get()), walk(node->right.get()));
  };
  return walk(&root_);
}

std::vector<std::size_t> select_candidates(const std::vector<Feature> &layer, const Pt &trigger, double radius) {
  if (!std::isfinite(radius) || radius < 0.0) {
    radius = 0.0;
  }
  FeatureRTree tree;
  std::vector<BBox> boxes;
  boxes.reserve(layer.size());
  for (std::size_t i = 0; i < layer.size(); ++i) {
    boxes.push_back(bbox_is_empty(layer[i].bb) ? bbox_of_parts(layer[i].parts) : layer[i].bb);
    if (!bbox_is_empty(boxes.back())) {
      tree.insert(boxes.back(), i);
    }
  }

  std::vector<std::size_t> hits;
  tree.query_box(bbox_around(trigger, radius), hits);
  std::set<std::size_t> out(hits.begin(), hits.end());
  for (auto id : hits) {
    std::vector<std::size_t> more;
    tree.query_box(boxes[id], more);
    out.insert(more.begin(), more.end());
  }
  return std::vector<std::size_t>(out.begin(), out.end());
}

}  // namespace segment_reshape
