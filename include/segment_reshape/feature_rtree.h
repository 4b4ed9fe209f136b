#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "segment_reshape/feature.h"

namespace segment_reshape {

struct RTreeEntry {
  BBox bb;
  std::size_t id;
};

struct RTreeNode {
  RTreeNode *parent = nullptr;
  std::unique_ptr<RTreeNode> left;
  std::unique_ptr<RTreeNode> right;
  BBox bb;
  std::vector<RTreeEntry> entries;  // leaves only
};

// Binary R-tree over feature bounding boxes. Leaves split linearly once they
// hold more than max_entries_per_node entries.
class FeatureRTree {
 public:
  explicit FeatureRTree(std::size_t max_entries_per_node = 8);
  // children point back at root_
  FeatureRTree(const FeatureRTree &) = delete;
  FeatureRTree &operator=(const FeatureRTree &) = delete;

  void insert(const BBox &bb, std::size_t id);
  // Appends the ids of every entry whose box intersects `box`.
  void query_box(const BBox &box, std::vector<std::size_t> &out_ids) const;
  std::size_t size() const { return size_; }
  int depth() const;

 private:
  void split(RTreeNode &node);
  static void recompute_bbox(RTreeNode &node);

  std::size_t max_entries_per_node_;
  std::size_t size_ = 0;
  RTreeNode root_;
};

// Indices of the layer features that may share a segment with whatever lies at
// `trigger`: bbox within `radius` of it, plus everything overlapping those hits.
// Ascending, so caller priority order is kept.
std::vector<std::size_t> select_candidates(const std::vector<Feature> &layer, const Pt &trigger, double radius);

}  // namespace segment_reshape
