#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "segment_reshape/errors.h"
#include "segment_reshape/reshape_editor.h"
#include "segment_reshape/segment_matcher.h"
#include "test_helpers.h"

using namespace segment_reshape;
using test_util::expect_xy;
using test_util::line;
using test_util::polygon;

namespace {

const UpdatedGeometry &by_fid(const std::vector<UpdatedGeometry> &ups, const std::string &fid) {
  for (const auto &u : ups) {
    if (u.fid == fid) {
      return u;
    }
  }
  throw std::runtime_error("no update for " + fid);
}

}  // namespace

TEST(SpliceTest, InteriorRunKeepsBothSides) {
  const std::vector<Pt> part = {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}};
  const auto out = splice_part(part, 1, 3, {{1, 1}, {3, 1}});
  expect_xy(out, {{0, 0}, {1, 1}, {3, 1}, {4, 0}});
}

TEST(SpliceTest, CollapseThenRestoreIsIdentity) {
  const std::vector<Pt> part = {{0, 0, 10}, {1, 0, 11}, {2, 0, 12}, {3, 0, 13}, {4, 0, 14}};
  const std::vector<Pt> run(part.begin() + 1, part.begin() + 4);

  const auto collapsed = splice_part(part, 1, 3, {{2, 5, 20}});
  ASSERT_EQ(collapsed.size(), 3u);

  const auto restored = splice_part(collapsed, 1, 1, run);
  ASSERT_EQ(restored.size(), part.size());
  for (std::size_t i = 0; i < part.size(); ++i) {
    EXPECT_EQ(restored[i].x, part[i].x);
    EXPECT_EQ(restored[i].y, part[i].y);
    EXPECT_EQ(restored[i].z, part[i].z);
  }
}

TEST(SpliceTest, MissingZTakesDefault) {
  ReshapeConfig cfg;
  cfg.default_z = -7.5;
  const std::vector<Pt> part = {{0, 0, 3}, {1, 0, 3}, {2, 0, 3}};
  const auto out = splice_part(part, 1, 1, {{1, 2}, {1.5, 2, 9}}, cfg);
  ASSERT_EQ(out.size(), 4u);
  EXPECT_DOUBLE_EQ(out[1].z, -7.5);
  EXPECT_DOUBLE_EQ(out[2].z, 9.0);
  EXPECT_DOUBLE_EQ(out[0].z, 3.0);
  EXPECT_DOUBLE_EQ(out[3].z, 3.0);
}

TEST(SpliceTest, RingRunInsideArrayStaysClosed) {
  const std::vector<Pt> ring = {{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}};
  const auto out = splice_part(ring, 1, 2, {{10, 0}, {12, 5}, {10, 10}});
  expect_xy(out, {{0, 0}, {10, 0}, {12, 5}, {10, 10}, {0, 10}, {0, 0}});
}

TEST(SpliceTest, RingRunAcrossClosingVertexRestitches) {
  const std::vector<Pt> ring = {{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}};
  // run is [3, 0, 1]
  const auto out = splice_part(ring, 3, 3, {{0, 10}, {-1, -1}, {10, 0}});
  expect_xy(out, {{0, 10}, {-1, -1}, {10, 0}, {10, 10}, {0, 10}});
}

TEST(SpliceTest, WholeRingBecomesChain) {
  const std::vector<Pt> ring = {{0, 0}, {10, 0}, {10, 10}, {0, 0}};
  const auto out = splice_part(ring, 0, 3, {{0, 0}, {12, 0}, {12, 12}, {0, 0}});
  expect_xy(out, {{0, 0}, {12, 0}, {12, 12}, {0, 0}});
}

TEST(SpliceTest, RejectsDuplicateNeighbours) {
  const std::vector<Pt> part = {{0, 0}, {1, 0}, {2, 0}};
  EXPECT_THROW(splice_part(part, 1, 1, {{0, 0}}, ReshapeConfig{}, "A"), DisjointEditError);
  try {
    splice_part(part, 1, 1, {{2, 0}}, ReshapeConfig{}, "A");
    FAIL() << "expected DisjointEditError";
  } catch (const DisjointEditError &e) {
    EXPECT_EQ(e.fid(), "A");
  }
}

TEST(SpliceTest, RejectsCollapsedRing) {
  const std::vector<Pt> ring = {{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}};
  EXPECT_THROW(splice_part(ring, 1, 3, {{5, 5}}), DisjointEditError);
}

TEST(SpliceTest, RejectsBadRange) {
  const std::vector<Pt> part = {{0, 0}, {1, 0}, {2, 0}};
  EXPECT_THROW(splice_part(part, 2, 2, {{5, 5}}), InvalidGeometryError);
  EXPECT_THROW(splice_part(part, 0, 0, {{5, 5}}), InvalidGeometryError);
  EXPECT_THROW(splice_part(part, 0, 1, {}), InvalidGeometryError);
}

TEST(ApplyReshapeTest, ReversedFeatureGetsReversedChain) {
  const std::vector<Feature> fs = {
      line("A", {{-1, 1}, {0, 0}, {1, 0}, {2, 0}, {3, 1}}),
      line("B", {{3, -1}, {2, 0}, {1, 0}, {0, 0}, {-1, -1}}),
  };
  const auto seg = find_common_segment(Pt{1, 0}, fs);
  ASSERT_TRUE(seg.has_value());
  const auto ups = apply_reshape(fs, *seg, {{0, 0}, {0.5, 0.5}, {1.5, 0.5}, {2, 0}});
  ASSERT_EQ(ups.size(), 2u);
  EXPECT_EQ(by_fid(ups, "A").kind, AnchorKind::FullSpan);
  expect_xy(by_fid(ups, "A").parts[0], {{-1, 1}, {0, 0}, {0.5, 0.5}, {1.5, 0.5}, {2, 0}, {3, 1}});
  expect_xy(by_fid(ups, "B").parts[0], {{3, -1}, {2, 0}, {1.5, 0.5}, {0.5, 0.5}, {0, 0}, {-1, -1}});
}

TEST(ApplyReshapeTest, InteriorRunRemergesIntoOnePart) {
  const std::vector<Feature> fs = {
      line("A", {{-2, 0}, {-1, 0}, {0, 0}, {1, 0}, {2, 0}, {3, 0}}),
      line("B", {{0, -5}, {0, 0}, {1, 0}, {1, -5}}),
  };
  ReshapeConfig cfg;
  cfg.default_z = 7.5;
  const auto seg = find_common_segment(Pt{0, 0}, fs, cfg);
  ASSERT_TRUE(seg.has_value());
  const auto ups = apply_reshape(fs, *seg, {{0, 0}, {0.5, 1}, {1, 0}}, cfg);

  const auto &a = by_fid(ups, "A");
  ASSERT_EQ(a.parts.size(), 1u);
  expect_xy(a.parts[0], {{-2, 0}, {-1, 0}, {0, 0}, {0.5, 1}, {1, 0}, {2, 0}, {3, 0}});
  for (std::size_t i = 2; i <= 4; ++i) {
    EXPECT_DOUBLE_EQ(a.parts[0][i].z, 7.5);
  }
  expect_xy(by_fid(ups, "B").parts[0], {{0, -5}, {0, 0}, {0.5, 1}, {1, 0}, {1, -5}});
}

TEST(ApplyReshapeTest, InsertedVerticesNeverKeepNaNZ) {
  const std::vector<Feature> fs = {
      line("A", {{0, 0, 1}, {1, 0, 1}, {2, 0, 1}}),
      line("B", {{0, 0, 2}, {1, 0, 2}, {2, 0, 2}}),
  };
  const auto seg = find_common_segment(Pt{1, 0}, fs);
  ASSERT_TRUE(seg.has_value());
  const auto ups = apply_reshape(fs, *seg, {{0, 0}, {1, 3}, {2, 0}});
  for (const auto &u : ups) {
    for (const auto &p : u.parts[0]) {
      EXPECT_FALSE(std::isnan(p.z)) << u.fid;
    }
  }
}

TEST(ApplyReshapeTest, WraparoundRunRestitchesRing) {
  const Pt p0{0, 0}, p1{10, 0}, p2{10, 10}, p3{0, 10};
  const std::vector<Feature> fs = {
      polygon("R", {{p0, p1, p2, p3, p0}}),
      line("L", {p3, p0, p1}),
  };
  const auto seg = find_common_segment(p0, fs);
  ASSERT_TRUE(seg.has_value());
  const auto ups = apply_reshape(fs, *seg, {p3, {-1, -1}, p1});
  expect_xy(by_fid(ups, "R").parts[0], {p3, {-1, -1}, p1, p2, p3});
  expect_xy(by_fid(ups, "L").parts[0], {p3, {-1, -1}, p1});
}

TEST(ApplyReshapeTest, ClosedSegmentReplacesBothRings) {
  const Pt p0{0, 0}, p1{10, 0}, p2{10, 10}, p3{0, 10};
  const std::vector<Feature> fs = {
      polygon("R1", {{p0, p1, p2, p3, p0}}),
      polygon("R2", {{p0, p3, p2, p1, p0}}),
  };
  const auto seg = find_common_segment(p0, fs);
  ASSERT_TRUE(seg && seg->closed);
  const Pt q2{12, 12};
  const auto ups = apply_reshape(fs, *seg, {p3, p0, p1, q2, p3});
  expect_xy(by_fid(ups, "R1").parts[0], {p3, p0, p1, q2, p3});
  expect_xy(by_fid(ups, "R2").parts[0], {p3, q2, p1, p0, p3});
}

TEST(ApplyReshapeTest, EndpointOnlyFeatureKeepsInterior) {
  const std::vector<Feature> fs = {
      line("A", {{0, 0}, {1, 0}, {2, 0}, {3, 0}}),
      line("B", {{3, 0}, {2, 0}, {1, 0}, {0, 0}}),
      line("C", {{2, 0}, {2, 5}, {4, 5}}),
  };
  const auto seg = find_common_segment(Pt{1, 0}, fs);
  ASSERT_TRUE(seg.has_value());

  const auto same_end = apply_reshape(fs, *seg, {{0, 0}, {1, 1}, {2, 0}});
  const auto &c = by_fid(same_end, "C");
  EXPECT_EQ(c.kind, AnchorKind::EndpointOnly);
  expect_xy(c.parts[0], fs[2].parts[0]);
  EXPECT_TRUE(c.warnings.empty());

  const auto moved_end = apply_reshape(fs, *seg, {{0, 0}, {1, 1}, {2, 0.5}});
  const auto &cm = by_fid(moved_end, "C");
  expect_xy(cm.parts[0], {{2, 0.5}, {2, 5}, {4, 5}});
  ASSERT_EQ(cm.warnings.size(), 1u);
  EXPECT_EQ(cm.warnings[0].kind, "coordinate_mismatch");
  expect_xy(by_fid(moved_end, "A").parts[0], {{0, 0}, {1, 1}, {2, 0.5}, {3, 0}});

  ReshapeConfig keep;
  keep.snap_endpoint_anchors = false;
  const auto kept = apply_reshape(fs, *seg, {{0, 0}, {1, 1}, {2, 0.5}}, keep);
  expect_xy(by_fid(kept, "C").parts[0], fs[2].parts[0]);
  EXPECT_EQ(by_fid(kept, "C").warnings.size(), 1u);
}

TEST(ApplyReshapeTest, FailedFeatureDoesNotBlockOthers) {
  const std::vector<Feature> fs = {
      line("A", {{-1, 0}, {0, 0}, {1, 0}, {2, 0}}),
      line("B", {{0, 0}, {1, 0}, {1, 5}}),
  };
  const auto seg = find_common_segment(Pt{0, 0}, fs);
  ASSERT_TRUE(seg.has_value());
  const auto ups = apply_reshape(fs, *seg, {{-1, 0}, {1, 0}});

  const auto &a = by_fid(ups, "A");
  EXPECT_FALSE(a.ok);
  EXPECT_FALSE(a.error.empty());
  expect_xy(a.parts[0], fs[0].parts[0]);

  const auto &b = by_fid(ups, "B");
  EXPECT_TRUE(b.ok);
  expect_xy(b.parts[0], {{-1, 0}, {1, 0}, {1, 5}});
}

TEST(ApplyReshapeTest, BadChainIsFatal) {
  const std::vector<Feature> fs = {
      line("A", {{0, 0}, {1, 0}}),
      line("B", {{1, 0}, {0, 0}}),
  };
  const auto seg = find_common_segment(Pt{0, 0}, fs);
  ASSERT_TRUE(seg.has_value());
  EXPECT_THROW(apply_reshape(fs, *seg, {}), InvalidGeometryError);
  EXPECT_THROW(apply_reshape(fs, *seg, {{0, 0}, {std::nan(""), 1}}), InvalidGeometryError);
}

TEST(ApplyReshapeTest, SnappedRingEndpointKeepsRingClosed) {
  const std::vector<Feature> fs = {
      line("A", {{0, 0}, {1, 0}, {2, 0}}),
      polygon("R", {{{2, 0}, {4, 0}, {4, 4}, {2, 4}, {2, 0}}}),
  };
  for (std::size_t vertex : {std::size_t{0}, std::size_t{4}}) {
    CommonSegment seg;
    seg.points = {{0, 0}, {1, 0}, {2, 0}};
    seg.full_span.push_back(FullSpanAnchor{0, "A", 0, {0, 1, 2}, 1, false});
    seg.endpoints.push_back(EndpointAnchor{1, "R", 0, vertex, false});

    const auto ups = apply_reshape(fs, seg, {{0, 0}, {1, 1}, {2, 0.5}});
    const auto &r = by_fid(ups, "R");
    EXPECT_TRUE(r.ok) << "vertex " << vertex;
    expect_xy(r.parts[0], {{2, 0.5}, {4, 0}, {4, 4}, {2, 4}, {2, 0.5}});
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].kind, "coordinate_mismatch");
  }
}

TEST(ApplyReshapeTest, ClosedSegmentTooShortForRingIsRejected) {
  const std::vector<Feature> fs = {
      polygon("R", {{{0, 0}, {10, 0}, {10, 10}, {0, 0}}}),
  };
  CommonSegment seg;
  seg.closed = true;
  seg.points = {{0, 0}};
  seg.full_span.push_back(FullSpanAnchor{0, "R", 0, {0}, -1, false});
  EXPECT_THROW(apply_reshape(fs, seg, {{0, 0}, {5, 5}}), InvalidGeometryError);

  seg.points = {{0, 0}, {10, 0}, {0, 0}};
  seg.full_span[0].vertex_indices = {0, 1, 0};
  EXPECT_THROW(apply_reshape(fs, seg, {{0, 0}, {5, 5}}), InvalidGeometryError);
}
