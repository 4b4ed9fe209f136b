#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#include "segment_reshape/edit_result.h"
#include "segment_reshape/errors.h"
#include "segment_reshape/feature_rtree.h"
#include "segment_reshape/geojson_io.h"
#include "segment_reshape/reshape_config.h"
#include "segment_reshape/segment_matcher.h"

// reshape_demo <features.geojson> <x> <y> [chain.json]
int main(int argc, char **argv) {
  if (argc < 4) {
    std::cerr << "usage: " << argv[0] << " <features.geojson> <x> <y> [chain.json]" << std::endl;
    return 2;
  }

  std::vector<segment_reshape::Feature> layer;
  if (!segment_reshape::load_features_geojson(argv[1], layer)) {
    return 1;
  }

  segment_reshape::Pt trigger{0.0, 0.0};
  try {
    trigger = segment_reshape::Pt{std::stod(argv[2]), std::stod(argv[3])};
  } catch (const std::logic_error &e) {
    std::cerr << "Bad trigger coordinate: " << e.what() << std::endl;
    return 2;
  }

  const auto cfg = segment_reshape::config_from_env();
  const double radius = segment_reshape::read_env_double("SEGMENT_RESHAPE_SEARCH_RADIUS", 1.0);

  std::vector<segment_reshape::Feature> candidates;
  for (auto i : segment_reshape::select_candidates(layer, trigger, radius)) {
    candidates.push_back(layer[i]);
  }
  std::cout << "Loaded " << layer.size() << " features, " << candidates.size() << " candidates.\n";

  try {
    segment_reshape::MatchStats stats;
    const auto seg = segment_reshape::find_common_segment(trigger, candidates, cfg, &stats);
    if (!seg) {
      std::cout << "No common segment at (" << trigger.x << ", " << trigger.y << ").\n";
      return 0;
    }
    std::cout << segment_reshape::common_segment_to_json(*seg).dump(2) << "\n";

    if (argc > 4) {
      std::vector<segment_reshape::Pt> chain;
      if (!segment_reshape::load_chain_json(argv[4], chain)) {
        return 1;
      }
      const auto res = segment_reshape::reshape_segment(candidates, *seg, chain, cfg);
      std::cout << segment_reshape::edit_result_to_json(res, cfg.default_z).dump(2) << "\n";
      return res.complete() ? 0 : 3;
    }
  } catch (const segment_reshape::InvalidGeometryError &e) {
    std::cerr << "Invalid geometry: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
