#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "segment_reshape/edit_result.h"
#include "segment_reshape/feature.h"
#include "segment_reshape/segment_matcher.h"

namespace segment_reshape {

// [x, y] or [x, y, z]. Throws InvalidGeometryError otherwise.
Pt pt_from_json(const nlohmann::json &j);

// One GeoJSON Feature. `ordinal` names features without an id.
// Throws InvalidGeometryError for malformed line/polygon geometry; returns a
// feature with no parts for geometry types the engine does not edit.
Feature feature_from_geojson(const nlohmann::json &j, std::size_t ordinal);

// FeatureCollection or a bare array of features. Features without line or
// polygon geometry are skipped.
std::vector<Feature> features_from_geojson(const nlohmann::json &doc);

// Reports open/parse/geometry failures on stderr.
bool load_features_geojson(const std::string &path, std::vector<Feature> &out);

// Array of positions, a LineString geometry or a Feature holding one.
std::vector<Pt> chain_from_json(const nlohmann::json &j);
bool load_chain_json(const std::string &path, std::vector<Pt> &out);

nlohmann::json pt_to_json(const Pt &p);
// Positions are written 2D unless some vertex of the feature has Z; then every
// vertex gets one, `default_z` filling the gaps. Values named in
// `json_attributes` are written back with their JSON type.
nlohmann::json feature_to_geojson(const Feature &f, double default_z = 0.0);
nlohmann::json common_segment_to_json(const CommonSegment &seg);
nlohmann::json issue_to_json(const Issue &issue);
nlohmann::json edit_result_to_json(const EditResult &res, double default_z = 0.0);

}  // namespace segment_reshape
