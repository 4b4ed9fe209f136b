#include "segment_reshape/reshape_config.h"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "reshape_log.h"

namespace segment_reshape {

double read_env_double(const char *key, double defv) {
  const char *v = std::getenv(key);
  if (!v) {
    return defv;
  }
  try {
    return std::stod(std::string(v));
  } catch (const std::logic_error &) {
    // std::invalid_argument / std::out_of_range
    SEGMENT_RESHAPE_LOG_WARN("ignoring %s=%s (not a number)", key, v);
    return defv;
  }
}

int read_env_int(const char *key, int defv) {
  const char *v = std::getenv(key);
  if (!v) {
    return defv;
  }
  try {
    return std::stoi(std::string(v));
  } catch (const std::logic_error &) {
    SEGMENT_RESHAPE_LOG_WARN("ignoring %s=%s (not an integer)", key, v);
    return defv;
  }
}

ReshapeConfig sanitized(ReshapeConfig cfg) {
  if (!std::isfinite(cfg.eps) || cfg.eps < 0.0) {
    cfg.eps = ReshapeConfig{}.eps;
  }
  if (!std::isfinite(cfg.trigger_tolerance) || cfg.trigger_tolerance < 0.0) {
    cfg.trigger_tolerance = ReshapeConfig{}.trigger_tolerance;
  }
  if (cfg.trigger_tolerance < cfg.eps) {
    cfg.trigger_tolerance = cfg.eps;
  }
  if (!std::isfinite(cfg.default_z)) {
    cfg.default_z = 0.0;
  }
  return cfg;
}

ReshapeConfig config_from_env(ReshapeConfig base) {
  ReshapeConfig cfg = base;
  cfg.eps = read_env_double("SEGMENT_RESHAPE_EPS", cfg.eps);
  cfg.trigger_tolerance = read_env_double("SEGMENT_RESHAPE_TRIGGER_TOLERANCE", cfg.trigger_tolerance);
  cfg.default_z = read_env_double("SEGMENT_RESHAPE_DEFAULT_Z", cfg.default_z);
  cfg.snap_endpoint_anchors = read_env_int("SEGMENT_RESHAPE_SNAP_ENDPOINTS", cfg.snap_endpoint_anchors ? 1 : 0) != 0;
  return sanitized(cfg);
}

}  // namespace segment_reshape
