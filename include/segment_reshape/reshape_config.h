#pragma once

namespace segment_reshape {

// Caller-owned tuning values. All distances are absolute, in the features'
// coordinate units.
struct ReshapeConfig {
  // Per-axis tolerance under which two vertices count as the same coordinate.
  double eps = 1e-9;
  // Search radius around the trigger point for the seed vertex.
  double trigger_tolerance = 1e-6;
  // Z given to inserted vertices whose chain entry has no Z.
  double default_z = 0.0;
  // Move endpoint-anchored vertices onto the new chain boundary.
  bool snap_endpoint_anchors = true;
};

// Environment overrides:
//   SEGMENT_RESHAPE_EPS, SEGMENT_RESHAPE_TRIGGER_TOLERANCE,
//   SEGMENT_RESHAPE_DEFAULT_Z, SEGMENT_RESHAPE_SNAP_ENDPOINTS (0/1)
ReshapeConfig config_from_env(ReshapeConfig base = ReshapeConfig{});

// Clamps eps/tolerance into a usable range (finite, >= 0, tolerance >= eps).
ReshapeConfig sanitized(ReshapeConfig cfg);

double read_env_double(const char *key, double defv);
int read_env_int(const char *key, int defv);

}  // namespace segment_reshape
