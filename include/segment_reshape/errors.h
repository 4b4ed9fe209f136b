#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "segment_reshape/geom_common.h"

namespace segment_reshape {

// Malformed input: a part with too few vertices, an empty or non-finite chain,
// a run outside the part. Fatal to the whole call.
class InvalidGeometryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A splice would have left a part in an inconsistent state. Fatal to the edit of
// the named feature only.
class DisjointEditError : public std::runtime_error {
 public:
  DisjointEditError(std::string fid, const std::string &what) : std::runtime_error(what), fid_(std::move(fid)) {}

  const std::string &fid() const noexcept { return fid_; }

 private:
  std::string fid_;
};

// Non-fatal finding reported back to the caller.
struct Issue {
  std::string kind;  // "coordinate_mismatch" | "disjoint_edit"
  geom_common::Pt point;
  std::string message;
  std::string fid;
};

}  // namespace segment_reshape
