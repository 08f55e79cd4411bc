#pragma once
#include "batchkin/core/export.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"

namespace batchkin::core {

BATCHKIN_CORE_API double positionDistance(const Transform& T1, const Transform& T2);

// Geodesic angle in [0, pi] between the rotations of T1 and T2.
BATCHKIN_CORE_API double rotationDistance(const Transform& T1, const Transform& T2);

// Per-sample distances between two (N,7) pose batches.
BATCHKIN_CORE_API Status positionDistance(const BatchArray& a, const BatchArray& b,
                                          ScalarBatch* distance);
BATCHKIN_CORE_API Status rotationDistance(const BatchArray& a, const BatchArray& b,
                                          ScalarBatch* distance);

struct PoseTolerance {
  double position = 1e-4;  // m
  double rotation = 1e-3;  // rad
};

struct PoseComparison {
  double max_position_error = 0.0;
  double mean_position_error = 0.0;
  double max_rotation_error = 0.0;
  double mean_rotation_error = 0.0;
  Eigen::Index worst_position_index = 0;
  Eigen::Index worst_rotation_index = 0;
  bool within_tolerance = false;
};

// Compares two (N,7) pose batches. Exceeding the tolerance is reported through
// `within_tolerance`, not as an error status.
BATCHKIN_CORE_API Status comparePoses(const BatchArray& a, const BatchArray& b,
                                      const PoseTolerance& tol, PoseComparison* out);

}  // namespace batchkin::core
