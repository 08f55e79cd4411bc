// Pose comparison used to validate FK output.
// - Position distance is Euclidean norm in meters.
// - Rotation distance is the geodesic angle from the quaternion path, in radians.
#include "batchkin/core/math/distance.hpp"

#include "batchkin/core/common/logger.hpp"
#include "batchkin/core/math/batch.hpp"
#include "batchkin/core/math/rotation.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace batchkin::core {

double positionDistance(const Transform& T1, const Transform& T2) {
  return (T1.translation() - T2.translation()).norm();
}

double rotationDistance(const Transform& T1, const Transform& T2) {
  const Mat3 R_rel = T1.linear().transpose() * T2.linear();
  const double c = std::max(-1.0, std::min(1.0, (R_rel.trace() - 1.0) * 0.5));
  return std::acos(c);
}

Status positionDistance(const BatchArray& a, const BatchArray& b, ScalarBatch* distance) {
  if (!distance) return logFailure(Status::InvalidParameter, "positionDistance", "null output");
  const Status st = checkBatchPair("positionDistance", a, kPoseWidth, b, kPoseWidth);
  if (!ok(st)) return st;

  *distance = (a.leftCols<3>() - b.leftCols<3>()).rowwise().norm();
  return Status::Success;
}

Status rotationDistance(const BatchArray& a, const BatchArray& b, ScalarBatch* distance) {
  if (!distance) return logFailure(Status::InvalidParameter, "rotationDistance", "null output");
  const Status st = checkBatchPair("rotationDistance", a, kPoseWidth, b, kPoseWidth);
  if (!ok(st)) return st;

  return geodesicDistanceBetweenQuaternions(a.rightCols<4>(), b.rightCols<4>(), distance);
}

Status comparePoses(const BatchArray& a, const BatchArray& b,
                    const PoseTolerance& tol, PoseComparison* out) {
  if (!out) return logFailure(Status::InvalidParameter, "comparePoses", "null output");

  ScalarBatch dp, dr;
  Status st = positionDistance(a, b, &dp);
  if (!ok(st)) return st;
  st = rotationDistance(a, b, &dr);
  if (!ok(st)) return st;

  PoseComparison res;
  res.max_position_error = dp.maxCoeff(&res.worst_position_index);
  res.max_rotation_error = dr.maxCoeff(&res.worst_rotation_index);
  res.mean_position_error = dp.mean();
  res.mean_rotation_error = dr.mean();
  res.within_tolerance = res.max_position_error <= tol.position &&
                         res.max_rotation_error <= tol.rotation;

  if (!res.within_tolerance && shouldLog(LogLevel::Info)) {
    std::ostringstream oss;
    oss << "comparePoses: max position error " << res.max_position_error
        << " (sample " << res.worst_position_index << "), max rotation error "
        << res.max_rotation_error << " (sample " << res.worst_rotation_index << ")";
    log(LogLevel::Info, oss.str());
  }
  *out = res;
  return Status::Success;
}

}  // namespace batchkin::core
