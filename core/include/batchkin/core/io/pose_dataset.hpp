#pragma once
#include "batchkin/core/export.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"

#include <string>

namespace batchkin::core {

// Ground-truth FK samples: joint_angles (N, ndof) and the matching poses (N, 7).
struct PoseDataset {
  BatchArray joint_angles;
  BatchArray poses;
};

// CSV with header `q0,...,q{ndof-1},x,y,z,qw,qx,qy,qz` and one row per sample.
BATCHKIN_CORE_API Status writePoseDatasetCsv(const PoseDataset& dataset,
                                             const std::string& csv_path);

// Reads a file written by writePoseDatasetCsv. ndof is taken from the header.
BATCHKIN_CORE_API Status readPoseDatasetCsv(const std::string& csv_path,
                                            PoseDataset* dataset);

}  // namespace batchkin::core
