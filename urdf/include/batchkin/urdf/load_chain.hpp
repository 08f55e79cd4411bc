#pragma once

#include <string>

#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"
#include "batchkin/core/model/chain_model.hpp"

namespace batchkin::urdf {

// URDF -> `core::KinematicChainModel` adapter.
//
// Scope/assumptions:
// - Loads a single serial chain from `base_link` to `tip_link`.
// - Supports revolute/continuous/prismatic/fixed joints along the chain; continuous
//   joints load as unlimited revolute joints.
// - Fixed joints are folded into the next joint's origin (or the ee offset) by default.
struct LoadOptions {
  std::string base_link;
  std::string tip_link;

  // Applied on top of tip_link: ee_offset = T_last_tip * tool_offset.
  batchkin::core::Transform tool_offset = batchkin::core::Transform::Identity();

  // If false, fixed joints are kept as JointType::Fixed entries. They never add columns
  // to the angle batch either way.
  bool collapse_fixed_joints = true;

  // If true, any unsupported joint type on the chain fails the load; otherwise it is
  // treated as fixed.
  bool strict = true;
};

struct LoadResult {
  batchkin::core::Status status{batchkin::core::Status::Failure};
  batchkin::core::KinematicChainModel model;
  std::string message;  // optional debug info for caller
};

LoadResult loadChainModelFromFile(const std::string& urdf_path, const LoadOptions& opt);

LoadResult loadChainModelFromString(const std::string& urdf_xml, const LoadOptions& opt);

}  // namespace batchkin::urdf
