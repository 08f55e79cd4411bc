#include "batchkin/urdf/load_chain.hpp"

#include "batchkin/core/common/logger.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>
#include <Eigen/Geometry>

#include <urdf_model/model.h>
#include <urdf_parser/urdf_parser.h>

namespace batchkin::urdf {
using namespace batchkin::core;

static Transform poseToEigen(const ::urdf::Pose& p) {
  Transform T = Transform::Identity();
  T.translation() = Vec3(p.position.x, p.position.y, p.position.z);

  // urdf::Rotation is a unit quaternion (x, y, z, w).
  Quat q(p.rotation.w, p.rotation.x, p.rotation.y, p.rotation.z);
  q.normalize();
  T.linear() = q.toRotationMatrix();
  return T;
}

static Status readFileToString(const std::string& path, std::string* out) {
  if (!out) return Status::InvalidParameter;
  std::ifstream ifs(path);
  if (!ifs) return Status::Failure;
  std::ostringstream oss;
  oss << ifs.rdbuf();
  *out = oss.str();
  return Status::Success;
}

static LoadResult fail(Status st, std::string msg) {
  LoadResult r;
  r.status = st;
  r.message = std::move(msg);
  log(LogLevel::Error, "urdf: " + r.message);
  return r;
}

static bool supportedJointType(int t) {
  return t == ::urdf::Joint::REVOLUTE ||
         t == ::urdf::Joint::CONTINUOUS ||
         t == ::urdf::Joint::PRISMATIC ||
         t == ::urdf::Joint::FIXED;
}

LoadResult loadChainModelFromString(const std::string& urdf_xml, const LoadOptions& opt) {
  if (opt.base_link.empty() || opt.tip_link.empty()) {
    return fail(Status::InvalidParameter, "base_link / tip_link must be provided");
  }
  if (opt.base_link == opt.tip_link) {
    return fail(Status::Construction, "base_link == tip_link: empty chain");
  }

  ::urdf::ModelInterfaceSharedPtr model = ::urdf::parseURDF(urdf_xml);
  if (!model) {
    return fail(Status::Failure, "urdf::parseURDF failed");
  }

  ::urdf::LinkConstSharedPtr tip = model->getLink(opt.tip_link);
  if (!tip) {
    return fail(Status::Construction, "tip_link not found: " + opt.tip_link);
  }
  if (!model->getLink(opt.base_link)) {
    return fail(Status::Construction, "base_link not found: " + opt.base_link);
  }

  // Walk from tip -> base using parent joints.
  std::vector<::urdf::JointConstSharedPtr> joints_tip_to_base;
  ::urdf::LinkConstSharedPtr cur = tip;

  while (cur && cur->name != opt.base_link) {
    ::urdf::JointConstSharedPtr pj = cur->parent_joint;
    if (!pj) {
      return fail(Status::Construction,
                  "chain is disconnected: " + cur->name + " has no parent joint before " +
                  opt.base_link);
    }
    joints_tip_to_base.push_back(pj);

    ::urdf::LinkConstSharedPtr pl = model->getLink(pj->parent_link_name);
    if (!pl) {
      return fail(Status::Construction, "parent link not found: " + pj->parent_link_name);
    }
    cur = pl;
  }

  std::reverse(joints_tip_to_base.begin(), joints_tip_to_base.end());

  ChainBuilder builder;
  Transform pending = Transform::Identity();  // fixed transforms not yet attached to a joint

  for (const auto& j : joints_tip_to_base) {
    const Transform origin = pending * poseToEigen(j->parent_to_joint_origin_transform);

    bool treat_as_fixed = j->type == ::urdf::Joint::FIXED;
    if (!supportedJointType(j->type)) {
      if (opt.strict) {
        return fail(Status::Construction, "unsupported joint type in chain: " + j->name);
      }
      log(LogLevel::Warn, "urdf: treating unsupported joint as fixed: " + j->name);
      treat_as_fixed = true;
    }

    if (treat_as_fixed) {
      if (opt.collapse_fixed_joints) {
        pending = origin;
      } else {
        builder.add_fixed(j->name, origin);
        pending = Transform::Identity();
      }
      continue;
    }

    const Vec3 axis(j->axis.x, j->axis.y, j->axis.z);
    JointLimit limit;
    if (j->limits && j->type != ::urdf::Joint::CONTINUOUS) {
      limit.enabled = true;
      limit.lower = j->limits->lower;
      limit.upper = j->limits->upper;
    }

    if (j->type == ::urdf::Joint::PRISMATIC) {
      builder.add_prismatic(j->name, origin, axis, limit);
    } else {
      builder.add_revolute(j->name, origin, axis, limit);
    }
    pending = Transform::Identity();
  }

  builder.set_ee_offset(pending * opt.tool_offset);

  LoadResult res;
  const Status st = builder.build(&res.model);
  if (!ok(st)) {
    return fail(st, "KinematicChainModel build failed");
  }
  if (res.model.ndof() == 0) {
    return fail(Status::Construction, "no movable joints found in chain");
  }
  res.status = Status::Success;
  res.message = "OK";
  return res;
}

LoadResult loadChainModelFromFile(const std::string& urdf_path, const LoadOptions& opt) {
  std::string xml;
  const Status st = readFileToString(urdf_path, &xml);
  if (!ok(st)) {
    return fail(st, "failed to open URDF file: " + urdf_path);
  }
  return loadChainModelFromString(xml, opt);
}

}  // namespace batchkin::urdf
