#pragma once

namespace batchkin::core {

struct Thresholds {
  double axis_norm_eps = 1.0e-12;    // smallest accepted joint axis norm
  double unit_norm_tol = 1.0e-5;     // |q| == 1 tolerance for emitted quaternions
  double orthonormal_tol = 1.0e-5;   // R^T R == I tolerance for origin rotations

  // acos'(x) is unbounded at |x| == 1; inside this band the gradient is zero.
  double acos_grad_eps = 1.0e-12;
};

inline constexpr Thresholds kDefaultThresholds{};

}  // namespace batchkin::core
