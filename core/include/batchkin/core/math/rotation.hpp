#pragma once
#include "batchkin/core/export.hpp"
#include "batchkin/core/common/status.hpp"
#include "batchkin/core/math/types.hpp"

namespace batchkin::core {

// Batched rotation algebra.
//
// Every function takes batches with an explicit leading dimension (see types.hpp for the
// flattened layouts) and works on all rows at once. Inputs are validated first:
//   empty batch or differing batch sizes -> Status::Precondition
//   wrong trailing width                  -> Status::ShapeMismatch
//   NaN/Inf entries                       -> Status::NonFinite
// Outputs are only written on success.

// (N,4) -> (N,9). Closed form; the input is not renormalized, so a non-unit quaternion
// gives a matrix that is only approximately orthonormal. (1,0,0,0) maps to I exactly.
BATCHKIN_CORE_API Status quaternionToRotationMatrix(const BatchArray& q, BatchArray* R);

// (N,9) -> (N,4). Shepperd's method: the branch is picked per sample from the largest of
// trace, r00, r11, r22. Output is normalized with w >= 0.
BATCHKIN_CORE_API Status rotationMatrixToQuaternion(const BatchArray& R, BatchArray* q);

// (N,9), (N,3) -> (N,16) with bottom row (0,0,0,1).
BATCHKIN_CORE_API Status rotationMatrixToHomogeneousTransform(const BatchArray& R,
                                                              const BatchArray& t,
                                                              BatchArray* T);

// (N,4), (N,3) -> (N,16).
BATCHKIN_CORE_API Status quaternionAndTranslationToHomogeneousTransform(const BatchArray& q,
                                                                        const BatchArray& t,
                                                                        BatchArray* T);

// (N,16) -> (N,7) [x y z qw qx qy qz].
BATCHKIN_CORE_API Status homogeneousTransformToPose(const BatchArray& T, BatchArray* pose);

BATCHKIN_CORE_API Status quaternionConjugate(const BatchArray& q, BatchArray* q_conj);

// q* / |q|^2. A zero quaternion has no inverse and yields Status::NonFinite.
BATCHKIN_CORE_API Status quaternionInverse(const BatchArray& q, BatchArray* q_inv);

BATCHKIN_CORE_API Status quaternionNorm(const BatchArray& q, ScalarBatch* norms);

// Hamilton product q1 ⊗ q2 (applies q2, then q1).
BATCHKIN_CORE_API Status quaternionMultiply(const BatchArray& q1, const BatchArray& q2,
                                            BatchArray* product);

// Angle in [0, pi] between orientations: 2 acos(clamp(|<q1,q2>|, -1, 1)) with both
// quaternions normalized first. Taking |.| selects the shorter of the two double-cover
// paths. Zero-norm quaternions yield Status::NonFinite.
BATCHKIN_CORE_API Status geodesicDistanceBetweenQuaternions(const BatchArray& q1,
                                                            const BatchArray& q2,
                                                            ScalarBatch* distance);

// acos(clamp((trace(R1^T R2) - 1) / 2, -1, 1)).
//
// Near pi this path loses precision when the matrices were built from single-precision
// quaternions (about 5e-4 rad at the antipode); callers comparing against the quaternion
// path should allow 1e-3.
BATCHKIN_CORE_API Status geodesicDistanceBetweenRotationMatrices(const BatchArray& R1,
                                                                 const BatchArray& R2,
                                                                 ScalarBatch* distance);

// ---- Gradients (vector-Jacobian products) ----
//
// Each takes the upstream gradient of a scalar loss with respect to the forward output
// and returns the gradient with respect to the forward inputs. Where acos' is unbounded
// (argument within Thresholds::acos_grad_eps of +-1) the gradient is defined as zero.

BATCHKIN_CORE_API Status quaternionToRotationMatrixBackward(const BatchArray& q,
                                                            const BatchArray& grad_R,
                                                            BatchArray* grad_q);

BATCHKIN_CORE_API Status geodesicDistanceBetweenQuaternionsBackward(const BatchArray& q1,
                                                                    const BatchArray& q2,
                                                                    const ScalarBatch& grad_distance,
                                                                    BatchArray* grad_q1,
                                                                    BatchArray* grad_q2);

BATCHKIN_CORE_API Status geodesicDistanceBetweenRotationMatricesBackward(
    const BatchArray& R1,
    const BatchArray& R2,
    const ScalarBatch& grad_distance,
    BatchArray* grad_R1,
    BatchArray* grad_R2);

}  // namespace batchkin::core
