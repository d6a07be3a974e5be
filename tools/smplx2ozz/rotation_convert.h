// Axis-angle (Rodrigues vector) to quaternion conversion

#ifndef SMPLX_ROTATION_CONVERT_H_
#define SMPLX_ROTATION_CONVERT_H_

#include <vector>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

#include "conversion_error.h"

namespace smplx {

// Angles below this are treated as no rotation at all. The axis r / |r| is
// undefined there, so the identity is returned instead of evaluating the
// Rodrigues formula.
constexpr double kIdentityAngleEpsilon = 1e-12;

// 3x3 rotation matrix, row-major: m[row][col]
struct RotationMatrix {
    double m[3][3];
};

// R = cos(t) I + (1 - cos(t)) r r^T + sin(t) [r]x  with r the unit axis.
// Returns the identity matrix for angles below kIdentityAngleEpsilon.
RotationMatrix RodriguesMatrix(double x, double y, double z);

// Trace-based matrix to quaternion conversion. Picks the largest diagonal
// term when the trace is not positive to keep the divisor away from zero.
ozz::math::Quaternion MatrixToQuaternion(const RotationMatrix& matrix);

// Converts one rotation vector. Fails with kNumeric on non-finite input.
bool AxisAngleToQuaternion(const ozz::math::Float3& rotvec,
                           ozz::math::Quaternion* quaternion,
                           ConversionError* error);

// Converts each vector independently, preserving order. On failure the
// message names the offending vector index and |quaternions| is left
// untouched.
bool AxisAngleToQuaternions(const std::vector<ozz::math::Float3>& rotvecs,
                            std::vector<ozz::math::Quaternion>* quaternions,
                            ConversionError* error);

// Inverse conversion, used to inspect results. The returned vector has its
// angle in [0, pi].
ozz::math::Float3 QuaternionToAxisAngle(const ozz::math::Quaternion& quaternion);

}  // namespace smplx

#endif  // SMPLX_ROTATION_CONVERT_H_
