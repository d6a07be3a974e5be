// Coordinate system conversion utilities
// SMPL-X parameters are expressed in the body model's axis convention, the
// target skeleton template expects its own. These helpers hold the fixed
// corrections applied while converting.

#ifndef SMPLX_COORDINATE_CONVERT_H_
#define SMPLX_COORDINATE_CONVERT_H_

#include <cmath>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

namespace coord_convert {

constexpr float kPi = 3.14159265358979323846f;

// Hand pose vectors are multiplied as row vectors by diag(1, 1, -1) before
// conversion. Both hands use the same matrix.
inline ozz::math::Float3 MirrorHandAxisAngle(float x, float y, float z) {
    return ozz::math::Float3(x, y, -z);
}

inline ozz::math::Float3 MirrorHandAxisAngle(const ozz::math::Float3& v) {
    return MirrorHandAxisAngle(v.x, v.y, v.z);
}

// Quaternion multiplication: a * b
inline ozz::math::Quaternion QuatMul(const ozz::math::Quaternion& a,
                                     const ozz::math::Quaternion& b) {
    return ozz::math::Quaternion(
        a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
        a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
        a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w,
        a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z);
}

// Quaternion inverse (conjugate for unit quaternions)
inline ozz::math::Quaternion QuatConjugate(const ozz::math::Quaternion& q) {
    return ozz::math::Quaternion(-q.x, -q.y, -q.z, q.w);
}

inline float QuatLength(const ozz::math::Quaternion& q) {
    return std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z + q.w * q.w);
}

inline ozz::math::Quaternion NormalizeQuaternion(const ozz::math::Quaternion& q) {
    const float len_sq = q.x * q.x + q.y * q.y + q.z * q.z + q.w * q.w;
    if (len_sq < 1e-10f) {
        return ozz::math::Quaternion::identity();
    }
    const float inv_len = 1.0f / std::sqrt(len_sq);
    return ozz::math::Quaternion(
        q.x * inv_len,
        q.y * inv_len,
        q.z * inv_len,
        q.w * inv_len
    );
}

// Rotation of _angle radians around the unit axis (_x, _y, _z)
inline ozz::math::Quaternion QuatFromAxisAngle(float _x, float _y, float _z, float _angle) {
    const float half_angle = _angle * 0.5f;
    const float s = std::sin(half_angle);
    return ozz::math::Quaternion(_x * s, _y * s, _z * s, std::cos(half_angle));
}

// The body model's root faces the opposite way around the X axis compared to
// the skeleton template. -180 degrees about +X, the same rotation as +180.
inline ozz::math::Quaternion RootOrientationCorrection() {
    return QuatFromAxisAngle(1.0f, 0.0f, 0.0f, -kPi);
}

// root_corrected = correction * root_raw
inline ozz::math::Quaternion CorrectRootOrientation(const ozz::math::Quaternion& root_raw) {
    return QuatMul(RootOrientationCorrection(), root_raw);
}

}  // namespace coord_convert

#endif  // SMPLX_COORDINATE_CONVERT_H_
