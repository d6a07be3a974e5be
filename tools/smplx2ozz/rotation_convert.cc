// Rodrigues conversion implementation

#include "rotation_convert.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "coordinate_convert.h"

namespace smplx {

RotationMatrix RodriguesMatrix(double x, double y, double z) {
    RotationMatrix r;
    const double theta = std::sqrt(x * x + y * y + z * z);
    if (theta < kIdentityAngleEpsilon) {
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                r.m[i][j] = (i == j) ? 1.0 : 0.0;
            }
        }
        return r;
    }

    const double axis[3] = {x / theta, y / theta, z / theta};
    const double cost = std::cos(theta);
    const double sint = std::sin(theta);

    // Skew-symmetric cross-product matrix of the axis
    const double k[3][3] = {
        {0.0, -axis[2], axis[1]},
        {axis[2], 0.0, -axis[0]},
        {-axis[1], axis[0], 0.0}};

    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            r.m[i][j] = (1.0 - cost) * axis[i] * axis[j] + sint * k[i][j];
        }
        r.m[i][i] += cost;
    }
    return r;
}

ozz::math::Quaternion MatrixToQuaternion(const RotationMatrix& matrix) {
    const auto& m = matrix.m;
    const double trace = m[0][0] + m[1][1] + m[2][2];
    double qw, qx, qy, qz;

    if (trace > 0.0) {
        double s = 0.5 / std::sqrt(trace + 1.0);
        qw = 0.25 / s;
        qx = (m[2][1] - m[1][2]) * s;
        qy = (m[0][2] - m[2][0]) * s;
        qz = (m[1][0] - m[0][1]) * s;
    } else if (m[0][0] > m[1][1] && m[0][0] > m[2][2]) {
        double s = 2.0 * std::sqrt(1.0 + m[0][0] - m[1][1] - m[2][2]);
        qw = (m[2][1] - m[1][2]) / s;
        qx = 0.25 * s;
        qy = (m[0][1] + m[1][0]) / s;
        qz = (m[0][2] + m[2][0]) / s;
    } else if (m[1][1] > m[2][2]) {
        double s = 2.0 * std::sqrt(1.0 + m[1][1] - m[0][0] - m[2][2]);
        qw = (m[0][2] - m[2][0]) / s;
        qx = (m[0][1] + m[1][0]) / s;
        qy = 0.25 * s;
        qz = (m[1][2] + m[2][1]) / s;
    } else {
        double s = 2.0 * std::sqrt(1.0 + m[2][2] - m[0][0] - m[1][1]);
        qw = (m[1][0] - m[0][1]) / s;
        qx = (m[0][2] + m[2][0]) / s;
        qy = (m[1][2] + m[2][1]) / s;
        qz = 0.25 * s;
    }

    // Keep w non-negative so that equal rotations compare equal component-wise
    if (qw < 0.0) {
        qw = -qw;
        qx = -qx;
        qy = -qy;
        qz = -qz;
    }

    return coord_convert::NormalizeQuaternion(ozz::math::Quaternion(
        static_cast<float>(qx), static_cast<float>(qy),
        static_cast<float>(qz), static_cast<float>(qw)));
}

bool AxisAngleToQuaternion(const ozz::math::Float3& rotvec,
                           ozz::math::Quaternion* quaternion,
                           ConversionError* error) {
    if (!std::isfinite(rotvec.x) || !std::isfinite(rotvec.y) || !std::isfinite(rotvec.z)) {
        std::ostringstream msg;
        msg << "rotation vector (" << rotvec.x << ", " << rotvec.y << ", " << rotvec.z
            << ") has a non-finite component";
        return Fail(error, ErrorKind::kNumeric, msg.str());
    }

    const double x = rotvec.x;
    const double y = rotvec.y;
    const double z = rotvec.z;
    if (std::sqrt(x * x + y * y + z * z) < kIdentityAngleEpsilon) {
        *quaternion = ozz::math::Quaternion::identity();
        return true;
    }

    *quaternion = MatrixToQuaternion(RodriguesMatrix(x, y, z));
    return true;
}

bool AxisAngleToQuaternions(const std::vector<ozz::math::Float3>& rotvecs,
                            std::vector<ozz::math::Quaternion>* quaternions,
                            ConversionError* error) {
    std::vector<ozz::math::Quaternion> result(rotvecs.size());
    for (size_t i = 0; i < rotvecs.size(); ++i) {
        ConversionError item_error;
        if (!AxisAngleToQuaternion(rotvecs[i], &result[i], &item_error)) {
            std::ostringstream msg;
            msg << "vector " << i << ": " << item_error.message;
            return Fail(error, item_error.kind, msg.str());
        }
    }
    quaternions->swap(result);
    return true;
}

ozz::math::Float3 QuaternionToAxisAngle(const ozz::math::Quaternion& quaternion) {
    ozz::math::Quaternion q = coord_convert::NormalizeQuaternion(quaternion);
    if (q.w < 0.0f) {
        q = ozz::math::Quaternion(-q.x, -q.y, -q.z, -q.w);
    }

    const float sin_half = std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z);
    if (sin_half < 1e-7f) {
        return ozz::math::Float3::zero();
    }

    const float angle = 2.0f * std::atan2(sin_half, q.w);
    const float scale = angle / sin_half;
    return ozz::math::Float3(q.x * scale, q.y * scale, q.z * scale);
}

}  // namespace smplx
