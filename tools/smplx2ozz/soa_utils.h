// SoA (Structure of Arrays) helpers for reading single joints out of a
// skeleton's SIMD-packed rest poses.

#ifndef SMPLX_SOA_UTILS_H_
#define SMPLX_SOA_UTILS_H_

#include <vector>

#include "ozz/animation/runtime/skeleton.h"
#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/simd_math.h"
#include "ozz/base/maths/soa_transform.h"
#include "ozz/base/maths/vec_float.h"

namespace soa_utils {

// Rest transform of one joint, in its parent's space
struct RestTransform {
    ozz::math::Float3 translation;
    ozz::math::Quaternion rotation;
    ozz::math::Float3 scale;
};

// Single lane of a SoA float
inline float GetLane(const ozz::math::SimdFloat4& soa, int lane) {
    float values[4];
    ozz::math::StorePtrU(soa, values);
    return values[lane];
}

// SoaTransform packs 4 joints, |joint_index| / 4 selects the pack and
// |joint_index| % 4 the lane.
inline RestTransform ExtractRestTransform(const ozz::animation::Skeleton& skeleton,
                                          int joint_index) {
    const ozz::math::SoaTransform& soa = skeleton.joint_rest_poses()[joint_index / 4];
    const int lane = joint_index % 4;

    RestTransform t;
    t.translation = ozz::math::Float3(GetLane(soa.translation.x, lane),
                                      GetLane(soa.translation.y, lane),
                                      GetLane(soa.translation.z, lane));
    t.rotation = ozz::math::Quaternion(GetLane(soa.rotation.x, lane),
                                       GetLane(soa.rotation.y, lane),
                                       GetLane(soa.rotation.z, lane),
                                       GetLane(soa.rotation.w, lane));
    t.scale = ozz::math::Float3(GetLane(soa.scale.x, lane),
                                GetLane(soa.scale.y, lane),
                                GetLane(soa.scale.z, lane));
    return t;
}

inline std::vector<RestTransform> ExtractRestTransforms(const ozz::animation::Skeleton& skeleton) {
    std::vector<RestTransform> transforms;
    transforms.reserve(skeleton.num_joints());
    for (int i = 0; i < skeleton.num_joints(); ++i) {
        transforms.push_back(ExtractRestTransform(skeleton, i));
    }
    return transforms;
}

}  // namespace soa_utils

#endif  // SMPLX_SOA_UTILS_H_
