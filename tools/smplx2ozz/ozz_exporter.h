// Keyframe track export to ozz-animation

#ifndef SMPLX_OZZ_EXPORTER_H_
#define SMPLX_OZZ_EXPORTER_H_

#include <string>
#include <vector>

#include "ozz/animation/offline/raw_animation.h"
#include "ozz/animation/runtime/skeleton.h"
#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

#include "conversion_error.h"
#include "keyframe_track.h"
#include "soa_utils.h"

namespace smplx {

// Maps track columns onto the joints of the target skeleton. Keyed
// rotations are relative to the joint's rest rotation, the root translation
// is an offset from the root's rest translation. Unbound joints stay at
// rest.
class ExportMapping {
public:
    ExportMapping() : m_root_joint(-1) {}

    // |slot_to_joint| comes from SkeletonBinding::ResolveJointIndices, in the
    // track's column order.
    bool Init(const AnimationTrack& track,
              const ozz::animation::Skeleton& skeleton,
              const std::vector<int>& slot_to_joint,
              ConversionError* error);

    int num_joints() const { return static_cast<int>(m_rest.size()); }
    int root_joint() const { return m_root_joint; }

    // Track column of a skeleton joint (-1 if unbound or out of range)
    int JointColumn(int joint) const {
        if (joint < 0 || joint >= static_cast<int>(m_joint_to_column.size())) {
            return -1;
        }
        return m_joint_to_column[joint];
    }

    const soa_utils::RestTransform& Rest(int joint) const { return m_rest[joint]; }

    // Local rotation of |joint| at |frame|: rest * keyed
    ozz::math::Quaternion JointRotation(const AnimationFrame& frame, int joint) const;

    // Local translation of |joint| at |frame|: rest, plus the root offset
    // for the root joint
    ozz::math::Float3 JointTranslation(const AnimationFrame& frame, int joint) const;

private:
    std::vector<soa_utils::RestTransform> m_rest;
    std::vector<int> m_joint_to_column;
    int m_root_joint;
};

// One raw track per skeleton joint. Bound joints get a key per frame, a
// single frame clip gets a second key at the end so that it spans the whole
// duration.
bool BuildRawAnimation(const AnimationTrack& track,
                       const ozz::animation::Skeleton& skeleton,
                       const std::vector<int>& slot_to_joint,
                       ozz::animation::offline::RawAnimation* raw_animation,
                       ConversionError* error);

// Creates the missing parent directories of |output_path|.
bool CreateOutputDirectory(const std::string& output_path, ConversionError* error);

// Builds the runtime animation and writes it as an ozz archive.
bool ExportOzzAnimation(const AnimationTrack& track,
                        const ozz::animation::Skeleton& skeleton,
                        const std::vector<int>& slot_to_joint,
                        const std::string& output_path,
                        ConversionError* error);

}  // namespace smplx

#endif  // SMPLX_OZZ_EXPORTER_H_
