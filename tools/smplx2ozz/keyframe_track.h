// Keyframe track produced by the conversion, one record per output frame

#ifndef SMPLX_KEYFRAME_TRACK_H_
#define SMPLX_KEYFRAME_TRACK_H_

#include <string>
#include <vector>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

#include "conversion_error.h"
#include "pose_sample.h"
#include "skeleton_binding.h"

namespace smplx {

struct AnimationFrame {
    int frame_number = 0;   // Contiguous, starting at kFirstFrameNumber
    int source_index = 0;   // Pose sample this frame was built from
    float time = 0.0f;      // Seconds from the clip start

    // Root joint offset from its bind pose
    ozz::math::Float3 root_translation = ozz::math::Float3::zero();

    // One rotation per binding slot (body, left hand, right hand)
    std::vector<ozz::math::Quaternion> rotations;
};

// Column-oriented table: every frame holds the same joints, in the order of
// |joint_names|.
struct AnimationTrack {
    std::string name;
    int frame_rate = 0;
    float duration = 0.0f;
    std::vector<std::string> joint_names;
    std::vector<AnimationFrame> frames;

    int frame_count() const { return static_cast<int>(frames.size()); }

    // Column of a joint name (-1 if absent)
    int FindJoint(const std::string& name) const;

    // Per-joint rotation column across all frames, empty for an unknown
    // column
    std::vector<ozz::math::Quaternion> RotationColumn(int joint) const;
};

// Starts an empty track whose columns are the binding's joints.
void InitializeTrack(const SkeletonBinding& binding, const std::string& name,
                     int frame_rate, AnimationTrack* track);

// Appends one complete frame. |root_rotation| replaces sample.body[0], all
// other rotations are copied from |sample| unchanged. Fails without touching
// the track if the sample's joint counts do not cover the binding exactly or
// if |frame_number| does not follow the last frame.
bool EmitFrame(const SkeletonBinding& binding,
               int frame_number,
               int source_index,
               float time,
               const ozz::math::Float3& root_translation,
               const ozz::math::Quaternion& root_rotation,
               const PoseSample& sample,
               AnimationTrack* track,
               ConversionError* error);

}  // namespace smplx

#endif  // SMPLX_KEYFRAME_TRACK_H_
