// Pose sequence to keyframe track conversion

#ifndef SMPLX_POSE_CONVERTER_H_
#define SMPLX_POSE_CONVERTER_H_

#include <string>
#include <vector>

#include "conversion_error.h"
#include "frame_resampler.h"
#include "keyframe_track.h"
#include "pose_sample.h"
#include "skeleton_binding.h"

namespace smplx {

struct ConversionSettings {
    int source_rate = 30;
    int target_rate = 30;
    bool center_on_origin = true;

    // Pre-multiplies the root rotation by the 180 degree X correction.
    // Only disabled to inspect raw rotations.
    bool correct_root_orientation = true;

    std::string name = "smplx";
};

// Runs resampling, root motion, orientation correction and keyframe emission
// over an assembled sequence. On failure |track| is left untouched.
bool ConvertPoseSequence(const PoseSequence& sequence,
                         const SkeletonBinding& binding,
                         const ConversionSettings& settings,
                         AnimationTrack* track,
                         ConversionError* error);

// AssemblePoseSequence followed by ConvertPoseSequence.
bool ConvertPoseRecords(const std::vector<RawPoseRecord>& records,
                        const SkeletonBinding& binding,
                        const ConversionSettings& settings,
                        AnimationTrack* track,
                        ConversionError* error);

}  // namespace smplx

#endif  // SMPLX_POSE_CONVERTER_H_
