// Pose sequence conversion pipeline

#include "pose_converter.h"

#include "ozz/base/log.h"

#include "coordinate_convert.h"
#include "root_motion.h"

namespace smplx {

bool ConvertPoseSequence(const PoseSequence& sequence,
                         const SkeletonBinding& binding,
                         const ConversionSettings& settings,
                         AnimationTrack* track,
                         ConversionError* error) {
    if (!binding.Validate(error)) {
        return false;
    }

    ResamplePlan plan;
    if (!PlanResampling(static_cast<int>(sequence.size()), settings.source_rate,
                        settings.target_rate, &plan, error)) {
        return false;
    }

    // Resolved once, before the per-frame loop
    const ozz::math::Float3 offset = ComputeOriginOffset(
        sequence[plan.source_indices.front()].translation, settings.center_on_origin);
    if (settings.center_on_origin) {
        ozz::log::LogV() << "Origin offset: (" << offset.x << ", " << offset.y << ", "
                         << offset.z << ")" << std::endl;
    }

    AnimationTrack result;
    InitializeTrack(binding, settings.name, plan.effective_rate, &result);
    result.frames.reserve(plan.frame_count());

    for (int i = 0; i < plan.frame_count(); ++i) {
        const int source_index = plan.source_indices[i];
        const PoseSample& sample = sequence[source_index];
        if (sample.body.empty()) {
            return Fail(error, ErrorKind::kShapeMismatch, "pose sample has no root rotation");
        }

        const ozz::math::Float3 root_translation = ResolveRootTranslation(
            sample.translation, offset, binding.bind_root_position());

        const ozz::math::Quaternion root_rotation =
            settings.correct_root_orientation
                ? coord_convert::CorrectRootOrientation(sample.body[0])
                : sample.body[0];

        if (!EmitFrame(binding, plan.frame_number(i), source_index, plan.frame_time(i),
                       root_translation, root_rotation, sample, &result, error)) {
            return false;
        }
    }

    result.duration = plan.duration();
    *track = result;
    return true;
}

bool ConvertPoseRecords(const std::vector<RawPoseRecord>& records,
                        const SkeletonBinding& binding,
                        const ConversionSettings& settings,
                        AnimationTrack* track,
                        ConversionError* error) {
    PoseSequence sequence;
    if (!AssemblePoseSequence(records, &sequence, error)) {
        return false;
    }
    return ConvertPoseSequence(sequence, binding, settings, track, error);
}

}  // namespace smplx
