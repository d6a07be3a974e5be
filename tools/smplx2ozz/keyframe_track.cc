// Keyframe emission

#include "keyframe_track.h"

#include <sstream>

#include "frame_resampler.h"

namespace smplx {

int AnimationTrack::FindJoint(const std::string& joint_name) const {
    for (size_t i = 0; i < joint_names.size(); ++i) {
        if (joint_names[i] == joint_name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<ozz::math::Quaternion> AnimationTrack::RotationColumn(int joint) const {
    std::vector<ozz::math::Quaternion> column;
    if (joint < 0 || joint >= static_cast<int>(joint_names.size())) {
        return column;
    }
    column.reserve(frames.size());
    for (const auto& frame : frames) {
        column.push_back(frame.rotations[joint]);
    }
    return column;
}

void InitializeTrack(const SkeletonBinding& binding, const std::string& name,
                     int frame_rate, AnimationTrack* track) {
    track->name = name;
    track->frame_rate = frame_rate;
    track->duration = 0.0f;
    track->joint_names = binding.JointNames();
    track->frames.clear();
}

bool EmitFrame(const SkeletonBinding& binding,
               int frame_number,
               int source_index,
               float time,
               const ozz::math::Float3& root_translation,
               const ozz::math::Quaternion& root_rotation,
               const PoseSample& sample,
               AnimationTrack* track,
               ConversionError* error) {
    // Partial frames are rejected
    if (sample.body.size() != binding.body_joints().size() ||
        sample.left_hand.size() != binding.left_hand_joints().size() ||
        sample.right_hand.size() != binding.right_hand_joints().size()) {
        std::ostringstream msg;
        msg << "frame " << frame_number << ": sample has " << sample.body.size() << "/"
            << sample.left_hand.size() << "/" << sample.right_hand.size()
            << " body/left/right rotations, binding expects "
            << binding.body_joints().size() << "/" << binding.left_hand_joints().size()
            << "/" << binding.right_hand_joints().size();
        return Fail(error, ErrorKind::kShapeMismatch, msg.str());
    }
    if (static_cast<int>(track->joint_names.size()) != binding.num_slots()) {
        return Fail(error, ErrorKind::kShapeMismatch,
                    "track columns do not match the skeleton binding");
    }

    const int expected_number =
        track->frames.empty() ? kFirstFrameNumber : track->frames.back().frame_number + 1;
    if (frame_number != expected_number) {
        std::ostringstream msg;
        msg << "frame " << frame_number << " emitted out of order, expected " << expected_number;
        return Fail(error, ErrorKind::kShapeMismatch, msg.str());
    }

    AnimationFrame frame;
    frame.frame_number = frame_number;
    frame.source_index = source_index;
    frame.time = time;
    frame.root_translation = root_translation;

    frame.rotations.reserve(binding.num_slots());
    frame.rotations.push_back(root_rotation);
    frame.rotations.insert(frame.rotations.end(), sample.body.begin() + 1, sample.body.end());
    frame.rotations.insert(frame.rotations.end(), sample.left_hand.begin(), sample.left_hand.end());
    frame.rotations.insert(frame.rotations.end(), sample.right_hand.begin(), sample.right_hand.end());

    track->frames.push_back(frame);
    return true;
}

}  // namespace smplx
