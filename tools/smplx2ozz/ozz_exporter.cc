// ozz-animation export implementation

#include "ozz_exporter.h"

#include <filesystem>
#include <sstream>
#include <system_error>

#include "ozz/animation/offline/animation_builder.h"
#include "ozz/animation/runtime/animation.h"
#include "ozz/base/io/archive.h"
#include "ozz/base/io/stream.h"
#include "ozz/base/log.h"

#include "coordinate_convert.h"

namespace smplx {

bool ExportMapping::Init(const AnimationTrack& track,
                         const ozz::animation::Skeleton& skeleton,
                         const std::vector<int>& slot_to_joint,
                         ConversionError* error) {
    if (track.frames.empty()) {
        return Fail(error, ErrorKind::kShapeMismatch, "animation track has no frames");
    }
    if (slot_to_joint.size() != track.joint_names.size()) {
        std::ostringstream msg;
        msg << "track has " << track.joint_names.size() << " joints, binding resolved "
            << slot_to_joint.size();
        return Fail(error, ErrorKind::kShapeMismatch, msg.str());
    }

    const int num_joints = skeleton.num_joints();
    std::vector<int> joint_to_column(num_joints, -1);
    for (size_t column = 0; column < slot_to_joint.size(); ++column) {
        const int joint = slot_to_joint[column];
        if (joint < 0 || joint >= num_joints) {
            return Fail(error, ErrorKind::kUnknownJoint,
                        "joint '" + track.joint_names[column] + "' not found in target skeleton");
        }
        joint_to_column[joint] = static_cast<int>(column);
    }

    for (const auto& frame : track.frames) {
        if (frame.rotations.size() != track.joint_names.size()) {
            std::ostringstream msg;
            msg << "frame " << frame.frame_number << " has " << frame.rotations.size()
                << " rotations, expected " << track.joint_names.size();
            return Fail(error, ErrorKind::kShapeMismatch, msg.str());
        }
    }

    m_rest = soa_utils::ExtractRestTransforms(skeleton);
    m_joint_to_column.swap(joint_to_column);
    m_root_joint = slot_to_joint[0];
    return true;
}

ozz::math::Quaternion ExportMapping::JointRotation(const AnimationFrame& frame, int joint) const {
    const int column = m_joint_to_column[joint];
    if (column < 0) {
        return m_rest[joint].rotation;
    }
    return coord_convert::NormalizeQuaternion(
        coord_convert::QuatMul(m_rest[joint].rotation, frame.rotations[column]));
}

ozz::math::Float3 ExportMapping::JointTranslation(const AnimationFrame& frame, int joint) const {
    if (joint == m_root_joint) {
        return m_rest[joint].translation + frame.root_translation;
    }
    return m_rest[joint].translation;
}

bool BuildRawAnimation(const AnimationTrack& track,
                       const ozz::animation::Skeleton& skeleton,
                       const std::vector<int>& slot_to_joint,
                       ozz::animation::offline::RawAnimation* raw_animation,
                       ConversionError* error) {
    using ozz::animation::offline::RawAnimation;

    ExportMapping mapping;
    if (!mapping.Init(track, skeleton, slot_to_joint, error)) {
        return false;
    }

    RawAnimation raw;
    raw.name = track.name.c_str();
    raw.duration = track.duration;
    raw.tracks.resize(mapping.num_joints());

    const bool pad_end = track.frames.size() == 1;

    for (int joint = 0; joint < mapping.num_joints(); ++joint) {
        RawAnimation::JointTrack& joint_track = raw.tracks[joint];
        const soa_utils::RestTransform& rest = mapping.Rest(joint);

        RawAnimation::ScaleKey s_key;
        s_key.time = 0.0f;
        s_key.value = rest.scale;
        joint_track.scales.push_back(s_key);

        if (mapping.JointColumn(joint) < 0) {
            // Unbound joint, held at rest
            RawAnimation::TranslationKey t_key;
            t_key.time = 0.0f;
            t_key.value = rest.translation;
            joint_track.translations.push_back(t_key);

            RawAnimation::RotationKey r_key;
            r_key.time = 0.0f;
            r_key.value = rest.rotation;
            joint_track.rotations.push_back(r_key);
            continue;
        }

        for (const auto& frame : track.frames) {
            RawAnimation::RotationKey r_key;
            r_key.time = frame.time;
            r_key.value = mapping.JointRotation(frame, joint);
            joint_track.rotations.push_back(r_key);
        }

        if (joint == mapping.root_joint()) {
            for (const auto& frame : track.frames) {
                RawAnimation::TranslationKey t_key;
                t_key.time = frame.time;
                t_key.value = mapping.JointTranslation(frame, joint);
                joint_track.translations.push_back(t_key);
            }
        } else {
            RawAnimation::TranslationKey t_key;
            t_key.time = 0.0f;
            t_key.value = rest.translation;
            joint_track.translations.push_back(t_key);
        }

        if (pad_end) {
            RawAnimation::RotationKey r_key = joint_track.rotations.back();
            r_key.time = track.duration;
            joint_track.rotations.push_back(r_key);
            if (joint == mapping.root_joint()) {
                RawAnimation::TranslationKey t_key = joint_track.translations.back();
                t_key.time = track.duration;
                joint_track.translations.push_back(t_key);
            }
        }
    }

    if (!raw.Validate()) {
        return Fail(error, ErrorKind::kShapeMismatch, "raw animation validation failed");
    }

    ozz::log::LogV() << "Raw animation '" << track.name << "': " << raw.num_tracks()
                     << " tracks, " << track.frames.size() << " keyframes, "
                     << raw.duration << "s" << std::endl;

    *raw_animation = raw;
    return true;
}

bool CreateOutputDirectory(const std::string& output_path, ConversionError* error) {
    const std::filesystem::path parent = std::filesystem::path(output_path).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return Fail(error, ErrorKind::kIo,
                    "failed to create output directory " + parent.string() + ": " + ec.message());
    }
    return true;
}

bool ExportOzzAnimation(const AnimationTrack& track,
                        const ozz::animation::Skeleton& skeleton,
                        const std::vector<int>& slot_to_joint,
                        const std::string& output_path,
                        ConversionError* error) {
    ozz::animation::offline::RawAnimation raw_animation;
    if (!BuildRawAnimation(track, skeleton, slot_to_joint, &raw_animation, error)) {
        return false;
    }

    ozz::animation::offline::AnimationBuilder builder;
    ozz::unique_ptr<ozz::animation::Animation> animation = builder(raw_animation);
    if (!animation) {
        return Fail(error, ErrorKind::kShapeMismatch, "failed to build animation");
    }

    if (!CreateOutputDirectory(output_path, error)) {
        return false;
    }

    ozz::io::File file(output_path.c_str(), "wb");
    if (!file.opened()) {
        return Fail(error, ErrorKind::kIo, "failed to create output file: " + output_path);
    }

    ozz::io::OArchive archive(&file);
    archive << *animation;

    ozz::log::Log() << "Saved animation: " << output_path << " (" << animation->duration()
                    << "s, " << animation->num_tracks() << " tracks)" << std::endl;
    return true;
}

}  // namespace smplx
