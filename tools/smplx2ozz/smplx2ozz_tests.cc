// Unit tests for smplx2ozz
// Tests rotation conversion, pose assembly, resampling, root motion and
// keyframe emission

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

#include "conversion_error.h"
#include "coordinate_convert.h"
#include "frame_resampler.h"
#include "keyframe_track.h"
#include "pose_converter.h"
#include "pose_sample.h"
#include "root_motion.h"
#include "rotation_convert.h"
#include "skeleton_binding.h"

using smplx::ConversionError;
using smplx::ErrorKind;

// Test helpers
bool float_eq(float a, float b, float epsilon = 0.001f) {
    return std::abs(a - b) < epsilon;
}

bool quat_eq(const ozz::math::Quaternion& a, const ozz::math::Quaternion& b, float epsilon = 0.001f) {
    // Quaternions q and -q represent the same rotation
    bool same = float_eq(a.x, b.x, epsilon) && float_eq(a.y, b.y, epsilon) &&
                float_eq(a.z, b.z, epsilon) && float_eq(a.w, b.w, epsilon);
    bool neg = float_eq(a.x, -b.x, epsilon) && float_eq(a.y, -b.y, epsilon) &&
               float_eq(a.z, -b.z, epsilon) && float_eq(a.w, -b.w, epsilon);
    return same || neg;
}

bool quat_bits_eq(const ozz::math::Quaternion& a, const ozz::math::Quaternion& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z && a.w == b.w;
}

// Record with every joint set to a small distinct rotation
smplx::RawPoseRecord MakeRecord(float seed, const ozz::math::Float3& transl) {
    smplx::RawPoseRecord record;
    record.global_orient = {0.1f * seed, 0.2f, -0.3f};
    for (int i = 0; i < smplx::kNumBodyPoseJoints; ++i) {
        record.body_pose.insert(record.body_pose.end(),
                                {0.01f * i, -0.02f * seed, 0.03f});
    }
    for (int i = 0; i < smplx::kNumHandJoints; ++i) {
        record.left_hand_pose.insert(record.left_hand_pose.end(),
                                     {0.05f, 0.01f * i, 0.2f * seed});
        record.right_hand_pose.insert(record.right_hand_pose.end(),
                                      {-0.05f, 0.02f * i, -0.1f});
    }
    record.transl = {transl.x, transl.y, transl.z};
    return record;
}

std::vector<smplx::RawPoseRecord> MakeRecords(int count) {
    std::vector<smplx::RawPoseRecord> records;
    for (int i = 0; i < count; ++i) {
        records.push_back(MakeRecord(static_cast<float>(i + 1),
                                     ozz::math::Float3(0.1f * i, -0.05f * i, 1.0f + 0.01f * i)));
    }
    return records;
}

// ============================================================================
// Rotation Conversion Tests
// ============================================================================

void test_identity_rotation() {
    printf("Test: Zero rotation vector gives identity... ");

    ozz::math::Quaternion q;
    ConversionError error;
    assert(smplx::AxisAngleToQuaternion(ozz::math::Float3::zero(), &q, &error));
    assert(q.w == 1.0f && q.x == 0.0f && q.y == 0.0f && q.z == 0.0f);

    // Batched path
    std::vector<ozz::math::Float3> vectors(4, ozz::math::Float3::zero());
    std::vector<ozz::math::Quaternion> quats;
    assert(smplx::AxisAngleToQuaternions(vectors, &quats, &error));
    assert(quats.size() == 4);
    for (const auto& bq : quats) {
        assert(bq.w == 1.0f && bq.x == 0.0f && bq.y == 0.0f && bq.z == 0.0f);
    }

    // Below the epsilon
    assert(smplx::AxisAngleToQuaternion(ozz::math::Float3(1e-14f, 0.0f, 0.0f), &q, &error));
    assert(quat_eq(q, ozz::math::Quaternion::identity(), 1e-6f));

    printf("PASSED\n");
}

void test_known_rotations() {
    printf("Test: Known axis-angle rotations... ");

    const float kPi = coord_convert::kPi;
    ozz::math::Quaternion q;
    ConversionError error;

    // 90 degrees about Z
    assert(smplx::AxisAngleToQuaternion(ozz::math::Float3(0.0f, 0.0f, kPi / 2.0f), &q, &error));
    assert(quat_eq(q, ozz::math::Quaternion(0.0f, 0.0f, std::sin(kPi / 4.0f), std::cos(kPi / 4.0f))));

    // 180 degrees about X
    assert(smplx::AxisAngleToQuaternion(ozz::math::Float3(kPi, 0.0f, 0.0f), &q, &error));
    assert(quat_eq(q, ozz::math::Quaternion(1.0f, 0.0f, 0.0f, 0.0f)));

    // Same as the library's own construction
    const ozz::math::Float3 axis = ozz::math::Normalize(ozz::math::Float3(1.0f, 2.0f, -0.5f));
    const float angle = 1.3f;
    assert(smplx::AxisAngleToQuaternion(axis * angle, &q, &error));
    assert(quat_eq(q, ozz::math::Quaternion::FromAxisAngle(axis, angle)));

    printf("PASSED\n");
}

void test_round_trip() {
    printf("Test: Axis-angle round trip... ");

    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> component(-1.0f, 1.0f);
    std::uniform_real_distribution<float> angle_dist(0.01f, coord_convert::kPi - 0.01f);

    for (int i = 0; i < 1000; ++i) {
        ozz::math::Float3 axis(component(rng), component(rng), component(rng));
        if (ozz::math::Length(axis) < 0.1f) {
            continue;
        }
        axis = ozz::math::Normalize(axis);
        const ozz::math::Float3 rotvec = axis * angle_dist(rng);

        ozz::math::Quaternion q;
        ConversionError error;
        assert(smplx::AxisAngleToQuaternion(rotvec, &q, &error));
        const ozz::math::Float3 back = smplx::QuaternionToAxisAngle(q);
        assert(float_eq(back.x, rotvec.x, 1e-4f));
        assert(float_eq(back.y, rotvec.y, 1e-4f));
        assert(float_eq(back.z, rotvec.z, 1e-4f));
    }

    // At exactly pi the axis sign is ambiguous, compare rotations instead
    const ozz::math::Float3 half_turn(0.0f, coord_convert::kPi, 0.0f);
    ozz::math::Quaternion q;
    ConversionError error;
    assert(smplx::AxisAngleToQuaternion(half_turn, &q, &error));
    ozz::math::Quaternion q_back;
    assert(smplx::AxisAngleToQuaternion(smplx::QuaternionToAxisAngle(q), &q_back, &error));
    assert(quat_eq(q, q_back));

    printf("PASSED\n");
}

void test_unit_norm() {
    printf("Test: 10000 random rotations have unit norm... ");

    std::mt19937 rng(42);
    std::uniform_real_distribution<float> component(-1.0f, 1.0f);
    std::uniform_real_distribution<float> angle_dist(0.0f, coord_convert::kPi);

    std::vector<ozz::math::Float3> vectors;
    vectors.reserve(10000);
    while (vectors.size() < 10000) {
        ozz::math::Float3 axis(component(rng), component(rng), component(rng));
        const float len = ozz::math::Length(axis);
        if (len < 1e-3f) {
            continue;
        }
        vectors.push_back(axis * (angle_dist(rng) / len));
    }

    std::vector<ozz::math::Quaternion> quats;
    ConversionError error;
    assert(smplx::AxisAngleToQuaternions(vectors, &quats, &error));
    assert(quats.size() == vectors.size());
    for (const auto& q : quats) {
        assert(std::abs(coord_convert::QuatLength(q) - 1.0f) < 1e-5f);
    }

    printf("PASSED\n");
}

void test_non_finite_rotation() {
    printf("Test: Non-finite rotation vector is rejected... ");

    ozz::math::Quaternion q = ozz::math::Quaternion::identity();
    ConversionError error;
    const float nan = std::numeric_limits<float>::quiet_NaN();
    assert(!smplx::AxisAngleToQuaternion(ozz::math::Float3(nan, 0.0f, 0.0f), &q, &error));
    assert(error.kind == ErrorKind::kNumeric);

    // Batched path names the vector and leaves the output untouched
    std::vector<ozz::math::Float3> vectors = {
        ozz::math::Float3(0.1f, 0.0f, 0.0f),
        ozz::math::Float3(0.0f, std::numeric_limits<float>::infinity(), 0.0f)};
    std::vector<ozz::math::Quaternion> quats;
    ConversionError batch_error;
    assert(!smplx::AxisAngleToQuaternions(vectors, &quats, &batch_error));
    assert(batch_error.kind == ErrorKind::kNumeric);
    assert(batch_error.message.find("vector 1") != std::string::npos);
    assert(quats.empty());

    printf("PASSED\n");
}

// ============================================================================
// Pose Assembly Tests
// ============================================================================

void test_assemble_sample() {
    printf("Test: Assemble pose sample... ");

    smplx::RawPoseRecord record = MakeRecord(1.0f, ozz::math::Float3(1.0f, 2.0f, 3.0f));
    smplx::PoseSample sample;
    ConversionError error;
    assert(smplx::AssemblePoseSample(record, 0, &sample, &error));
    assert(sample.body.size() == 22);
    assert(sample.left_hand.size() == 15);
    assert(sample.right_hand.size() == 15);
    assert(sample.translation.x == 1.0f && sample.translation.y == 2.0f &&
           sample.translation.z == 3.0f);

    // Root comes from global_orient
    ozz::math::Quaternion root;
    assert(smplx::AxisAngleToQuaternion(ozz::math::Float3(0.1f, 0.2f, -0.3f), &root, &error));
    assert(quat_bits_eq(sample.body[0], root));

    printf("PASSED\n");
}

void test_hand_mirror() {
    printf("Test: Both hands are mirrored the same way... ");

    smplx::RawPoseRecord record = MakeRecord(1.0f, ozz::math::Float3::zero());
    for (int i = 0; i < smplx::kNumHandJoints * 3; i += 3) {
        record.left_hand_pose[i] = 0.3f;
        record.left_hand_pose[i + 1] = -0.2f;
        record.left_hand_pose[i + 2] = 0.5f;
        record.right_hand_pose[i] = 0.3f;
        record.right_hand_pose[i + 1] = -0.2f;
        record.right_hand_pose[i + 2] = 0.5f;
    }

    smplx::PoseSample sample;
    ConversionError error;
    assert(smplx::AssemblePoseSample(record, 0, &sample, &error));

    ozz::math::Quaternion expected;
    assert(smplx::AxisAngleToQuaternion(ozz::math::Float3(0.3f, -0.2f, -0.5f), &expected, &error));
    for (int i = 0; i < smplx::kNumHandJoints; ++i) {
        assert(quat_bits_eq(sample.left_hand[i], expected));
        assert(quat_bits_eq(sample.right_hand[i], expected));
    }

    printf("PASSED\n");
}

void test_shape_rejection() {
    printf("Test: 20 body joints is a shape mismatch... ");

    std::vector<smplx::RawPoseRecord> records = MakeRecords(5);
    records[3].body_pose.resize(20 * 3);

    smplx::PoseSequence sequence;
    ConversionError error;
    assert(!smplx::AssemblePoseSequence(records, &sequence, &error));
    assert(error.kind == ErrorKind::kShapeMismatch);
    assert(error.message.find("body_pose") != std::string::npos);
    assert(error.message.find("record 3") != std::string::npos);
    assert(sequence.empty());

    // The whole sequence produces no frames
    smplx::AnimationTrack track;
    track.name = "untouched";
    ConversionError convert_error;
    assert(!smplx::ConvertPoseRecords(records, smplx::SkeletonBinding(),
                                      smplx::ConversionSettings(), &track, &convert_error));
    assert(convert_error.kind == ErrorKind::kShapeMismatch);
    assert(track.frames.empty());
    assert(track.name == "untouched");

    printf("PASSED\n");
}

void test_empty_sequence() {
    printf("Test: Empty sequence is rejected... ");

    smplx::PoseSequence sequence;
    ConversionError error;
    assert(!smplx::AssemblePoseSequence({}, &sequence, &error));
    assert(error.kind == ErrorKind::kShapeMismatch);

    smplx::AnimationTrack track;
    ConversionError convert_error;
    assert(!smplx::ConvertPoseSequence(sequence, smplx::SkeletonBinding(),
                                       smplx::ConversionSettings(), &track, &convert_error));
    assert(convert_error.kind == ErrorKind::kShapeMismatch);

    printf("PASSED\n");
}

void test_nan_in_sequence() {
    printf("Test: NaN in a record fails the sequence... ");

    std::vector<smplx::RawPoseRecord> records = MakeRecords(3);
    records[2].right_hand_pose[7] = std::numeric_limits<float>::quiet_NaN();

    smplx::PoseSequence sequence;
    ConversionError error;
    assert(!smplx::AssemblePoseSequence(records, &sequence, &error));
    assert(error.kind == ErrorKind::kNumeric);
    assert(error.message.find("right hand") != std::string::npos);
    assert(sequence.empty());

    printf("PASSED\n");
}

// ============================================================================
// Resampling Tests
// ============================================================================

void test_resample_same_rate() {
    printf("Test: Resample 30 -> 30... ");

    smplx::ResamplePlan plan;
    ConversionError error;
    assert(smplx::PlanResampling(100, 30, 30, &plan, &error));
    assert(plan.stride == 1);
    assert(plan.effective_rate == 30);
    assert(plan.frame_count() == 100);
    for (int i = 0; i < plan.frame_count(); ++i) {
        assert(plan.source_indices[i] == i);
        assert(plan.frame_number(i) == smplx::kFirstFrameNumber + i);
    }

    printf("PASSED\n");
}

void test_resample_never_upsamples() {
    printf("Test: Resample 30 -> 60 clamps to the source rate... ");

    smplx::ResamplePlan plan;
    ConversionError error;
    assert(smplx::PlanResampling(100, 30, 60, &plan, &error));
    assert(plan.stride == 1);
    assert(plan.effective_rate == 30);
    assert(plan.frame_count() == 100);

    printf("PASSED\n");
}

void test_resample_downsample() {
    printf("Test: Resample 30 -> 10 with 100 samples... ");

    smplx::ResamplePlan plan;
    ConversionError error;
    assert(smplx::PlanResampling(100, 30, 10, &plan, &error));
    assert(plan.stride == 3);
    assert(plan.effective_rate == 10);
    assert(plan.frame_count() == 34);
    for (int i = 0; i < plan.frame_count(); ++i) {
        assert(plan.source_indices[i] == 3 * i);
    }
    assert(plan.source_indices.back() == 99);
    assert(float_eq(plan.frame_time(1), 0.1f, 1e-6f));
    assert(float_eq(plan.duration(), 3.3f, 1e-5f));

    printf("PASSED\n");
}

void test_resample_single_frame() {
    printf("Test: Resample a single sample... ");

    smplx::ResamplePlan plan;
    ConversionError error;
    assert(smplx::PlanResampling(1, 30, 30, &plan, &error));
    assert(plan.frame_count() == 1);
    assert(plan.frame_time(0) == 0.0f);
    assert(float_eq(plan.duration(), 1.0f / 30.0f, 1e-6f));

    printf("PASSED\n");
}

void test_resample_invalid_rates() {
    printf("Test: Non-positive rates are configuration errors... ");

    smplx::ResamplePlan plan;
    ConversionError error;
    assert(!smplx::PlanResampling(10, 0, 30, &plan, &error));
    assert(error.kind == ErrorKind::kConfiguration);

    ConversionError target_error;
    assert(!smplx::PlanResampling(10, 30, -5, &plan, &target_error));
    assert(target_error.kind == ErrorKind::kConfiguration);

    ConversionError empty_error;
    assert(!smplx::PlanResampling(0, 30, 30, &plan, &empty_error));
    assert(empty_error.kind == ErrorKind::kShapeMismatch);

    // Through the converter as well
    smplx::ConversionSettings settings;
    settings.source_rate = 0;
    smplx::AnimationTrack track;
    ConversionError convert_error;
    assert(!smplx::ConvertPoseRecords(MakeRecords(3), smplx::SkeletonBinding(), settings,
                                      &track, &convert_error));
    assert(convert_error.kind == ErrorKind::kConfiguration);
    assert(track.frames.empty());

    printf("PASSED\n");
}

// ============================================================================
// Root Motion Tests
// ============================================================================

void test_origin_centering() {
    printf("Test: Origin centering... ");

    const ozz::math::Float3 first(2.0f, -1.0f, 5.0f);
    const ozz::math::Float3 offset = smplx::ComputeOriginOffset(first, true);
    assert(offset.z == 0.0f);

    const ozz::math::Float3 t0 = smplx::CenterTranslation(first, offset);
    assert(float_eq(t0.x, 0.0f, 1e-6f) && float_eq(t0.y, 0.0f, 1e-6f));

    const ozz::math::Float3 t1 = smplx::CenterTranslation(ozz::math::Float3(2.5f, -0.8f, 5.2f), offset);
    assert(float_eq(t1.x, 0.5f, 1e-6f) && float_eq(t1.y, 0.2f, 1e-6f));

    // Disabled
    const ozz::math::Float3 none = smplx::ComputeOriginOffset(first, false);
    assert(none.x == 0.0f && none.y == 0.0f && none.z == 0.0f);
    const ozz::math::Float3 raw = smplx::CenterTranslation(first, none);
    assert(raw.x == 2.0f && raw.y == -1.0f);

    printf("PASSED\n");
}

void test_vertical_root_lock() {
    printf("Test: Vertical root translation is locked... ");

    const ozz::math::Float3 bind(0.1f, 0.2f, 0.9f);
    std::vector<smplx::RawPoseRecord> records = MakeRecords(6);
    for (size_t i = 0; i < records.size(); ++i) {
        records[i].transl[2] = 3.0f * static_cast<float>(i) - 4.0f;
    }

    smplx::SkeletonBinding binding = smplx::SkeletonBinding::Smplx("");
    binding.set_bind_root_position(bind);

    smplx::AnimationTrack track;
    ConversionError error;
    assert(smplx::ConvertPoseRecords(records, binding, smplx::ConversionSettings(), &track, &error));
    assert(track.frame_count() == 6);
    for (const auto& frame : track.frames) {
        assert(frame.root_translation.z == 0.0f - bind.z);
    }

    // Horizontal motion is centered then offset by the bind position
    assert(float_eq(track.frames[0].root_translation.x, -bind.x, 1e-6f));
    assert(float_eq(track.frames[0].root_translation.y, -bind.y, 1e-6f));
    assert(float_eq(track.frames[5].root_translation.x, 0.5f - bind.x, 1e-5f));
    assert(float_eq(track.frames[5].root_translation.y, -0.25f - bind.y, 1e-5f));

    printf("PASSED\n");
}

// ============================================================================
// Orientation Correction Tests
// ============================================================================

void test_root_correction() {
    printf("Test: Root orientation correction... ");

    const ozz::math::Quaternion correction = coord_convert::RootOrientationCorrection();
    // -180 degrees about X
    assert(quat_eq(correction, ozz::math::Quaternion(-1.0f, 0.0f, 0.0f, 0.0f)));

    // Identity root becomes the correction itself
    assert(quat_eq(coord_convert::CorrectRootOrientation(ozz::math::Quaternion::identity()),
                   correction));

    // Pre-multiplied: correction * raw
    const ozz::math::Quaternion raw =
        ozz::math::Quaternion::FromAxisAngle(ozz::math::Float3(0.0f, 1.0f, 0.0f), 0.7f);
    assert(quat_eq(coord_convert::CorrectRootOrientation(raw), correction * raw));

    printf("PASSED\n");
}

void test_correction_only_touches_root() {
    printf("Test: Only the root differs between corrected and raw emission... ");

    std::vector<smplx::RawPoseRecord> records = MakeRecords(4);
    smplx::PoseSequence sequence;
    ConversionError error;
    assert(smplx::AssemblePoseSequence(records, &sequence, &error));

    smplx::SkeletonBinding binding;
    smplx::ConversionSettings corrected_settings;
    smplx::ConversionSettings raw_settings;
    raw_settings.correct_root_orientation = false;

    smplx::AnimationTrack corrected;
    smplx::AnimationTrack raw;
    assert(smplx::ConvertPoseSequence(sequence, binding, corrected_settings, &corrected, &error));
    assert(smplx::ConvertPoseSequence(sequence, binding, raw_settings, &raw, &error));
    assert(corrected.frame_count() == raw.frame_count());

    for (int f = 0; f < corrected.frame_count(); ++f) {
        const auto& c = corrected.frames[f];
        const auto& r = raw.frames[f];
        const smplx::PoseSample& sample = sequence[c.source_index];
        assert(c.rotations.size() == static_cast<size_t>(smplx::kNumBoundJoints));

        assert(!quat_bits_eq(c.rotations[0], r.rotations[0]));
        assert(quat_bits_eq(r.rotations[0], sample.body[0]));

        for (int j = 1; j < smplx::kNumBoundJoints; ++j) {
            assert(quat_bits_eq(c.rotations[j], r.rotations[j]));
        }
        for (int j = 1; j < smplx::kNumBodyJoints; ++j) {
            assert(quat_bits_eq(c.rotations[j], sample.body[j]));
        }
        for (int j = 0; j < smplx::kNumHandJoints; ++j) {
            assert(quat_bits_eq(c.rotations[smplx::kNumBodyJoints + j], sample.left_hand[j]));
            assert(quat_bits_eq(c.rotations[smplx::kNumBodyJoints + smplx::kNumHandJoints + j],
                                sample.right_hand[j]));
        }
    }

    printf("PASSED\n");
}

// ============================================================================
// Keyframe Emission Tests
// ============================================================================

void test_track_layout() {
    printf("Test: Track frames and columns... ");

    smplx::ConversionSettings settings;
    settings.source_rate = 30;
    settings.target_rate = 10;
    settings.name = "walk";

    smplx::AnimationTrack track;
    ConversionError error;
    assert(smplx::ConvertPoseRecords(MakeRecords(10), smplx::SkeletonBinding(), settings,
                                     &track, &error));
    assert(track.name == "walk");
    assert(track.frame_rate == 10);
    assert(track.frame_count() == 4);  // indices 0, 3, 6, 9
    assert(float_eq(track.duration, 0.3f, 1e-6f));
    assert(track.joint_names.size() == static_cast<size_t>(smplx::kNumBoundJoints));
    assert(track.FindJoint("pelvis") == 0);
    assert(track.FindJoint("right_wrist") == 21);
    assert(track.FindJoint("left_index1") == 22);
    assert(track.FindJoint("right_thumb3") == smplx::kNumBoundJoints - 1);
    assert(track.FindJoint("jaw") == -1);

    for (int i = 0; i < track.frame_count(); ++i) {
        assert(track.frames[i].frame_number == smplx::kFirstFrameNumber + i);
        assert(track.frames[i].source_index == 3 * i);
        assert(float_eq(track.frames[i].time, 0.1f * i, 1e-6f));
    }

    const std::vector<ozz::math::Quaternion> column = track.RotationColumn(5);
    assert(column.size() == 4);

    // Unknown columns give an empty column
    assert(track.RotationColumn(track.FindJoint("jaw")).empty());
    assert(track.RotationColumn(smplx::kNumBoundJoints).empty());

    printf("PASSED\n");
}

void test_emit_rejects_partial_frames() {
    printf("Test: Emission rejects partial and out of order frames... ");

    smplx::SkeletonBinding binding;
    smplx::AnimationTrack track;
    smplx::InitializeTrack(binding, "clip", 30, &track);

    smplx::PoseSample sample;
    sample.body.assign(smplx::kNumBodyJoints, ozz::math::Quaternion::identity());
    sample.left_hand.assign(smplx::kNumHandJoints, ozz::math::Quaternion::identity());
    sample.right_hand.assign(smplx::kNumHandJoints - 1, ozz::math::Quaternion::identity());

    ConversionError error;
    assert(!smplx::EmitFrame(binding, 1, 0, 0.0f, ozz::math::Float3::zero(),
                             ozz::math::Quaternion::identity(), sample, &track, &error));
    assert(error.kind == ErrorKind::kShapeMismatch);
    assert(track.frames.empty());

    sample.right_hand.push_back(ozz::math::Quaternion::identity());
    assert(smplx::EmitFrame(binding, 1, 0, 0.0f, ozz::math::Float3::zero(),
                            ozz::math::Quaternion::identity(), sample, &track, &error));

    ConversionError order_error;
    assert(!smplx::EmitFrame(binding, 3, 1, 0.1f, ozz::math::Float3::zero(),
                             ozz::math::Quaternion::identity(), sample, &track, &order_error));
    assert(order_error.kind == ErrorKind::kShapeMismatch);
    assert(track.frame_count() == 1);

    printf("PASSED\n");
}

// ============================================================================
// Skeleton Binding Tests
// ============================================================================

void test_binding_names() {
    printf("Test: SMPL-X binding names... ");

    smplx::SkeletonBinding binding = smplx::SkeletonBinding::Smplx("m_avg_");
    ConversionError error;
    assert(binding.Validate(&error));
    assert(binding.num_slots() == smplx::kNumBoundJoints);
    assert(binding.root_joint() == "m_avg_pelvis");
    assert(binding.GetSlot("m_avg_left_index1") == smplx::kNumBodyJoints);
    assert(binding.GetSlot("pelvis") == -1);

    // Duplicate names are a configuration error
    std::vector<std::string> body = smplx::SkeletonBinding().body_joints();
    body[3] = body[2];
    smplx::SkeletonBinding duplicate(body, smplx::SkeletonBinding().left_hand_joints(),
                                     smplx::SkeletonBinding().right_hand_joints(),
                                     ozz::math::Float3::zero());
    ConversionError dup_error;
    assert(!duplicate.Validate(&dup_error));
    assert(dup_error.kind == ErrorKind::kConfiguration);

    // Wrong chain length
    body.pop_back();
    smplx::SkeletonBinding short_body(body, smplx::SkeletonBinding().left_hand_joints(),
                                      smplx::SkeletonBinding().right_hand_joints(),
                                      ozz::math::Float3::zero());
    ConversionError short_error;
    assert(!short_body.Validate(&short_error));
    assert(short_error.kind == ErrorKind::kShapeMismatch);

    printf("PASSED\n");
}

void test_unknown_joint() {
    printf("Test: Unknown joint is reported before conversion... ");

    smplx::SkeletonBinding binding;
    std::vector<std::string> skeleton_names = binding.JointNames();
    skeleton_names.push_back("jaw");
    skeleton_names.erase(skeleton_names.begin() + 30);  // drops a left hand joint

    std::vector<int> slot_to_joint;
    ConversionError error;
    assert(!binding.ResolveJointIndices(skeleton_names, &slot_to_joint, &error));
    assert(error.kind == ErrorKind::kUnknownJoint);
    assert(error.message.find(binding.JointNames()[30]) != std::string::npos);
    assert(slot_to_joint.empty());

    // Full set resolves in any order
    std::vector<std::string> reversed = binding.JointNames();
    std::reverse(reversed.begin(), reversed.end());
    ConversionError ok_error;
    assert(binding.ResolveJointIndices(reversed, &slot_to_joint, &ok_error));
    assert(slot_to_joint.size() == static_cast<size_t>(smplx::kNumBoundJoints));
    assert(slot_to_joint[0] == smplx::kNumBoundJoints - 1);

    printf("PASSED\n");
}

void test_error_strings() {
    printf("Test: Error kind names... ");

    ConversionError error;
    assert(error.ok());
    smplx::Fail(&error, ErrorKind::kShapeMismatch, "record 3: body_pose");
    assert(!error.ok());
    assert(error.ToString() == "ShapeMismatchError: record 3: body_pose");
    assert(std::string(smplx::ErrorKindName(ErrorKind::kUnknownJoint)) == "UnknownJointError");
    assert(!smplx::Fail(nullptr, ErrorKind::kIo, "ignored"));

    printf("PASSED\n");
}

int main() {
    printf("\n=== smplx2ozz Unit Tests ===\n\n");

    printf("--- Rotation Conversion Tests ---\n");
    test_identity_rotation();
    test_known_rotations();
    test_round_trip();
    test_unit_norm();
    test_non_finite_rotation();

    printf("\n--- Pose Assembly Tests ---\n");
    test_assemble_sample();
    test_hand_mirror();
    test_shape_rejection();
    test_empty_sequence();
    test_nan_in_sequence();

    printf("\n--- Resampling Tests ---\n");
    test_resample_same_rate();
    test_resample_never_upsamples();
    test_resample_downsample();
    test_resample_single_frame();
    test_resample_invalid_rates();

    printf("\n--- Root Motion Tests ---\n");
    test_origin_centering();
    test_vertical_root_lock();

    printf("\n--- Orientation Correction Tests ---\n");
    test_root_correction();
    test_correction_only_touches_root();

    printf("\n--- Keyframe Emission Tests ---\n");
    test_track_layout();
    test_emit_rejects_partial_frames();

    printf("\n--- Skeleton Binding Tests ---\n");
    test_binding_names();
    test_unknown_joint();
    test_error_strings();

    printf("\n=== All tests passed! ===\n\n");
    return 0;
}
