// SMPL-X pose records and their assembly into per-sample joint rotations

#ifndef SMPLX_POSE_SAMPLE_H_
#define SMPLX_POSE_SAMPLE_H_

#include <string>
#include <vector>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

#include "conversion_error.h"

namespace smplx {

constexpr int kNumBodyPoseJoints = 21;                     // body_pose, without the root
constexpr int kNumBodyJoints = kNumBodyPoseJoints + 1;     // global_orient + body_pose
constexpr int kNumHandJoints = 15;
constexpr int kNumBoundJoints = kNumBodyJoints + 2 * kNumHandJoints;

// One source time sample as decoded from disk. Arrays are flattened
// row-major, 3 floats per joint.
struct RawPoseRecord {
    std::vector<float> global_orient;    // 1 x 3
    std::vector<float> body_pose;        // 21 x 3
    std::vector<float> left_hand_pose;   // 15 x 3
    std::vector<float> right_hand_pose;  // 15 x 3
    std::vector<float> transl;           // 3

    std::string source;  // File the record came from, for error messages
};

// Assembled sample: body[0] is the root (global orientation).
struct PoseSample {
    std::vector<ozz::math::Quaternion> body;        // kNumBodyJoints
    std::vector<ozz::math::Quaternion> left_hand;   // kNumHandJoints
    std::vector<ozz::math::Quaternion> right_hand;  // kNumHandJoints
    ozz::math::Float3 translation;

    PoseSample() : translation(ozz::math::Float3::zero()) {}
};

typedef std::vector<PoseSample> PoseSequence;

// Checks every array length of |record| against the fixed SMPL-X layout.
bool ValidateRecordShape(const RawPoseRecord& record, int record_index,
                         ConversionError* error);

// Converts one validated record. Hand vectors go through the mirror matrix
// before conversion, translation is copied as is.
bool AssemblePoseSample(const RawPoseRecord& record, int record_index,
                        PoseSample* sample, ConversionError* error);

// Validates the shape of all records first, then assembles them. Any failure
// leaves |sequence| empty.
bool AssemblePoseSequence(const std::vector<RawPoseRecord>& records,
                          PoseSequence* sequence, ConversionError* error);

}  // namespace smplx

#endif  // SMPLX_POSE_SAMPLE_H_
