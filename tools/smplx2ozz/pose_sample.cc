// Pose sample assembly implementation

#include "pose_sample.h"

#include <sstream>

#include "ozz/base/log.h"

#include "coordinate_convert.h"
#include "rotation_convert.h"

namespace smplx {

namespace {

std::string RecordLabel(const RawPoseRecord& record, int record_index) {
    std::ostringstream label;
    label << "record " << record_index;
    if (!record.source.empty()) {
        label << " (" << record.source << ")";
    }
    return label.str();
}

bool CheckLength(const std::vector<float>& values, const char* key, size_t expected,
                 const std::string& label, ConversionError* error) {
    if (values.size() == expected) {
        return true;
    }
    std::ostringstream msg;
    msg << label << ": " << key << " has " << values.size()
        << " values, expected " << expected;
    if (values.size() % 3 == 0 && expected % 3 == 0) {
        msg << " (" << values.size() / 3 << " joints instead of " << expected / 3 << ")";
    }
    return Fail(error, ErrorKind::kShapeMismatch, msg.str());
}

// Splits a flat array into 3-vectors, mirrored for the hand chains.
void AppendVectors(const std::vector<float>& values, bool mirror,
                   std::vector<ozz::math::Float3>* vectors) {
    for (size_t i = 0; i + 2 < values.size(); i += 3) {
        if (mirror) {
            vectors->push_back(coord_convert::MirrorHandAxisAngle(
                values[i], values[i + 1], values[i + 2]));
        } else {
            vectors->push_back(ozz::math::Float3(values[i], values[i + 1], values[i + 2]));
        }
    }
}

bool ConvertChain(const std::vector<ozz::math::Float3>& vectors, const char* chain,
                  const std::string& label, std::vector<ozz::math::Quaternion>* rotations,
                  ConversionError* error) {
    ConversionError chain_error;
    if (!AxisAngleToQuaternions(vectors, rotations, &chain_error)) {
        return Fail(error, chain_error.kind,
                    label + ": " + chain + " " + chain_error.message);
    }
    return true;
}

}  // namespace

bool ValidateRecordShape(const RawPoseRecord& record, int record_index,
                         ConversionError* error) {
    const std::string label = RecordLabel(record, record_index);
    return CheckLength(record.global_orient, "global_orient", 3, label, error) &&
           CheckLength(record.body_pose, "body_pose", kNumBodyPoseJoints * 3, label, error) &&
           CheckLength(record.left_hand_pose, "left_hand_pose", kNumHandJoints * 3, label, error) &&
           CheckLength(record.right_hand_pose, "right_hand_pose", kNumHandJoints * 3, label, error) &&
           CheckLength(record.transl, "transl", 3, label, error);
}

bool AssemblePoseSample(const RawPoseRecord& record, int record_index,
                        PoseSample* sample, ConversionError* error) {
    if (!ValidateRecordShape(record, record_index, error)) {
        return false;
    }
    const std::string label = RecordLabel(record, record_index);

    // Body: global orientation first, then the 21 body joints
    std::vector<ozz::math::Float3> body_vectors;
    body_vectors.reserve(kNumBodyJoints);
    AppendVectors(record.global_orient, false, &body_vectors);
    AppendVectors(record.body_pose, false, &body_vectors);

    std::vector<ozz::math::Float3> lhand_vectors;
    AppendVectors(record.left_hand_pose, true, &lhand_vectors);

    std::vector<ozz::math::Float3> rhand_vectors;
    AppendVectors(record.right_hand_pose, true, &rhand_vectors);

    PoseSample result;
    if (!ConvertChain(body_vectors, "body", label, &result.body, error) ||
        !ConvertChain(lhand_vectors, "left hand", label, &result.left_hand, error) ||
        !ConvertChain(rhand_vectors, "right hand", label, &result.right_hand, error)) {
        return false;
    }

    result.translation = ozz::math::Float3(record.transl[0], record.transl[1], record.transl[2]);
    *sample = result;
    return true;
}

bool AssemblePoseSequence(const std::vector<RawPoseRecord>& records,
                          PoseSequence* sequence, ConversionError* error) {
    sequence->clear();
    if (records.empty()) {
        return Fail(error, ErrorKind::kShapeMismatch, "pose sequence is empty");
    }

    // Reject heterogeneous input before any per-joint work
    for (size_t i = 0; i < records.size(); ++i) {
        if (!ValidateRecordShape(records[i], static_cast<int>(i), error)) {
            return false;
        }
    }

    PoseSequence result(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        if (!AssemblePoseSample(records[i], static_cast<int>(i), &result[i], error)) {
            return false;
        }
    }

    ozz::log::LogV() << "Assembled " << result.size() << " pose samples." << std::endl;
    sequence->swap(result);
    return true;
}

}  // namespace smplx
