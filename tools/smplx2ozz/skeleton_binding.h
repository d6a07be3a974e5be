// skeleton_binding.h - SMPL-X joint naming and its binding to a skeleton template
#pragma once

#include <map>
#include <string>
#include <vector>

#include "ozz/base/maths/vec_float.h"

#include "conversion_error.h"
#include "pose_sample.h"

namespace smplx {

// Joint names in SMPL-X parameter order
extern const char* const kBodyJointNames[kNumBodyJoints];
extern const char* const kLeftHandJointNames[kNumHandJoints];
extern const char* const kRightHandJointNames[kNumHandJoints];

// Ordered joint names of the target skeleton plus its bind-pose root
// position. Slots are numbered body first, then left hand, then right hand;
// slot 0 is the root (pelvis).
class SkeletonBinding {
public:
    // SMPL-X names, bind root at the origin
    SkeletonBinding();

    SkeletonBinding(const std::vector<std::string>& body_joints,
                    const std::vector<std::string>& left_hand_joints,
                    const std::vector<std::string>& right_hand_joints,
                    const ozz::math::Float3& bind_root_position);

    // SMPL-X names with |prefix| prepended, e.g. "m_avg_" for gendered rigs
    static SkeletonBinding Smplx(const std::string& prefix);

    const std::vector<std::string>& body_joints() const { return m_body; }
    const std::vector<std::string>& left_hand_joints() const { return m_left_hand; }
    const std::vector<std::string>& right_hand_joints() const { return m_right_hand; }
    const std::string& root_joint() const { return m_body[0]; }

    const ozz::math::Float3& bind_root_position() const { return m_bind_root_position; }
    void set_bind_root_position(const ozz::math::Float3& position) {
        m_bind_root_position = position;
    }

    int num_slots() const {
        return static_cast<int>(m_body.size() + m_left_hand.size() + m_right_hand.size());
    }

    // All names in slot order
    std::vector<std::string> JointNames() const;

    // Slot of a joint name (-1 if not bound)
    int GetSlot(const std::string& name) const;

    // Checks chain lengths (22 / 15 / 15) and that names are unique and non-empty.
    bool Validate(ConversionError* error) const;

    // Resolves every slot to an index into |skeleton_joint_names|, once, so
    // that per-frame work never looks names up. Fails with kUnknownJoint
    // naming the first missing joint.
    bool ResolveJointIndices(const std::vector<std::string>& skeleton_joint_names,
                             std::vector<int>* slot_to_joint,
                             ConversionError* error) const;

private:
    void BuildSlotMap();

    std::vector<std::string> m_body;
    std::vector<std::string> m_left_hand;
    std::vector<std::string> m_right_hand;
    ozz::math::Float3 m_bind_root_position;
    std::map<std::string, int> m_slot_map;  // joint name -> slot
};

}  // namespace smplx
