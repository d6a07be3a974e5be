// skeleton_binding.cc - SMPL-X joint tables and name resolution
#include "skeleton_binding.h"

#include <sstream>

#include "ozz/base/log.h"

namespace smplx {

const char* const kBodyJointNames[kNumBodyJoints] = {
    "pelvis",
    "left_hip",
    "right_hip",
    "spine1",
    "left_knee",
    "right_knee",
    "spine2",
    "left_ankle",
    "right_ankle",
    "spine3",
    "left_foot",
    "right_foot",
    "neck",
    "left_collar",
    "right_collar",
    "head",
    "left_shoulder",
    "right_shoulder",
    "left_elbow",
    "right_elbow",
    "left_wrist",
    "right_wrist"
};

const char* const kLeftHandJointNames[kNumHandJoints] = {
    "left_index1",
    "left_index2",
    "left_index3",
    "left_middle1",
    "left_middle2",
    "left_middle3",
    "left_pinky1",
    "left_pinky2",
    "left_pinky3",
    "left_ring1",
    "left_ring2",
    "left_ring3",
    "left_thumb1",
    "left_thumb2",
    "left_thumb3"
};

const char* const kRightHandJointNames[kNumHandJoints] = {
    "right_index1",
    "right_index2",
    "right_index3",
    "right_middle1",
    "right_middle2",
    "right_middle3",
    "right_pinky1",
    "right_pinky2",
    "right_pinky3",
    "right_ring1",
    "right_ring2",
    "right_ring3",
    "right_thumb1",
    "right_thumb2",
    "right_thumb3"
};

namespace {

std::vector<std::string> PrefixedNames(const char* const* names, int count,
                                       const std::string& prefix) {
    std::vector<std::string> result;
    result.reserve(count);
    for (int i = 0; i < count; ++i) {
        result.push_back(prefix + names[i]);
    }
    return result;
}

bool CheckChain(const std::vector<std::string>& chain, const char* chain_name,
                size_t expected, ConversionError* error) {
    if (chain.size() != expected) {
        std::ostringstream msg;
        msg << chain_name << " binding has " << chain.size() << " joints, expected " << expected;
        return Fail(error, ErrorKind::kShapeMismatch, msg.str());
    }
    for (size_t i = 0; i < chain.size(); ++i) {
        if (chain[i].empty()) {
            std::ostringstream msg;
            msg << chain_name << " binding joint " << i << " has an empty name";
            return Fail(error, ErrorKind::kConfiguration, msg.str());
        }
    }
    return true;
}

}  // namespace

SkeletonBinding::SkeletonBinding()
    : m_body(PrefixedNames(kBodyJointNames, kNumBodyJoints, "")),
      m_left_hand(PrefixedNames(kLeftHandJointNames, kNumHandJoints, "")),
      m_right_hand(PrefixedNames(kRightHandJointNames, kNumHandJoints, "")),
      m_bind_root_position(ozz::math::Float3::zero()) {
    BuildSlotMap();
}

SkeletonBinding::SkeletonBinding(const std::vector<std::string>& body_joints,
                                 const std::vector<std::string>& left_hand_joints,
                                 const std::vector<std::string>& right_hand_joints,
                                 const ozz::math::Float3& bind_root_position)
    : m_body(body_joints),
      m_left_hand(left_hand_joints),
      m_right_hand(right_hand_joints),
      m_bind_root_position(bind_root_position) {
    BuildSlotMap();
}

SkeletonBinding SkeletonBinding::Smplx(const std::string& prefix) {
    return SkeletonBinding(PrefixedNames(kBodyJointNames, kNumBodyJoints, prefix),
                           PrefixedNames(kLeftHandJointNames, kNumHandJoints, prefix),
                           PrefixedNames(kRightHandJointNames, kNumHandJoints, prefix),
                           ozz::math::Float3::zero());
}

std::vector<std::string> SkeletonBinding::JointNames() const {
    std::vector<std::string> names;
    names.reserve(num_slots());
    names.insert(names.end(), m_body.begin(), m_body.end());
    names.insert(names.end(), m_left_hand.begin(), m_left_hand.end());
    names.insert(names.end(), m_right_hand.begin(), m_right_hand.end());
    return names;
}

int SkeletonBinding::GetSlot(const std::string& name) const {
    auto it = m_slot_map.find(name);
    return it != m_slot_map.end() ? it->second : -1;
}

bool SkeletonBinding::Validate(ConversionError* error) const {
    if (!CheckChain(m_body, "body", kNumBodyJoints, error) ||
        !CheckChain(m_left_hand, "left hand", kNumHandJoints, error) ||
        !CheckChain(m_right_hand, "right hand", kNumHandJoints, error)) {
        return false;
    }
    if (static_cast<int>(m_slot_map.size()) != num_slots()) {
        return Fail(error, ErrorKind::kConfiguration, "binding joint names are not unique");
    }
    return true;
}

bool SkeletonBinding::ResolveJointIndices(const std::vector<std::string>& skeleton_joint_names,
                                          std::vector<int>* slot_to_joint,
                                          ConversionError* error) const {
    std::map<std::string, int> skeleton_map;
    for (size_t i = 0; i < skeleton_joint_names.size(); ++i) {
        skeleton_map[skeleton_joint_names[i]] = static_cast<int>(i);
    }

    const std::vector<std::string> names = JointNames();
    std::vector<int> result(names.size(), -1);
    for (size_t slot = 0; slot < names.size(); ++slot) {
        auto it = skeleton_map.find(names[slot]);
        if (it == skeleton_map.end()) {
            return Fail(error, ErrorKind::kUnknownJoint,
                        "joint '" + names[slot] + "' not found in target skeleton");
        }
        result[slot] = it->second;
    }

    ozz::log::LogV() << "Resolved " << result.size() << " bound joints against "
                     << skeleton_joint_names.size() << " skeleton joints." << std::endl;
    slot_to_joint->swap(result);
    return true;
}

void SkeletonBinding::BuildSlotMap() {
    m_slot_map.clear();
    const std::vector<std::string> names = JointNames();
    for (size_t i = 0; i < names.size(); ++i) {
        m_slot_map[names[i]] = static_cast<int>(i);
    }
}

}  // namespace smplx
