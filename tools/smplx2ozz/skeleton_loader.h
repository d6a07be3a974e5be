// Target skeleton template loading and binding

#ifndef SMPLX_SKELETON_LOADER_H_
#define SMPLX_SKELETON_LOADER_H_

#include <string>
#include <vector>

#include "ozz/animation/runtime/skeleton.h"
#include "ozz/base/maths/vec_float.h"

#include "conversion_error.h"
#include "skeleton_binding.h"

namespace smplx {

// Loads a skeleton from an ozz archive (.ozz).
bool LoadSkeleton(const std::string& path, ozz::animation::Skeleton* skeleton,
                  ConversionError* error);

std::vector<std::string> GetJointNames(const ozz::animation::Skeleton& skeleton);

// Model-space rest position of |joint_index|, through LocalToModelJob.
bool ComputeModelRestPosition(const ozz::animation::Skeleton& skeleton, int joint_index,
                              ozz::math::Float3* position, ConversionError* error);

// Binds the SMPL-X joints (named with |joint_prefix|) to |skeleton|.
// |slot_to_joint| receives the skeleton joint of every binding slot and the
// binding's root position is the pelvis model-space rest position.
bool BindSkeleton(const ozz::animation::Skeleton& skeleton,
                  const std::string& joint_prefix,
                  SkeletonBinding* binding,
                  std::vector<int>* slot_to_joint,
                  ConversionError* error);

}  // namespace smplx

#endif  // SMPLX_SKELETON_LOADER_H_
