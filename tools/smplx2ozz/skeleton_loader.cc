// Skeleton loading implementation

#include "skeleton_loader.h"

#include "ozz/animation/runtime/local_to_model_job.h"
#include "ozz/base/io/archive.h"
#include "ozz/base/io/stream.h"
#include "ozz/base/log.h"
#include "ozz/base/maths/simd_math.h"
#include "ozz/base/span.h"

namespace smplx {

bool LoadSkeleton(const std::string& path, ozz::animation::Skeleton* skeleton,
                  ConversionError* error) {
    ozz::io::File file(path.c_str(), "rb");
    if (!file.opened()) {
        return Fail(error, ErrorKind::kIo, "failed to open skeleton file: " + path);
    }

    ozz::io::IArchive archive(&file);
    if (!archive.TestTag<ozz::animation::Skeleton>()) {
        return Fail(error, ErrorKind::kIo, "invalid skeleton file: " + path);
    }

    archive >> *skeleton;
    if (skeleton->num_joints() == 0) {
        return Fail(error, ErrorKind::kIo, "skeleton has no joints: " + path);
    }
    return true;
}

std::vector<std::string> GetJointNames(const ozz::animation::Skeleton& skeleton) {
    std::vector<std::string> names;
    names.reserve(skeleton.num_joints());
    for (int i = 0; i < skeleton.num_joints(); ++i) {
        names.push_back(skeleton.joint_names()[i]);
    }
    return names;
}

bool ComputeModelRestPosition(const ozz::animation::Skeleton& skeleton, int joint_index,
                              ozz::math::Float3* position, ConversionError* error) {
    if (joint_index < 0 || joint_index >= skeleton.num_joints()) {
        return Fail(error, ErrorKind::kConfiguration, "joint index out of range");
    }

    std::vector<ozz::math::Float4x4> models(skeleton.num_joints());
    ozz::animation::LocalToModelJob job;
    job.skeleton = &skeleton;
    job.input = skeleton.joint_rest_poses();
    job.output = ozz::make_span(models);
    if (!job.Run()) {
        return Fail(error, ErrorKind::kConfiguration, "local to model job failed");
    }

    float values[4];
    ozz::math::StorePtrU(models[joint_index].cols[3], values);
    *position = ozz::math::Float3(values[0], values[1], values[2]);
    return true;
}

bool BindSkeleton(const ozz::animation::Skeleton& skeleton,
                  const std::string& joint_prefix,
                  SkeletonBinding* binding,
                  std::vector<int>* slot_to_joint,
                  ConversionError* error) {
    SkeletonBinding result = SkeletonBinding::Smplx(joint_prefix);
    if (!result.Validate(error)) {
        return false;
    }

    std::vector<int> indices;
    if (!result.ResolveJointIndices(GetJointNames(skeleton), &indices, error)) {
        return false;
    }

    ozz::math::Float3 bind_root;
    if (!ComputeModelRestPosition(skeleton, indices[0], &bind_root, error)) {
        return false;
    }
    result.set_bind_root_position(bind_root);

    ozz::log::LogV() << "Bound " << result.num_slots() << " of " << skeleton.num_joints()
                     << " skeleton joints, root '" << result.root_joint() << "' at ("
                     << bind_root.x << ", " << bind_root.y << ", " << bind_root.z << ")"
                     << std::endl;

    *binding = result;
    *slot_to_joint = indices;
    return true;
}

}  // namespace smplx
