// glTF export implementation

#include "gltf_exporter.h"

#include <cstring>

#include "ozz/animation/runtime/local_to_model_job.h"
#include "ozz/base/log.h"
#include "ozz/base/maths/simd_math.h"
#include "ozz/base/span.h"

#include <nlohmann/json.hpp>

#define TINYGLTF_IMPLEMENTATION
#define TINYGLTF_NO_STB_IMAGE
#define TINYGLTF_NO_STB_IMAGE_WRITE
#define TINYGLTF_NO_INCLUDE_JSON
#include "tiny_gltf.h"

#include "ozz_exporter.h"

namespace smplx {

namespace {

// Appends |values| to the single buffer and returns the new buffer view.
int AppendBufferView(const std::vector<float>& values, tinygltf::Model* model) {
    tinygltf::Buffer& buffer = model->buffers[0];
    const size_t offset = buffer.data.size();
    const size_t size = values.size() * sizeof(float);
    buffer.data.resize(offset + size);
    std::memcpy(buffer.data.data() + offset, values.data(), size);

    tinygltf::BufferView view;
    view.buffer = 0;
    view.byteOffset = offset;
    view.byteLength = size;
    model->bufferViews.push_back(view);
    return static_cast<int>(model->bufferViews.size()) - 1;
}

int AddFloatAccessor(const std::vector<float>& values, int type, size_t count,
                     tinygltf::Model* model) {
    tinygltf::Accessor accessor;
    accessor.bufferView = AppendBufferView(values, model);
    accessor.byteOffset = 0;
    accessor.componentType = TINYGLTF_COMPONENT_TYPE_FLOAT;
    accessor.count = count;
    accessor.type = type;
    model->accessors.push_back(accessor);
    return static_cast<int>(model->accessors.size()) - 1;
}

bool ComputeInverseBindMatrices(const ozz::animation::Skeleton& skeleton,
                                std::vector<float>* matrices,
                                ConversionError* error) {
    std::vector<ozz::math::Float4x4> models(skeleton.num_joints());
    ozz::animation::LocalToModelJob job;
    job.skeleton = &skeleton;
    job.input = skeleton.joint_rest_poses();
    job.output = ozz::make_span(models);
    if (!job.Run()) {
        return Fail(error, ErrorKind::kConfiguration, "local to model job failed");
    }

    matrices->assign(skeleton.num_joints() * 16, 0.0f);
    for (int i = 0; i < skeleton.num_joints(); ++i) {
        ozz::math::SimdInt4 invertible;
        const ozz::math::Float4x4 inverse = ozz::math::Invert(models[i], &invertible);
        if (!ozz::math::AreAllTrue1(invertible)) {
            return Fail(error, ErrorKind::kConfiguration,
                        std::string("failed to invert bind matrix of joint ") +
                            skeleton.joint_names()[i]);
        }
        // Column-major, as glTF expects
        for (int col = 0; col < 4; ++col) {
            ozz::math::StorePtrU(inverse.cols[col], &(*matrices)[i * 16 + col * 4]);
        }
    }
    return true;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

bool ExportGltfAnimation(const AnimationTrack& track,
                         const ozz::animation::Skeleton& skeleton,
                         const std::vector<int>& slot_to_joint,
                         const std::string& output_path,
                         ConversionError* error) {
    ExportMapping mapping;
    if (!mapping.Init(track, skeleton, slot_to_joint, error)) {
        return false;
    }

    const int num_joints = skeleton.num_joints();
    const auto& names = skeleton.joint_names();
    const auto& parents = skeleton.joint_parents();

    std::vector<float> inverse_bind_matrices;
    if (!ComputeInverseBindMatrices(skeleton, &inverse_bind_matrices, error)) {
        return false;
    }

    tinygltf::Model model;
    model.asset.version = "2.0";
    model.asset.generator = "smplx2ozz";
    model.buffers.resize(1);

    // Joint nodes at rest
    for (int i = 0; i < num_joints; ++i) {
        const soa_utils::RestTransform& rest = mapping.Rest(i);
        tinygltf::Node node;
        node.name = names[i];
        node.translation = {rest.translation.x, rest.translation.y, rest.translation.z};
        node.rotation = {rest.rotation.x, rest.rotation.y, rest.rotation.z, rest.rotation.w};
        node.scale = {rest.scale.x, rest.scale.y, rest.scale.z};
        model.nodes.push_back(node);
    }
    for (int i = 0; i < num_joints; ++i) {
        if (parents[i] != ozz::animation::Skeleton::kNoParent) {
            model.nodes[parents[i]].children.push_back(i);
        }
    }

    tinygltf::Scene scene;
    scene.name = track.name;
    for (int i = 0; i < num_joints; ++i) {
        if (parents[i] == ozz::animation::Skeleton::kNoParent) {
            scene.nodes.push_back(i);
        }
    }

    tinygltf::Skin skin;
    skin.name = "skeleton";
    skin.inverseBindMatrices =
        AddFloatAccessor(inverse_bind_matrices, TINYGLTF_TYPE_MAT4, num_joints, &model);
    // The skeleton root must be a common root of every joint, left unset
    // for a forest
    if (scene.nodes.size() == 1) {
        skin.skeleton = scene.nodes[0];
    }
    for (int i = 0; i < num_joints; ++i) {
        skin.joints.push_back(i);
    }
    model.skins.push_back(skin);
    model.scenes.push_back(scene);
    model.defaultScene = 0;

    // Keyframe times, shared by every sampler. A single frame clip gets an
    // identical end key so that it spans the whole duration.
    const size_t num_frames = track.frames.size();
    const bool pad_end = num_frames == 1;
    const size_t num_keys = pad_end ? 2 : num_frames;
    std::vector<float> times;
    times.reserve(num_keys);
    for (const auto& frame : track.frames) {
        times.push_back(frame.time);
    }
    if (pad_end) {
        times.push_back(track.duration);
    }
    const int time_accessor = AddFloatAccessor(times, TINYGLTF_TYPE_SCALAR, num_keys, &model);
    model.accessors[time_accessor].minValues = {times.front()};
    model.accessors[time_accessor].maxValues = {times.back()};

    tinygltf::Animation animation;
    animation.name = track.name;

    for (int joint = 0; joint < num_joints; ++joint) {
        if (mapping.JointColumn(joint) < 0) {
            continue;
        }

        std::vector<float> rotations;
        rotations.reserve(num_keys * 4);
        for (const auto& frame : track.frames) {
            const ozz::math::Quaternion q = mapping.JointRotation(frame, joint);
            rotations.insert(rotations.end(), {q.x, q.y, q.z, q.w});
        }
        if (pad_end) {
            const ozz::math::Quaternion q = mapping.JointRotation(track.frames.back(), joint);
            rotations.insert(rotations.end(), {q.x, q.y, q.z, q.w});
        }

        tinygltf::AnimationSampler sampler;
        sampler.input = time_accessor;
        sampler.output = AddFloatAccessor(rotations, TINYGLTF_TYPE_VEC4, num_keys, &model);
        sampler.interpolation = "LINEAR";
        animation.samplers.push_back(sampler);

        tinygltf::AnimationChannel channel;
        channel.sampler = static_cast<int>(animation.samplers.size()) - 1;
        channel.target_node = joint;
        channel.target_path = "rotation";
        animation.channels.push_back(channel);

        if (joint == mapping.root_joint()) {
            std::vector<float> translations;
            translations.reserve(num_keys * 3);
            for (const auto& frame : track.frames) {
                const ozz::math::Float3 t = mapping.JointTranslation(frame, joint);
                translations.insert(translations.end(), {t.x, t.y, t.z});
            }
            if (pad_end) {
                const ozz::math::Float3 t = mapping.JointTranslation(track.frames.back(), joint);
                translations.insert(translations.end(), {t.x, t.y, t.z});
            }

            tinygltf::AnimationSampler t_sampler;
            t_sampler.input = time_accessor;
            t_sampler.output =
                AddFloatAccessor(translations, TINYGLTF_TYPE_VEC3, num_keys, &model);
            t_sampler.interpolation = "LINEAR";
            animation.samplers.push_back(t_sampler);

            tinygltf::AnimationChannel t_channel;
            t_channel.sampler = static_cast<int>(animation.samplers.size()) - 1;
            t_channel.target_node = joint;
            t_channel.target_path = "translation";
            animation.channels.push_back(t_channel);
        }
    }
    model.animations.push_back(animation);

    if (!CreateOutputDirectory(output_path, error)) {
        return false;
    }

    tinygltf::TinyGLTF writer;
    const bool is_binary = EndsWith(output_path, ".glb");
    const bool success = writer.WriteGltfSceneToFile(&model, output_path,
                                                     true,   // embed images
                                                     true,   // embed buffers
                                                     true,   // pretty print
                                                     is_binary);
    if (!success) {
        return Fail(error, ErrorKind::kIo, "failed to write glTF file: " + output_path);
    }

    ozz::log::Log() << "Saved glTF animation: " << output_path << " ("
                    << animation.channels.size() << " channels, " << num_frames
                    << " keyframes)" << std::endl;
    return true;
}

}  // namespace smplx
