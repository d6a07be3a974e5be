// smplx2ozz - Convert SMPL-X pose parameter sequences to skeleton animations
//
// Usage:
//   smplx2ozz --input=poses.json --skeleton=smplx.ozz --output=clip.ozz
//   smplx2ozz --input=frames/ --skeleton=smplx.ozz --output=clip.glb --fps-target=10

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "ozz/animation/runtime/skeleton.h"
#include "ozz/base/log.h"

#include "conversion_options.h"
#include "gltf_exporter.h"
#include "ozz_exporter.h"
#include "pose_converter.h"
#include "pose_loader.h"
#include "skeleton_loader.h"

namespace {

bool Run(const smplx::ConversionOptions& options, smplx::ConversionError* error) {
    smplx::OutputFormat format;
    if (!smplx::GetOutputFormat(options.output_path, &format, error)) {
        return false;
    }

    const auto start = std::chrono::steady_clock::now();

    std::vector<smplx::RawPoseRecord> records;
    if (!smplx::LoadPoseRecords(options.input_path, &records, error)) {
        return false;
    }
    ozz::log::Log() << "Loaded " << records.size() << " poses from " << options.input_path
                    << std::endl;

    ozz::animation::Skeleton skeleton;
    if (!smplx::LoadSkeleton(options.skeleton_path, &skeleton, error)) {
        return false;
    }
    ozz::log::Log() << "Loaded skeleton: " << skeleton.num_joints() << " joints" << std::endl;

    smplx::SkeletonBinding binding;
    std::vector<int> slot_to_joint;
    if (!smplx::BindSkeleton(skeleton, options.joint_prefix, &binding, &slot_to_joint, error)) {
        return false;
    }

    smplx::ConversionSettings settings = options.ToSettings();
    if (options.name.empty()) {
        settings.name = std::filesystem::path(options.input_path).stem().string();
    }

    smplx::AnimationTrack track;
    if (!smplx::ConvertPoseRecords(records, binding, settings, &track, error)) {
        return false;
    }

    bool exported = false;
    if (format == smplx::OutputFormat::kOzz) {
        exported = smplx::ExportOzzAnimation(track, skeleton, slot_to_joint,
                                             options.output_path, error);
    } else {
        exported = smplx::ExportGltfAnimation(track, skeleton, slot_to_joint,
                                              options.output_path, error);
    }
    if (!exported) {
        return false;
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    ozz::log::Log() << "Processed " << records.size() << " poses into " << track.frame_count()
                    << " frames at " << track.frame_rate << " fps in " << elapsed.count()
                    << "s" << std::endl;
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    smplx::ConversionOptions options;
    smplx::ConversionError error;

    if (!smplx::ParseCommandLine(argc, argv, &options, &error)) {
        ozz::log::Err() << error.ToString() << std::endl;
        smplx::PrintUsage(argv[0]);
        return 1;
    }
    if (options.help) {
        smplx::PrintUsage(argv[0]);
        return 0;
    }

    ozz::log::SetLevel(options.verbose ? ozz::log::kVerbose : ozz::log::kStandard);

    if (!smplx::ValidateOptions(options, &error)) {
        ozz::log::Err() << error.ToString() << std::endl;
        smplx::PrintUsage(argv[0]);
        return 1;
    }

    if (!Run(options, &error)) {
        ozz::log::Err() << error.ToString() << std::endl;
        return 1;
    }
    return 0;
}
