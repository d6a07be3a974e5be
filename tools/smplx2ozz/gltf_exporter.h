// Keyframe track export to glTF

#ifndef SMPLX_GLTF_EXPORTER_H_
#define SMPLX_GLTF_EXPORTER_H_

#include <string>
#include <vector>

#include "ozz/animation/runtime/skeleton.h"

#include "conversion_error.h"
#include "keyframe_track.h"

namespace smplx {

// Writes the skeleton as a node hierarchy with a skin, plus one animation
// holding a rotation channel per bound joint and a translation channel for
// the root. Output format is determined by extension: .gltf (JSON) or .glb
// (binary).
bool ExportGltfAnimation(const AnimationTrack& track,
                         const ozz::animation::Skeleton& skeleton,
                         const std::vector<int>& slot_to_joint,
                         const std::string& output_path,
                         ConversionError* error);

}  // namespace smplx

#endif  // SMPLX_GLTF_EXPORTER_H_
