// conversion_options.h - Command line and JSON configuration of smplx2ozz
#pragma once

#include <string>

#include "conversion_error.h"
#include "pose_converter.h"

namespace smplx {

enum class OutputFormat {
    kOzz,   // ozz::animation::Animation archive
    kGltf,  // glTF JSON
    kGlb    // glTF binary
};

struct ConversionOptions {
    std::string input_path;
    std::string output_path;
    std::string skeleton_path;
    int source_rate = 30;
    int target_rate = 30;
    bool center_on_origin = true;
    std::string joint_prefix;  // Prepended to every SMPL-X joint name
    std::string name;          // Animation name, defaults to the input stem
    bool verbose = false;
    bool help = false;

    ConversionSettings ToSettings() const;
};

// Reads a JSON object with the keys input, output, skeleton, source_rate,
// target_rate, center_on_origin, joint_prefix and name. Keys that are absent
// keep their current value in |options|.
bool ParseOptionsJson(const std::string& json_text, const std::string& source,
                      ConversionOptions* options, ConversionError* error);

bool LoadOptionsFile(const std::string& path, ConversionOptions* options,
                     ConversionError* error);

// Parses --key=value flags in order. --config=FILE is applied where it
// appears, so later flags override the file.
bool ParseCommandLine(int argc, const char* const* argv, ConversionOptions* options,
                      ConversionError* error);

// Checks required paths, rates and the output extension.
bool ValidateOptions(const ConversionOptions& options, ConversionError* error);

// Output format from the file extension (.ozz, .gltf or .glb).
bool GetOutputFormat(const std::string& path, OutputFormat* format, ConversionError* error);

void PrintUsage(const char* program);

}  // namespace smplx
