// conversion_options.cc - Option parsing
#include "conversion_options.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace smplx {

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool ParseInt(const std::string& text, const char* option, int* value, ConversionError* error) {
    size_t consumed = 0;
    try {
        *value = std::stoi(text, &consumed);
    } catch (const std::invalid_argument&) {
        consumed = 0;
    } catch (const std::out_of_range&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        return Fail(error, ErrorKind::kConfiguration,
                    std::string(option) + " expects an integer, got '" + text + "'");
    }
    return true;
}

bool ParseBool(const std::string& text, const char* option, bool* value, ConversionError* error) {
    if (text == "true" || text == "1" || text == "yes") {
        *value = true;
        return true;
    }
    if (text == "false" || text == "0" || text == "no") {
        *value = false;
        return true;
    }
    return Fail(error, ErrorKind::kConfiguration,
                std::string(option) + " expects true or false, got '" + text + "'");
}

bool ReadString(const json& config, const char* key, std::string* value, ConversionError* error) {
    if (!config.contains(key)) {
        return true;
    }
    if (!config.at(key).is_string()) {
        return Fail(error, ErrorKind::kConfiguration, std::string("'") + key + "' must be a string");
    }
    *value = config.at(key).get<std::string>();
    return true;
}

bool ReadInt(const json& config, const char* key, int* value, ConversionError* error) {
    if (!config.contains(key)) {
        return true;
    }
    if (!config.at(key).is_number_integer()) {
        return Fail(error, ErrorKind::kConfiguration, std::string("'") + key + "' must be an integer");
    }
    const int64_t wide = config.at(key).get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return Fail(error, ErrorKind::kConfiguration, std::string("'") + key + "' is out of range");
    }
    *value = static_cast<int>(wide);
    return true;
}

bool ReadBool(const json& config, const char* key, bool* value, ConversionError* error) {
    if (!config.contains(key)) {
        return true;
    }
    if (!config.at(key).is_boolean()) {
        return Fail(error, ErrorKind::kConfiguration, std::string("'") + key + "' must be a boolean");
    }
    *value = config.at(key).get<bool>();
    return true;
}

}  // namespace

ConversionSettings ConversionOptions::ToSettings() const {
    ConversionSettings settings;
    settings.source_rate = source_rate;
    settings.target_rate = target_rate;
    settings.center_on_origin = center_on_origin;
    if (!name.empty()) {
        settings.name = name;
    }
    return settings;
}

bool ParseOptionsJson(const std::string& json_text, const std::string& source,
                      ConversionOptions* options, ConversionError* error) {
    json config;
    try {
        config = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Fail(error, ErrorKind::kIo, source + ": JSON parse error: " + e.what());
    }
    if (!config.is_object()) {
        return Fail(error, ErrorKind::kConfiguration, source + ": config must be a JSON object");
    }

    ConversionError field_error;
    if (!ReadString(config, "input", &options->input_path, &field_error) ||
        !ReadString(config, "output", &options->output_path, &field_error) ||
        !ReadString(config, "skeleton", &options->skeleton_path, &field_error) ||
        !ReadInt(config, "source_rate", &options->source_rate, &field_error) ||
        !ReadInt(config, "target_rate", &options->target_rate, &field_error) ||
        !ReadBool(config, "center_on_origin", &options->center_on_origin, &field_error) ||
        !ReadString(config, "joint_prefix", &options->joint_prefix, &field_error) ||
        !ReadString(config, "name", &options->name, &field_error)) {
        return Fail(error, field_error.kind, source + ": " + field_error.message);
    }
    return true;
}

bool LoadOptionsFile(const std::string& path, ConversionOptions* options,
                     ConversionError* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Fail(error, ErrorKind::kIo, "failed to open config file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return ParseOptionsJson(buffer.str(), path, options, error);
}

bool ParseCommandLine(int argc, const char* const* argv, ConversionOptions* options,
                      ConversionError* error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options->help = true;
        } else if (arg == "--verbose") {
            options->verbose = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            if (!LoadOptionsFile(arg.substr(9), options, error)) {
                return false;
            }
        } else if (arg.rfind("--input=", 0) == 0) {
            options->input_path = arg.substr(8);
        } else if (arg.rfind("--output=", 0) == 0) {
            options->output_path = arg.substr(9);
        } else if (arg.rfind("--skeleton=", 0) == 0) {
            options->skeleton_path = arg.substr(11);
        } else if (arg.rfind("--fps-source=", 0) == 0) {
            if (!ParseInt(arg.substr(13), "--fps-source", &options->source_rate, error)) {
                return false;
            }
        } else if (arg.rfind("--fps-target=", 0) == 0) {
            if (!ParseInt(arg.substr(13), "--fps-target", &options->target_rate, error)) {
                return false;
            }
        } else if (arg.rfind("--center-on-origin=", 0) == 0) {
            if (!ParseBool(arg.substr(19), "--center-on-origin", &options->center_on_origin, error)) {
                return false;
            }
        } else if (arg.rfind("--joint-prefix=", 0) == 0) {
            options->joint_prefix = arg.substr(15);
        } else if (arg.rfind("--name=", 0) == 0) {
            options->name = arg.substr(7);
        } else {
            return Fail(error, ErrorKind::kConfiguration, "unknown option: " + arg);
        }
    }
    return true;
}

bool ValidateOptions(const ConversionOptions& options, ConversionError* error) {
    if (options.input_path.empty()) {
        return Fail(error, ErrorKind::kConfiguration, "missing --input");
    }
    if (options.output_path.empty()) {
        return Fail(error, ErrorKind::kConfiguration, "missing --output");
    }
    if (options.skeleton_path.empty()) {
        return Fail(error, ErrorKind::kConfiguration, "missing --skeleton");
    }
    if (options.source_rate <= 0) {
        return Fail(error, ErrorKind::kConfiguration, "source_rate must be positive");
    }
    if (options.target_rate <= 0) {
        return Fail(error, ErrorKind::kConfiguration, "target_rate must be positive");
    }
    OutputFormat format;
    return GetOutputFormat(options.output_path, &format, error);
}

bool GetOutputFormat(const std::string& path, OutputFormat* format, ConversionError* error) {
    if (EndsWith(path, ".ozz")) {
        *format = OutputFormat::kOzz;
    } else if (EndsWith(path, ".gltf")) {
        *format = OutputFormat::kGltf;
    } else if (EndsWith(path, ".glb")) {
        *format = OutputFormat::kGlb;
    } else {
        return Fail(error, ErrorKind::kConfiguration,
                    "invalid output format (must be .ozz, .gltf or .glb): " + path);
    }
    return true;
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Convert SMPL-X pose parameters to a keyframed skeleton animation.\n"
              << "\n"
              << "Options:\n"
              << "  --input=PATH             Pose file (.json) or directory of per-frame files\n"
              << "  --output=FILE            Output animation (.ozz, .gltf or .glb)\n"
              << "  --skeleton=FILE          Target SMPL-X skeleton (.ozz)\n"
              << "  --config=FILE            JSON file with any of the options below\n"
              << "  --fps-source=N           Source framerate (default: 30)\n"
              << "  --fps-target=N           Target framerate, at most the source (default: 30)\n"
              << "  --center-on-origin=BOOL  Start animation centered above origin (default: true)\n"
              << "  --joint-prefix=S         Prefix of the skeleton's joint names (default: none)\n"
              << "  --name=S                 Animation name (default: input file name)\n"
              << "  --verbose                Verbose logging\n"
              << "  --help                   Show this help message\n";
}

}  // namespace smplx
