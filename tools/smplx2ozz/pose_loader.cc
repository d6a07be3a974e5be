// pose_loader.cc - JSON pose record loading
#include "pose_loader.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "ozz/base/log.h"

using json = nlohmann::json;

namespace smplx {

namespace {

const char* const kRecordKeys[] = {
    "global_orient", "body_pose", "left_hand_pose", "right_hand_pose", "transl"};

// Flattens nested number arrays row-major ((1, 21, 3) -> 63 values). A flat
// array may hold any count, nested arrays must end in rows of 3.
bool FlattenNumbers(const json& value, bool nested, std::vector<float>* out) {
    if (!value.is_array() || value.empty()) {
        return false;
    }
    if (value[0].is_number()) {
        if (nested && value.size() != 3) {
            return false;
        }
        for (const auto& item : value) {
            if (!item.is_number()) {
                return false;
            }
            out->push_back(item.get<float>());
        }
        return true;
    }
    for (const auto& item : value) {
        if (!FlattenNumbers(item, true, out)) {
            return false;
        }
    }
    return true;
}

bool ParseRecord(const json& object, const std::string& label, RawPoseRecord* record,
                 ConversionError* error) {
    if (!object.is_object()) {
        return Fail(error, ErrorKind::kIo, label + ": pose record must be a JSON object");
    }

    std::vector<float>* fields[] = {
        &record->global_orient, &record->body_pose, &record->left_hand_pose,
        &record->right_hand_pose, &record->transl};

    for (size_t i = 0; i < 5; ++i) {
        const char* key = kRecordKeys[i];
        if (!object.contains(key)) {
            return Fail(error, ErrorKind::kIo, label + ": missing '" + key + "'");
        }
        fields[i]->clear();
        if (!FlattenNumbers(object.at(key), false, fields[i])) {
            return Fail(error, ErrorKind::kIo,
                        label + ": '" + key + "' must be a number array with rows of 3");
        }
    }
    record->source = label;
    return true;
}

bool ReadFile(const std::string& path, std::string* contents, ConversionError* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Fail(error, ErrorKind::kIo, "failed to open pose file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    *contents = buffer.str();
    return true;
}

}  // namespace

bool ParsePoseRecords(const std::string& json_text, const std::string& source,
                      std::vector<RawPoseRecord>* records, ConversionError* error) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Fail(error, ErrorKind::kIo, source + ": JSON parse error: " + e.what());
    }

    const json* frames = nullptr;
    if (document.is_object() && document.contains("frames")) {
        frames = &document["frames"];
        if (!frames->is_array()) {
            return Fail(error, ErrorKind::kIo, source + ": 'frames' must be an array");
        }
    } else if (document.is_array()) {
        frames = &document;
    }

    std::vector<RawPoseRecord> parsed;
    if (frames) {
        for (size_t i = 0; i < frames->size(); ++i) {
            std::ostringstream label;
            label << source << "[" << i << "]";
            RawPoseRecord record;
            if (!ParseRecord((*frames)[i], label.str(), &record, error)) {
                return false;
            }
            parsed.push_back(record);
        }
    } else {
        RawPoseRecord record;
        if (!ParseRecord(document, source, &record, error)) {
            return false;
        }
        parsed.push_back(record);
    }

    records->insert(records->end(), parsed.begin(), parsed.end());
    return true;
}

bool LoadPoseFile(const std::string& path, std::vector<RawPoseRecord>* records,
                  ConversionError* error) {
    std::string contents;
    if (!ReadFile(path, &contents, error)) {
        return false;
    }
    return ParsePoseRecords(contents, path, records, error);
}

bool LoadPoseDirectory(const std::string& directory, std::vector<RawPoseRecord>* records,
                       ConversionError* error) {
    namespace fs = std::filesystem;

    std::error_code ec;
    std::vector<fs::path> files;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == ".json") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Fail(error, ErrorKind::kIo,
                    "failed to list pose directory " + directory + ": " + ec.message());
    }
    if (files.empty()) {
        return Fail(error, ErrorKind::kIo, "no .json pose files in " + directory);
    }

    // Frame order is the file name order
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    std::vector<RawPoseRecord> loaded;
    for (const auto& file : files) {
        if (!LoadPoseFile(file.string(), &loaded, error)) {
            return false;
        }
    }

    ozz::log::LogV() << "Loaded " << loaded.size() << " pose records from " << files.size()
                     << " files in " << directory << std::endl;
    records->insert(records->end(), loaded.begin(), loaded.end());
    return true;
}

bool LoadPoseRecords(const std::string& path, std::vector<RawPoseRecord>* records,
                     ConversionError* error) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return LoadPoseDirectory(path, records, error);
    }
    if (!std::filesystem::exists(path, ec)) {
        return Fail(error, ErrorKind::kIo, "invalid input path: " + path);
    }
    return LoadPoseFile(path, records, error);
}

}  // namespace smplx
