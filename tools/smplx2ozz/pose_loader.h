// pose_loader.h - Reads SMPL-X pose records from JSON files
#pragma once

#include <string>
#include <vector>

#include "conversion_error.h"
#include "pose_sample.h"

namespace smplx {

// Parses JSON text holding either {"frames": [record, ...]}, a top-level
// array of records, or one record object. Records are appended to |records|;
// |source| names the origin in error messages and in RawPoseRecord::source.
bool ParsePoseRecords(const std::string& json_text, const std::string& source,
                      std::vector<RawPoseRecord>* records, ConversionError* error);

// Loads a single JSON file.
bool LoadPoseFile(const std::string& path, std::vector<RawPoseRecord>* records,
                  ConversionError* error);

// Loads every *.json file of a directory in file name order, one or more
// records per file.
bool LoadPoseDirectory(const std::string& directory, std::vector<RawPoseRecord>* records,
                       ConversionError* error);

// Dispatches to LoadPoseDirectory or LoadPoseFile depending on |path|.
bool LoadPoseRecords(const std::string& path, std::vector<RawPoseRecord>* records,
                     ConversionError* error);

}  // namespace smplx
