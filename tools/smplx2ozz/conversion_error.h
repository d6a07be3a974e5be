// Error reporting shared by the smplx2ozz conversion stages

#ifndef SMPLX_CONVERSION_ERROR_H_
#define SMPLX_CONVERSION_ERROR_H_

#include <string>

namespace smplx {

enum class ErrorKind {
    kNone,
    kNumeric,        // Non-finite rotation vector
    kShapeMismatch,  // Record arrays with unexpected lengths, empty sequence
    kConfiguration,  // Invalid rates, option values or output format
    kUnknownJoint,   // Binding joint name missing from the target skeleton
    kIo              // Unreadable or unparsable file, failed write
};

inline const char* ErrorKindName(ErrorKind kind);

// Filled by the conversion functions when they return false.
struct ConversionError {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;

    void Set(ErrorKind _kind, const std::string& _message) {
        kind = _kind;
        message = _message;
    }

    bool ok() const { return kind == ErrorKind::kNone; }

    // "ShapeMismatchError: record 3: body_pose has 60 values, expected 63"
    std::string ToString() const {
        return std::string(ErrorKindName(kind)) + ": " + message;
    }
};

// Sets the error when the caller provided one. Always returns false so that
// call sites can write `return Fail(error, ...);`.
inline bool Fail(ConversionError* error, ErrorKind kind, const std::string& message) {
    if (error) {
        error->Set(kind, message);
    }
    return false;
}

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "None";
        case ErrorKind::kNumeric: return "NumericError";
        case ErrorKind::kShapeMismatch: return "ShapeMismatchError";
        case ErrorKind::kConfiguration: return "ConfigurationError";
        case ErrorKind::kUnknownJoint: return "UnknownJointError";
        case ErrorKind::kIo: return "IoError";
    }
    return "Unknown";
}

}  // namespace smplx

#endif  // SMPLX_CONVERSION_ERROR_H_
