#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace modelseal {

enum class ErrorCode : int {
    kDecodeError = 1,
    kMissingReference = 2,
    kUnresolvableArtifact = 3,
    kPartialHashFailure = 4,
    kUnsupportedAlgorithm = 5,
    kMalformedManifest = 6,
    kInvalidKeyMaterial = 7,
    kIoError = 8,
    kInvalidArgument = 9,
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::kDecodeError:
            return "DECODE_ERROR";
        case ErrorCode::kMissingReference:
            return "MISSING_REFERENCE";
        case ErrorCode::kUnresolvableArtifact:
            return "UNRESOLVABLE_ARTIFACT";
        case ErrorCode::kPartialHashFailure:
            return "PARTIAL_HASH_FAILURE";
        case ErrorCode::kUnsupportedAlgorithm:
            return "UNSUPPORTED_ALGORITHM";
        case ErrorCode::kMalformedManifest:
            return "MALFORMED_MANIFEST";
        case ErrorCode::kInvalidKeyMaterial:
            return "INVALID_KEY_MATERIAL";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

// Single exception type for every fault raised by the library.
// path() is empty when the error is not tied to a file.
class SealError : public std::runtime_error {
public:
    SealError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    SealError(ErrorCode code, const std::string& message, std::filesystem::path path)
        : std::runtime_error(message + ": " + path.string()), code_(code), path_(std::move(path)) {}

    ErrorCode code() const { return code_; }
    const std::filesystem::path& path() const { return path_; }

private:
    ErrorCode code_;
    std::filesystem::path path_;
};

}  // namespace modelseal
