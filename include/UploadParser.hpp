#pragma once

#include "FootProcessor.hpp"
#include <optional>
#include <string>
#include <vector>

namespace FootMeasure {

enum class UploadError {
    None,
    MissingImage,
    UnsupportedType,
    MalformedPayload
};

struct ParsedUpload {
    UploadError error = UploadError::None;
    MimeType mimeType = MimeType::PNG;
    std::vector<uchar> bytes;

    bool ok() const { return error == UploadError::None; }
};

// Turns an upload request body into decoded image bytes.
// Accepted images are data URIs prefixed with data:image/png;base64, or data:image/jpeg;base64,
class UploadParser {
public:
    static std::optional<std::string> extractImageField(const std::string& jsonBody);
    static std::optional<MimeType> mimeTypeFromDataUri(const std::string& dataUri);
    static bool isValidBase64(const std::string& payload);
    static std::vector<uchar> decodeBase64(const std::string& payload);

    static ParsedUpload parseDataUri(const std::string& dataUri);
    static ParsedUpload parseRequest(const std::string& jsonBody);

    static const char* errorMessage(UploadError error);
};

} // namespace FootMeasure
