#include "UploadParser.hpp"
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>

using namespace std;
using json = nlohmann::json;

namespace FootMeasure {

namespace {

const string kPngPrefix = "data:image/png;base64,";
const string kJpegPrefix = "data:image/jpeg;base64,";

bool startsWith(const string& value, const string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool isBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

} // namespace

optional<string> UploadParser::extractImageField(const string& jsonBody) {
    try {
        json request = json::parse(jsonBody);
        if (!request.is_object()) {
            return nullopt;
        }

        // Only the top-level member counts, and it must be a string
        auto it = request.find("image");
        if (it == request.end() || !it->is_string()) {
            return nullopt;
        }
        return it->get<string>();
    }
    catch (const json::exception& ex) {
        cerr << "[ERROR] Failed to parse request body: " << ex.what() << endl;
        return nullopt;
    }
}

optional<MimeType> UploadParser::mimeTypeFromDataUri(const string& dataUri) {
    if (startsWith(dataUri, kPngPrefix)) {
        return MimeType::PNG;
    }
    if (startsWith(dataUri, kJpegPrefix)) {
        return MimeType::JPEG;
    }
    return nullopt;
}

bool UploadParser::isValidBase64(const string& payload) {
    if (payload.empty() || payload.size() % 4 != 0) {
        return false;
    }

    size_t padding = 0;
    while (padding < 2 && payload[payload.size() - 1 - padding] == '=') {
        padding++;
    }

    for (size_t i = 0; i < payload.size() - padding; i++) {
        if (!isBase64Char(payload[i])) {
            return false;
        }
    }
    return true;
}

vector<uchar> UploadParser::decodeBase64(const string& payload) {
    vector<uint8_t> decoded;
    CryptoPP::StringSource source(payload, true,
        new CryptoPP::Base64Decoder(new CryptoPP::StringSinkTemplate<vector<uint8_t>>(decoded)));
    return decoded;
}

ParsedUpload UploadParser::parseDataUri(const string& dataUri) {
    ParsedUpload upload;

    optional<MimeType> mimeType = mimeTypeFromDataUri(dataUri);
    if (!mimeType) {
        cerr << "[ERROR] Image type not allowed. Only PNG or JPEG are accepted." << endl;
        upload.error = UploadError::UnsupportedType;
        return upload;
    }
    upload.mimeType = *mimeType;

    const string& prefix = (upload.mimeType == MimeType::PNG) ? kPngPrefix : kJpegPrefix;
    string payload = dataUri.substr(prefix.size());
    if (!isValidBase64(payload)) {
        cerr << "[ERROR] Invalid image format." << endl;
        upload.error = UploadError::MalformedPayload;
        return upload;
    }

    upload.bytes = decodeBase64(payload);
    if (upload.bytes.empty()) {
        cerr << "[ERROR] Invalid image format." << endl;
        upload.error = UploadError::MalformedPayload;
        return upload;
    }

    cout << "[INFO] Image decoded successfully (" << upload.bytes.size() << " bytes, "
         << FootProcessor::mimeTypeName(upload.mimeType) << ")." << endl;
    return upload;
}

ParsedUpload UploadParser::parseRequest(const string& jsonBody) {
    optional<string> image = extractImageField(jsonBody);
    if (!image || image->empty()) {
        cout << "[WARN] Request without image data." << endl;
        ParsedUpload upload;
        upload.error = UploadError::MissingImage;
        return upload;
    }
    return parseDataUri(*image);
}

const char* UploadParser::errorMessage(UploadError error) {
    switch (error) {
        case UploadError::None: return "OK";
        case UploadError::MissingImage: return "No image provided.";
        case UploadError::UnsupportedType: return "Image type not allowed. Only PNG or JPEG are accepted.";
        case UploadError::MalformedPayload: return "Invalid image format.";
    }
    return "Unknown upload error.";
}

} // namespace FootMeasure
