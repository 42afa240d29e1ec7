#pragma once

#include "FootProcessor.hpp"
#include "ImageStore.hpp"
#include <string>

namespace FootMeasure {

struct UploadConfig {
    std::string uploadDirectory = "./uploads";
    FootProcessor::ProcessingParams processing;
};

struct UploadResponse {
    int status = 500;
    std::string body;           // JSON object
};

// Handles one upload request end to end: ingestion, storage, measurement and response mapping
class UploadService {
public:
    explicit UploadService(const UploadConfig& config);

    UploadResponse handleUpload(const std::string& requestBody) const;

    const ImageStore& store() const { return m_store; }

    static UploadResponse toResponse(const MeasurementResult& result);
    static UploadResponse messageResponse(int status, const std::string& message);

private:
    UploadConfig m_config;
    ImageStore m_store;
};

} // namespace FootMeasure
