#include "UploadService.hpp"
#include "UploadParser.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace std;
using json = nlohmann::json;

namespace FootMeasure {

UploadService::UploadService(const UploadConfig& config)
    : m_config(config), m_store(config.uploadDirectory) {
}

UploadResponse UploadService::messageResponse(int status, const string& message) {
    UploadResponse response;
    response.status = status;
    response.body = json{{"message", message}}.dump();
    return response;
}

UploadResponse UploadService::toResponse(const MeasurementResult& result) {
    switch (result.status) {
        case MeasurementStatus::Success: {
            // Written by hand so the length always carries two decimals
            ostringstream oss;
            oss << R"({"message":"Image processed successfully!","foot_size_cm":)"
                << fixed << setprecision(2) << result.lengthCm << "}";
            UploadResponse response;
            response.status = 200;
            response.body = oss.str();
            return response;
        }
        case MeasurementStatus::NoContourFound:
            return messageResponse(400, "Could not detect the foot in the image.");
        case MeasurementStatus::DecodeError:
            return messageResponse(400, "Could not decode the image.");
        case MeasurementStatus::InternalError:
            break;
    }
    return messageResponse(500, "Error processing the image.");
}

UploadResponse UploadService::handleUpload(const string& requestBody) const {
    try {
        ParsedUpload upload = UploadParser::parseRequest(requestBody);
        if (!upload.ok()) {
            return messageResponse(400, UploadParser::errorMessage(upload.error));
        }

        try {
            m_store.save(upload.bytes, upload.mimeType);
        } catch (const runtime_error& e) {
            cerr << "[ERROR] " << e.what() << endl;
            return messageResponse(500, "Error saving the image.");
        }

        MeasurementResult result = FootProcessor::measureFoot(upload.bytes, upload.mimeType, m_config.processing);
        if (result.ok()) {
            cout << "[INFO] Foot size calculated successfully: " << result.lengthCm << " cm" << endl;
        } else {
            cout << "[WARN] Measurement failed (" << FootProcessor::statusName(result.status) << "): "
                 << result.message << endl;
        }
        return toResponse(result);

    } catch (const exception& e) {
        cerr << "[ERROR] Error processing the request: " << e.what() << endl;
        return messageResponse(500, "Error processing the image.");
    }
}

} // namespace FootMeasure
