#pragma once

#include "FootProcessor.hpp"
#include <string>
#include <vector>

namespace FootMeasure {

// Persists uploaded images under unique names inside one directory
class ImageStore {
public:
    explicit ImageStore(const std::string& uploadDirectory);

    const std::string& uploadDirectory() const { return m_uploadDirectory; }

    // captured_image_<32 hex digits>.<png|jpg>
    static std::string generateFilename(MimeType mimeType);

    // Returns the full path of the written file, throws std::runtime_error on failure
    std::string save(const std::vector<uchar>& bytes, MimeType mimeType) const;

private:
    std::string m_uploadDirectory;
};

} // namespace FootMeasure
