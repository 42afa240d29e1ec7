#include "ImageStore.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace FootMeasure {

ImageStore::ImageStore(const string& uploadDirectory)
    : m_uploadDirectory(uploadDirectory) {
    if (m_uploadDirectory.empty()) {
        throw invalid_argument("Upload directory cannot be empty");
    }

    error_code ec;
    if (filesystem::is_directory(m_uploadDirectory, ec)) {
        cout << "[INFO] Using existing upload directory: " << m_uploadDirectory << endl;
        return;
    }

    if (!filesystem::create_directories(m_uploadDirectory, ec) || ec) {
        throw runtime_error("Failed to create upload directory " + m_uploadDirectory + ": " + ec.message());
    }
    cout << "[INFO] Upload directory created at " << m_uploadDirectory << endl;
}

string ImageStore::generateFilename(MimeType mimeType) {
    thread_local mt19937 gen{random_device{}()};
    uniform_int_distribution<int> dis(0, 15);
    static const char* hex = "0123456789abcdef";

    string name = "captured_image_";
    for (int i = 0; i < 32; i++) {
        name += hex[dis(gen)];
    }
    name += (mimeType == MimeType::JPEG) ? ".jpg" : ".png";
    return name;
}

string ImageStore::save(const vector<uchar>& bytes, MimeType mimeType) const {
    string filePath = (filesystem::path(m_uploadDirectory) / generateFilename(mimeType)).string();

    {
        ofstream out(filePath, ios::binary);
        if (!out) {
            cerr << "[ERROR] Could not open " << filePath << " for writing" << endl;
            throw runtime_error("Error saving the image.");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<streamsize>(bytes.size()));
        if (!out) {
            cerr << "[ERROR] Short write to " << filePath << endl;
            throw runtime_error("Error saving the image.");
        }
    }

    // Verify the image was saved correctly
    error_code ec;
    if (!filesystem::exists(filePath, ec) || filesystem::file_size(filePath, ec) != bytes.size() || ec) {
        cerr << "[ERROR] Error saving the image." << endl;
        throw runtime_error("Error saving the image.");
    }

    cout << "[INFO] Image saved to " << filePath << endl;
    return filePath;
}

} // namespace FootMeasure
