#include "UploadService.hpp"
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using namespace std;
using namespace FootMeasure;

struct Arguments {
    string requestPath;         // Empty = read the request from stdin
    string uploadDirectory = "./uploads";
    bool quiet = false;
    bool valid = true;
};

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-r" || arg == "--request") && (i + 1 < argc)) {
            args.requestPath = argv[++i];
        } else if ((arg == "-u" || arg == "--upload-dir") && (i + 1 < argc)) {
            args.uploadDirectory = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else {
            args.valid = false;
        }
    }

    return args;
}

void printUsage(const char* progName) {
    cout << "FootMeasure upload - Process one image upload request\n"
         << "\n"
         << "Usage: " << progName << " [-r <request.json>] [-u <upload_dir>] [-q]\n"
         << "\n"
         << "Options:\n"
         << "  -r, --request     JSON request file with an \"image\" data URI (default: stdin)\n"
         << "  -u, --upload-dir  Directory where uploaded images are stored (default: ./uploads)\n"
         << "  -q, --quiet       Only print the response\n"
         << "\n"
         << "The response status code and JSON body are printed to stdout.\n"
         << endl;
}

int main(int argc, char* argv[]) {
    Arguments args = parseArguments(argc, argv);

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    string requestBody;
    if (args.requestPath.empty()) {
        requestBody.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    } else {
        ifstream in(args.requestPath, ios::binary);
        if (!in.good()) {
            cerr << "[ERROR] Request file does not exist or is not readable: " << args.requestPath << endl;
            return 1;
        }
        requestBody.assign(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
    }

    // Keep stdout for the response when quiet
    ostringstream discarded;
    streambuf* originalCout = nullptr;
    if (args.quiet) {
        originalCout = cout.rdbuf(discarded.rdbuf());
    }

    UploadResponse response;
    try {
        UploadConfig config;
        config.uploadDirectory = args.uploadDirectory;
        config.processing.verboseOutput = !args.quiet;

        UploadService service(config);
        response = service.handleUpload(requestBody);
    } catch (const exception& e) {
        cerr << "[ERROR] Could not start upload service: " << e.what() << endl;
        response = UploadService::messageResponse(500, "Error processing the image.");
    }

    if (originalCout) {
        cout.rdbuf(originalCout);
    }

    cout << response.status << endl;
    cout << response.body << endl;

    return response.status == 200 ? 0 : 1;
}
