#include <iostream>
#include <string>
#include <vector>
#include <curl/curl.h>

#include "config/UploaderConfig.hpp"
#include "http/CurlTransport.hpp"
#include "client/UploadCoordinatorClient.hpp"
#include "client/PartUploader.hpp"
#include "upload/BatchUploadManager.hpp"

using namespace mpupload;

namespace {

class ConsoleObserver : public BatchObserver {
public:
    void onStatusChanged(size_t index, const BatchEntry& entry) override {
        std::cout << "[" << (index + 1) << "] " << entry.target.name() << ": "
                  << entry.status;
        if (isTerminal(entry.state)) {
            std::cout << " (" << to_string(entry.state) << ")";
        }
        std::cout << std::endl;
    }

    void onInProgressChanged(bool inProgress) override {
        std::cout << (inProgress ? "Uploading..." : "Idle") << std::endl;
    }
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--url BASE_URL] FILE..." << std::endl;
}

}

int main(int argc, char** argv)
{
    std::string configPath;
    std::string urlOverride;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--url" && i + 1 < argc) {
            urlOverride = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    UploaderConfig config;
    try {
        if (!configPath.empty()) {
            config = UploaderConfig::loadFromFile(configPath);
        }
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 2;
    }
    if (!urlOverride.empty()) {
        config.backendUrl = urlOverride;
    }

    std::vector<UploadTarget> targets;
    for (const auto& path : paths) {
        try {
            targets.push_back(UploadTarget::fromFile(path));
        } catch (const std::exception& e) {
            std::cerr << "Cannot select " << path << ": " << e.what() << std::endl;
            return 2;
        }
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl" << std::endl;
        return 1;
    }

    std::cout << "Backend: " << config.backendUrl << ", chunk size " << config.chunkSize
              << " bytes" << std::endl;

    http::CurlTransport transport(config.requestTimeoutSeconds, config.connectTimeoutSeconds);
    UploadCoordinatorClient coordinator(transport, config.backendUrl);
    PartUploader uploader(transport);
    ConsoleObserver observer;

    std::vector<FileOutcome> outcomes;
    try {
        BatchUploadManager manager(coordinator, uploader, SessionOptions::fromConfig(config));
        manager.addObserver(observer);
        outcomes = manager.uploadAll(targets);
        manager.removeObserver(observer);
    } catch (const std::exception& e) {
        std::cerr << "Upload aborted: " << e.what() << std::endl;
        curl_global_cleanup();
        return 1;
    }

    curl_global_cleanup();

    bool allDone = true;
    for (const auto& outcome : outcomes) {
        std::cout << outcome.name << ": " << outcome.status << std::endl;
        allDone = allDone && outcome.succeeded();
    }
    return allDone ? 0 : 1;
}
