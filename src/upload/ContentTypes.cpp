#include "upload/ContentTypes.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace mpupload {

namespace {
    const std::unordered_map<std::string, std::string>& extensionTable() {
        static const std::unordered_map<std::string, std::string> table = {
            // Images
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"png", "image/png"},
            {"gif", "image/gif"},
            {"webp", "image/webp"},
            {"bmp", "image/bmp"},
            {"heic", "image/heic"},
            {"heif", "image/heif"},
            {"tif", "image/tiff"},
            {"tiff", "image/tiff"},
            {"svg", "image/svg+xml"},
            {"ico", "image/vnd.microsoft.icon"},
            // Video
            {"mp4", "video/mp4"},
            {"mov", "video/quicktime"},
            {"webm", "video/webm"},
            {"mkv", "video/x-matroska"},
            // Audio
            {"mp3", "audio/mpeg"},
            {"wav", "audio/wav"},
            {"ogg", "audio/ogg"},
            {"m4a", "audio/mp4"},
            // Documents and archives
            {"pdf", "application/pdf"},
            {"txt", "text/plain"},
            {"csv", "text/csv"},
            {"json", "application/json"},
            {"xml", "application/xml"},
            {"html", "text/html"},
            {"htm", "text/html"},
            {"zip", "application/zip"},
            {"gz", "application/gzip"},
            {"tar", "application/x-tar"},
        };
        return table;
    }
}

std::string ContentTypes::lookup(const std::string& filename) {
    size_t lastSlash = filename.find_last_of("/\\");
    size_t dotPos = filename.find_last_of('.');

    if (dotPos == std::string::npos || dotPos == filename.length() - 1 ||
        (lastSlash != std::string::npos && dotPos < lastSlash)) {
        return kDefault;
    }

    std::string extension = filename.substr(dotPos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = extensionTable().find(extension);
    return it != extensionTable().end() ? it->second : kDefault;
}

} // namespace mpupload
