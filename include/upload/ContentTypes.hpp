#pragma once

#include <string>

namespace mpupload {

class ContentTypes {
public:
    static constexpr const char* kDefault = "application/octet-stream";

    // MIME type for a file name or path, by extension (case-insensitive).
    // Unknown or missing extensions map to kDefault.
    static std::string lookup(const std::string& filename);
};

} // namespace mpupload
