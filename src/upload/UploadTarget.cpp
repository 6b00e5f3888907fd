#include "upload/UploadTarget.hpp"
#include "upload/ContentTypes.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace mpupload {

namespace {
    void checkRange(uint64_t start, uint64_t end, uint64_t size) {
        if (start > end || end > size) {
            throw std::runtime_error("Invalid byte range [" + std::to_string(start) + ", " +
                                     std::to_string(end) + ") for source of " +
                                     std::to_string(size) + " bytes");
        }
    }
}

FileByteSource::FileByteSource(const std::string& path) : path_(path), size_(0) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw std::runtime_error("File not found: " + path_);
    }

    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot read file size: " + path_ + " (" + ec.message() + ")");
    }
}

std::string FileByteSource::read(uint64_t start, uint64_t end) const {
    checkRange(start, end, size_);

    std::ifstream inFile(path_, std::ios::binary);
    if (!inFile) {
        throw std::runtime_error("Failed to open file: " + path_ + " (" + strerror(errno) + ")");
    }

    std::string content(static_cast<size_t>(end - start), '\0');
    if (content.empty()) {
        return content;
    }

    inFile.seekg(static_cast<std::streamoff>(start));
    inFile.read(&content[0], static_cast<std::streamsize>(content.size()));
    if (inFile.gcount() != static_cast<std::streamsize>(content.size())) {
        throw std::runtime_error("Short read from " + path_ + " at offset " +
                                 std::to_string(start));
    }

    return content;
}

std::string MemoryByteSource::read(uint64_t start, uint64_t end) const {
    checkRange(start, end, content_.size());
    return content_.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}

UploadTarget::UploadTarget(const std::string& name, const std::string& contentType,
                           std::shared_ptr<const ByteSource> source)
    : name_(name), contentType_(contentType), source_(std::move(source)) {
    if (!source_) {
        throw std::invalid_argument("UploadTarget requires a byte source");
    }
}

UploadTarget UploadTarget::fromFile(const std::string& path) {
    auto source = std::make_shared<FileByteSource>(path);
    std::string name = std::filesystem::path(path).filename().string();
    return UploadTarget(name, ContentTypes::lookup(name), source);
}

UploadTarget UploadTarget::fromBytes(const std::string& name, std::string content,
                                     const std::string& contentType) {
    auto source = std::make_shared<MemoryByteSource>(std::move(content));
    return UploadTarget(name, contentType.empty() ? ContentTypes::lookup(name) : contentType,
                        source);
}

} // namespace mpupload
