#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace mpupload {

// Random-access source of bytes
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual uint64_t size() const = 0;

    // Reads [start, end). Throws std::runtime_error on I/O failure or a bad range.
    virtual std::string read(uint64_t start, uint64_t end) const = 0;
};

// Reads ranges of a file on disk; the size is captured at construction
class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(const std::string& path);

    uint64_t size() const override { return size_; }
    std::string read(uint64_t start, uint64_t end) const override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    uint64_t size_;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::string content) : content_(std::move(content)) {}

    uint64_t size() const override { return content_.size(); }
    std::string read(uint64_t start, uint64_t end) const override;

private:
    std::string content_;
};

/**
 * A named, typed, immutable byte source selected for upload.
 * Copies share the same underlying source.
 */
class UploadTarget {
public:
    UploadTarget(const std::string& name, const std::string& contentType,
                 std::shared_ptr<const ByteSource> source);

    // Name is the file's base name, content type from the extension table
    static UploadTarget fromFile(const std::string& path);

    static UploadTarget fromBytes(const std::string& name, std::string content,
                                  const std::string& contentType = "");

    const std::string& name() const { return name_; }
    const std::string& contentType() const { return contentType_; }
    uint64_t size() const { return source_->size(); }

    std::string read(uint64_t start, uint64_t end) const { return source_->read(start, end); }

private:
    std::string name_;
    std::string contentType_;
    std::shared_ptr<const ByteSource> source_;
};

} // namespace mpupload
