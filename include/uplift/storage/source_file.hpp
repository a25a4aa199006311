#pragma once

#include "upload_records.hpp"
#include "../core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace uplift::storage {

// Read-only view of the file being uploaded. Each read opens its own stream
// so concurrent part uploads never share a file position.
class SourceFile {
public:
    explicit SourceFile(std::filesystem::path path);
    
    core::UploadResult fingerprint(SourceFingerprint& out) const;
    
    // Fails with SOURCE_READ when the file is gone or its size/mtime moved
    core::UploadResult verify(const SourceFingerprint& expected) const;
    
    core::UploadResult read_range(const ByteRange& range, std::vector<uint8_t>& buffer) const;
    
    const std::filesystem::path& path() const { return path_; }
    std::string file_name() const;
    std::string content_type() const;

private:
    std::filesystem::path path_;
};

}
