#include "uplift/storage/source_file.hpp"
#include "uplift/core/utils.hpp"
#include <fstream>
#include <map>

namespace uplift::storage {

namespace {

const std::map<std::string, std::string>& content_types() {
    static const std::map<std::string, std::string> types = {
        {".bin", "application/octet-stream"},
        {".csv", "text/csv"},
        {".gif", "image/gif"},
        {".gz", "application/gzip"},
        {".jpeg", "image/jpeg"},
        {".jpg", "image/jpeg"},
        {".json", "application/json"},
        {".mkv", "video/x-matroska"},
        {".mov", "video/quicktime"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
        {".pdf", "application/pdf"},
        {".png", "image/png"},
        {".tar", "application/x-tar"},
        {".txt", "text/plain"},
        {".webm", "video/webm"},
        {".zip", "application/zip"},
    };
    return types;
}

}

SourceFile::SourceFile(std::filesystem::path path) : path_(std::move(path)) {
}

core::UploadResult SourceFile::fingerprint(SourceFingerprint& out) const {
    std::error_code ec;
    
    if (!std::filesystem::is_regular_file(path_, ec)) {
        return core::UploadResult(core::UploadError::SOURCE_READ, "Source file no longer exists: " + path_.string());
    }
    
    auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return core::UploadResult(core::UploadError::SOURCE_READ,
                                  "Cannot stat source file " + path_.string() + ": " + ec.message());
    }
    
    auto modified = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return core::UploadResult(core::UploadError::SOURCE_READ,
                                  "Cannot stat source file " + path_.string() + ": " + ec.message());
    }
    
    out.size = size;
    out.modified_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        modified.time_since_epoch()).count();
    return core::UploadResult();
}

core::UploadResult SourceFile::verify(const SourceFingerprint& expected) const {
    SourceFingerprint current;
    auto result = fingerprint(current);
    if (!result) {
        return result;
    }
    
    if (current != expected) {
        return core::UploadResult(core::UploadError::SOURCE_READ, "Source file changed: " + path_.string());
    }
    
    return core::UploadResult();
}

core::UploadResult SourceFile::read_range(const ByteRange& range, std::vector<uint8_t>& buffer) const {
    if (range.end < range.start) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Invalid byte range");
    }
    
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return core::UploadResult(core::UploadError::SOURCE_READ, "Cannot open source file: " + path_.string());
    }
    
    buffer.resize(static_cast<size_t>(range.size()));
    
    file.seekg(static_cast<std::streamoff>(range.start));
    if (!file) {
        return core::UploadResult(core::UploadError::SOURCE_READ,
                                  "Cannot seek to offset " + std::to_string(range.start));
    }
    
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (static_cast<uint64_t>(file.gcount()) != range.size()) {
        return core::UploadResult(core::UploadError::SOURCE_READ,
                                  "Short read at offset " + std::to_string(range.start) + ": got " +
                                  std::to_string(file.gcount()) + " of " + std::to_string(range.size()) + " bytes");
    }
    
    return core::UploadResult();
}

std::string SourceFile::file_name() const {
    return path_.filename().string();
}

std::string SourceFile::content_type() const {
    auto extension = core::utils::StringUtils::to_lower(path_.extension().string());
    auto it = content_types().find(extension);
    return it != content_types().end() ? it->second : "application/octet-stream";
}

}
