#pragma once

#include "http_client.hpp"
#include "../transfer/storage_client.hpp"
#include "../core/config.hpp"
#include "../core/result.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace uplift::network {

struct StorageEndpoints {
    std::string initiate_url;
    std::string presign_part_url;
    std::string complete_url;
    std::string abort_url;

    // Appends /initiate, /presign-part, /complete and /abort to the base
    static StorageEndpoints from_base_url(const std::string& base_url);

    bool is_valid() const;
};

// StorageClient for an upload API fronting S3 multipart uploads. Control
// calls are JSON over HTTP(S); part bodies go straight to presigned URLs and
// the returned ETag is the integrity token.
class HttpStorageClient : public transfer::StorageClient {
public:
    static constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{30000};

    explicit HttpStorageClient(StorageEndpoints endpoints,
                               std::chrono::milliseconds request_timeout = DEFAULT_REQUEST_TIMEOUT,
                               bool verify_tls = true);

    // Reads backend.base_url, backend.auth_token, backend.timeout_ms and backend.verify_tls
    static std::shared_ptr<HttpStorageClient> from_config(const core::Config& config);

    // Sent as a bearer token on control calls, never to presigned URLs
    void set_auth_token(std::string token) { auth_token_ = std::move(token); }

    core::UploadResult initiate(const transfer::SourceMetadata& source, transfer::RemoteUpload& upload) override;

    core::UploadResult presign_part(const transfer::RemoteUpload& upload, uint32_t part_number,
                                    transfer::PresignedPart& target) override;

    core::UploadResult upload_bytes(const transfer::PresignedPart& target,
                                    std::span<const uint8_t> bytes,
                                    std::chrono::milliseconds timeout,
                                    const std::atomic<bool>& cancelled,
                                    std::string& integrity_token) override;

    core::UploadResult complete(const transfer::RemoteUpload& upload,
                                const std::vector<transfer::CompletedPart>& parts) override;

    core::UploadResult abort(const transfer::RemoteUpload& upload) override;

    const StorageEndpoints& endpoints() const { return endpoints_; }

    // Response handling, exposed for tests
    static core::UploadResult classify_status(unsigned status, const std::string& context, const std::string& body);
    static core::UploadResult parse_initiate_response(const std::string& body, transfer::RemoteUpload& upload);
    static core::UploadResult parse_presign_response(const std::string& body, transfer::PresignedPart& target);
    static std::string build_initiate_request(const transfer::SourceMetadata& source);
    static std::string build_presign_request(const transfer::RemoteUpload& upload, uint32_t part_number);
    static std::string build_complete_request(const transfer::RemoteUpload& upload,
                                              const std::vector<transfer::CompletedPart>& parts);
    static std::string build_abort_request(const transfer::RemoteUpload& upload);

private:
    StorageEndpoints endpoints_;
    std::chrono::milliseconds request_timeout_;
    std::string auth_token_;
    HttpClient http_;

    core::UploadResult post_json(const std::string& url, const std::string& payload,
                                 const std::string& context, HttpResponse& response);
};

}
