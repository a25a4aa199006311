#include "uplift/network/http_storage_client.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace uplift::network {

using json = nlohmann::json;
using core::UploadError;
using core::UploadResult;
using core::utils::StringUtils;
using transfer::CompletedPart;
using transfer::PresignedPart;
using transfer::RemoteUpload;
using transfer::SourceMetadata;
namespace http = boost::beast::http;

namespace {

constexpr size_t MAX_ERROR_BODY_IN_MESSAGE = 200;

std::string trim_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// Either the payload itself or the "data" member of a {success, message, data} envelope
UploadResult unwrap(const std::string& body, const std::string& context, json& payload) {
    auto document = json::parse(body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return UploadResult(UploadError::PERMANENT_REJECTION, context + ": response is not a JSON object");
    }

    if (document.contains("success") && document["success"].is_boolean() && !document["success"].get<bool>()) {
        auto message = document.value("message", std::string("request rejected"));
        return UploadResult(UploadError::PERMANENT_REJECTION, context + ": " + message);
    }

    if (document.contains("data") && document["data"].is_object()) {
        payload = document["data"];
    } else {
        payload = std::move(document);
    }
    return UploadResult();
}

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string scalar_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

}

StorageEndpoints StorageEndpoints::from_base_url(const std::string& base_url) {
    auto base = trim_trailing_slashes(base_url);

    StorageEndpoints endpoints;
    endpoints.initiate_url = base + "/initiate";
    endpoints.presign_part_url = base + "/presign-part";
    endpoints.complete_url = base + "/complete";
    endpoints.abort_url = base + "/abort";
    return endpoints;
}

bool StorageEndpoints::is_valid() const {
    return Url::parse(initiate_url) && Url::parse(presign_part_url) &&
           Url::parse(complete_url) && Url::parse(abort_url);
}

HttpStorageClient::HttpStorageClient(StorageEndpoints endpoints,
                                     std::chrono::milliseconds request_timeout,
                                     bool verify_tls)
    : endpoints_(std::move(endpoints))
    , request_timeout_(request_timeout)
    , http_(verify_tls) {
}

std::shared_ptr<HttpStorageClient> HttpStorageClient::from_config(const core::Config& config) {
    auto endpoints = StorageEndpoints::from_base_url(config.get_string("backend.base_url"));
    auto timeout = std::chrono::milliseconds(config.get_int64("backend.timeout_ms", DEFAULT_REQUEST_TIMEOUT.count()));

    auto client = std::make_shared<HttpStorageClient>(std::move(endpoints), timeout,
                                                      config.get_bool("backend.verify_tls", true));
    client->set_auth_token(config.get_string("backend.auth_token"));
    return client;
}

UploadResult HttpStorageClient::initiate(const SourceMetadata& source, RemoteUpload& upload) {
    HttpResponse response;
    auto result = post_json(endpoints_.initiate_url, build_initiate_request(source), "Initiate", response);
    if (!result) {
        return result;
    }
    return parse_initiate_response(response.body, upload);
}

UploadResult HttpStorageClient::presign_part(const RemoteUpload& upload, uint32_t part_number,
                                             PresignedPart& target) {
    HttpResponse response;
    auto result = post_json(endpoints_.presign_part_url, build_presign_request(upload, part_number),
                            "Presign part " + std::to_string(part_number), response);
    if (!result) {
        return result;
    }
    return parse_presign_response(response.body, target);
}

UploadResult HttpStorageClient::upload_bytes(const PresignedPart& target,
                                             std::span<const uint8_t> bytes,
                                             std::chrono::milliseconds timeout,
                                             const std::atomic<bool>& cancelled,
                                             std::string& integrity_token) {
    HttpResponse response;
    std::string_view body(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    auto result = http_.request(http::verb::put, target.url, target.headers, body, timeout, &cancelled, response);
    if (!result) {
        return result;
    }

    result = classify_status(response.status, "Part upload", response.body);
    if (!result) {
        return result;
    }

    auto etag = response.header("etag");
    if (!etag || etag->empty()) {
        return UploadResult(UploadError::PERMANENT_REJECTION, "Part upload response carried no ETag");
    }

    integrity_token = *etag;
    return UploadResult();
}

UploadResult HttpStorageClient::complete(const RemoteUpload& upload, const std::vector<CompletedPart>& parts) {
    HttpResponse response;
    return post_json(endpoints_.complete_url, build_complete_request(upload, parts), "Complete", response);
}

UploadResult HttpStorageClient::abort(const RemoteUpload& upload) {
    HttpResponse response;
    return post_json(endpoints_.abort_url, build_abort_request(upload), "Abort", response);
}

UploadResult HttpStorageClient::classify_status(unsigned status, const std::string& context, const std::string& body) {
    if (status >= 200 && status < 300) {
        return UploadResult();
    }

    std::string message = context + " returned HTTP " + std::to_string(status);
    if (!body.empty()) {
        message += ": " + body.substr(0, MAX_ERROR_BODY_IN_MESSAGE);
    }

    if (status == 408 || status == 429 || status >= 500) {
        return UploadResult(UploadError::TRANSIENT_NETWORK, message);
    }
    return UploadResult(UploadError::PERMANENT_REJECTION, message);
}

UploadResult HttpStorageClient::parse_initiate_response(const std::string& body, RemoteUpload& upload) {
    json payload;
    auto result = unwrap(body, "Initiate", payload);
    if (!result) {
        return result;
    }

    auto upload_id = string_field(payload, "upload_id");
    auto file_path = string_field(payload, "file_path");
    if (upload_id.empty() || file_path.empty()) {
        return UploadResult(UploadError::PERMANENT_REJECTION, "Initiate: response lacks upload_id or file_path");
    }

    upload.upload_id = std::move(upload_id);
    upload.remote_path = std::move(file_path);
    return UploadResult();
}

UploadResult HttpStorageClient::parse_presign_response(const std::string& body, PresignedPart& target) {
    json payload;
    auto result = unwrap(body, "Presign", payload);
    if (!result) {
        return result;
    }

    auto url = string_field(payload, "presigned_url");
    if (url.empty()) {
        return UploadResult(UploadError::PERMANENT_REJECTION, "Presign: response lacks presigned_url");
    }

    target.url = std::move(url);
    target.headers.clear();

    // Some backends send [] when there are no headers
    auto headers = payload.find("headers");
    if (headers != payload.end() && headers->is_object()) {
        for (auto it = headers->begin(); it != headers->end(); ++it) {
            const auto& value = it.value();
            if (value.is_array()) {
                std::vector<std::string> values;
                for (const auto& item : value) {
                    values.push_back(scalar_text(item));
                }
                target.headers[it.key()] = StringUtils::join(values, ", ");
            } else {
                target.headers[it.key()] = scalar_text(value);
            }
        }
    }

    return UploadResult();
}

std::string HttpStorageClient::build_initiate_request(const SourceMetadata& source) {
    json request = {
        {"file_name", source.file_name},
        {"content_type", source.content_type},
        {"file_size", source.file_size}
    };
    return request.dump();
}

std::string HttpStorageClient::build_presign_request(const RemoteUpload& upload, uint32_t part_number) {
    json request = {
        {"upload_id", upload.upload_id},
        {"file_path", upload.remote_path},
        {"part_number", part_number}
    };
    return request.dump();
}

std::string HttpStorageClient::build_complete_request(const RemoteUpload& upload,
                                                      const std::vector<CompletedPart>& parts) {
    auto sorted = parts;
    std::sort(sorted.begin(), sorted.end(), [](const CompletedPart& a, const CompletedPart& b) {
        return a.part_number < b.part_number;
    });

    json entries = json::array();
    for (const auto& part : sorted) {
        entries.push_back({{"part_number", part.part_number}, {"etag", part.integrity_token}});
    }

    json request = {
        {"upload_id", upload.upload_id},
        {"file_path", upload.remote_path},
        {"parts", entries}
    };
    return request.dump();
}

std::string HttpStorageClient::build_abort_request(const RemoteUpload& upload) {
    json request = {
        {"upload_id", upload.upload_id},
        {"file_path", upload.remote_path}
    };
    return request.dump();
}

UploadResult HttpStorageClient::post_json(const std::string& url, const std::string& payload,
                                          const std::string& context, HttpResponse& response) {
    std::map<std::string, std::string> headers = {
        {"Accept", "application/json"},
        {"Content-Type", "application/json"}
    };
    if (!auth_token_.empty()) {
        headers["Authorization"] = "Bearer " + auth_token_;
    }

    auto result = http_.request(http::verb::post, url, headers, payload, request_timeout_, nullptr, response);
    if (!result) {
        LOG_DEBUG("{} request to {} failed: {}", context, url, result.message);
        return UploadResult(result.error, context + ": " + result.message);
    }

    return classify_status(response.status, context, response.body);
}

}
