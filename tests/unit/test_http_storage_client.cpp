#include <gtest/gtest.h>
#include "uplift/network/http_storage_client.hpp"
#include "uplift/network/http_client.hpp"
#include "uplift/core/config.hpp"
#include "support/loopback_http_server.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <thread>

using namespace uplift;
using namespace uplift::network;
using core::UploadError;
using uplift::test::LoopbackHttpServer;
using json = nlohmann::json;

namespace {

std::string text(boost::beast::string_view value) {
    return std::string(value.data(), value.size());
}

}

TEST(UrlTest, ParsesComponents) {
    auto url = Url::parse("https://bucket.s3.amazonaws.com/uploads/a.bin?partNumber=2&uploadId=x");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "bucket.s3.amazonaws.com");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/uploads/a.bin?partNumber=2&uploadId=x");
    EXPECT_TRUE(url->is_tls());
    EXPECT_EQ(url->origin(), "https://bucket.s3.amazonaws.com");
}

TEST(UrlTest, ExplicitPortAndDefaults) {
    auto url = Url::parse("HTTP://localhost:9000");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->port, "9000");
    EXPECT_EQ(url->target, "/");
    EXPECT_EQ(url->origin(), "http://localhost:9000");
    EXPECT_FALSE(url->is_tls());
}

TEST(UrlTest, Ipv6AndCredentials) {
    auto url = Url::parse("http://user:secret@[::1]:8080/api#frag");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, "8080");
    EXPECT_EQ(url->target, "/api");
}

TEST(UrlTest, RejectsUnsupported) {
    EXPECT_FALSE(Url::parse("ftp://example.com/file").has_value());
    EXPECT_FALSE(Url::parse("example.com/upload").has_value());
    EXPECT_FALSE(Url::parse("https:///path").has_value());
    EXPECT_FALSE(Url::parse("").has_value());
}

TEST(StorageEndpointsTest, FromBaseUrl) {
    auto endpoints = StorageEndpoints::from_base_url("https://api.example.com/uploads//");
    EXPECT_EQ(endpoints.initiate_url, "https://api.example.com/uploads/initiate");
    EXPECT_EQ(endpoints.presign_part_url, "https://api.example.com/uploads/presign-part");
    EXPECT_EQ(endpoints.complete_url, "https://api.example.com/uploads/complete");
    EXPECT_EQ(endpoints.abort_url, "https://api.example.com/uploads/abort");
    EXPECT_TRUE(endpoints.is_valid());

    EXPECT_FALSE(StorageEndpoints::from_base_url("").is_valid());
    EXPECT_FALSE(StorageEndpoints().is_valid());
}

TEST(StorageEndpointsTest, ClientFromConfig) {
    core::Config config;
    config.set("backend.base_url", "http://127.0.0.1:8080/api");
    config.set("backend.timeout_ms", "1500");

    auto client = HttpStorageClient::from_config(config);
    ASSERT_NE(client, nullptr);
    EXPECT_EQ(client->endpoints().complete_url, "http://127.0.0.1:8080/api/complete");
}

TEST(HttpStorageClientTest, ClassifiesStatus) {
    EXPECT_TRUE(HttpStorageClient::classify_status(200, "Complete", ""));
    EXPECT_TRUE(HttpStorageClient::classify_status(204, "Abort", ""));

    for (unsigned status : {408u, 429u, 500u, 502u, 503u}) {
        auto result = HttpStorageClient::classify_status(status, "Part upload", "");
        EXPECT_EQ(result.error, UploadError::TRANSIENT_NETWORK) << status;
    }
    for (unsigned status : {400u, 401u, 403u, 404u, 409u}) {
        auto result = HttpStorageClient::classify_status(status, "Part upload", "");
        EXPECT_EQ(result.error, UploadError::PERMANENT_REJECTION) << status;
    }

    auto result = HttpStorageClient::classify_status(403, "Initiate", std::string(1000, 'x'));
    EXPECT_NE(result.message.find("Initiate returned HTTP 403"), std::string::npos);
    EXPECT_LT(result.message.size(), 300);
}

TEST(HttpStorageClientTest, ParsesInitiateResponse) {
    transfer::RemoteUpload upload;
    ASSERT_TRUE(HttpStorageClient::parse_initiate_response(
        R"({"upload_id":"abc","file_path":"uploads/2024/a.bin"})", upload));
    EXPECT_EQ(upload.upload_id, "abc");
    EXPECT_EQ(upload.remote_path, "uploads/2024/a.bin");

    ASSERT_TRUE(HttpStorageClient::parse_initiate_response(
        R"({"success":true,"message":"ok","data":{"upload_id":"def","file_path":"uploads/b.bin"}})", upload));
    EXPECT_EQ(upload.upload_id, "def");
}

TEST(HttpStorageClientTest, RejectsBadInitiateResponse) {
    transfer::RemoteUpload upload;
    EXPECT_EQ(HttpStorageClient::parse_initiate_response("not json", upload).error,
              UploadError::PERMANENT_REJECTION);
    EXPECT_EQ(HttpStorageClient::parse_initiate_response(R"({"upload_id":"abc"})", upload).error,
              UploadError::PERMANENT_REJECTION);

    auto result = HttpStorageClient::parse_initiate_response(
        R"({"success":false,"message":"quota exceeded"})", upload);
    EXPECT_EQ(result.error, UploadError::PERMANENT_REJECTION);
    EXPECT_NE(result.message.find("quota exceeded"), std::string::npos);
}

TEST(HttpStorageClientTest, ParsesPresignHeaders) {
    transfer::PresignedPart target;
    ASSERT_TRUE(HttpStorageClient::parse_presign_response(R"({
        "presigned_url": "https://bucket/a.bin?partNumber=1",
        "headers": {"x-amz-acl": "private", "x-amz-meta-tags": ["a", "b"], "x-amz-meta-size": 42}
    })", target));

    EXPECT_EQ(target.url, "https://bucket/a.bin?partNumber=1");
    EXPECT_EQ(target.headers.at("x-amz-acl"), "private");
    EXPECT_EQ(target.headers.at("x-amz-meta-tags"), "a, b");
    EXPECT_EQ(target.headers.at("x-amz-meta-size"), "42");
}

TEST(HttpStorageClientTest, PresignWithoutHeaders) {
    transfer::PresignedPart target;
    target.headers["stale"] = "value";
    ASSERT_TRUE(HttpStorageClient::parse_presign_response(
        R"({"data":{"presigned_url":"https://bucket/a","headers":[]}})", target));
    EXPECT_TRUE(target.headers.empty());

    EXPECT_FALSE(HttpStorageClient::parse_presign_response(R"({"headers":{}})", target));
}

TEST(HttpStorageClientTest, BuildsRequests) {
    transfer::SourceMetadata source{"a.bin", "application/octet-stream", 23 * 1024 * 1024};
    auto initiate = json::parse(HttpStorageClient::build_initiate_request(source));
    EXPECT_EQ(initiate["file_name"], "a.bin");
    EXPECT_EQ(initiate["file_size"], 23 * 1024 * 1024);

    transfer::RemoteUpload upload{"abc", "uploads/a.bin"};
    auto presign = json::parse(HttpStorageClient::build_presign_request(upload, 4));
    EXPECT_EQ(presign["part_number"], 4);
    EXPECT_EQ(presign["file_path"], "uploads/a.bin");

    auto abort = json::parse(HttpStorageClient::build_abort_request(upload));
    EXPECT_EQ(abort["upload_id"], "abc");
}

TEST(HttpStorageClientTest, CompleteRequestIsOrdered) {
    transfer::RemoteUpload upload{"abc", "uploads/a.bin"};
    std::vector<transfer::CompletedPart> parts = {{3, "\"c\""}, {1, "\"a\""}, {2, "\"b\""}};

    auto request = json::parse(HttpStorageClient::build_complete_request(upload, parts));
    ASSERT_EQ(request["parts"].size(), 3);
    EXPECT_EQ(request["parts"][0]["part_number"], 1);
    EXPECT_EQ(request["parts"][0]["etag"], "\"a\"");
    EXPECT_EQ(request["parts"][2]["part_number"], 3);
}

class HttpStorageClientLoopbackTest : public ::testing::Test {
protected:
    std::unique_ptr<HttpStorageClient> client_for(const LoopbackHttpServer& server,
                                                  std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return std::make_unique<HttpStorageClient>(StorageEndpoints::from_base_url(server.url("/api")), timeout);
    }

    std::atomic<bool> cancelled{false};
};

TEST_F(HttpStorageClientLoopbackTest, InitiateSendsJsonWithToken) {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
        return LoopbackHttpServer::reply(200, R"({"success":true,"data":{"upload_id":"u-1","file_path":"uploads/a.bin"}})");
    });
    server.serve(1);

    auto client = client_for(server);
    client->set_auth_token("secret");

    transfer::RemoteUpload upload;
    auto result = client->initiate({"a.bin", "text/plain", 10}, upload);
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(upload.upload_id, "u-1");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(requests[0].method(), boost::beast::http::verb::post);
    EXPECT_EQ(text(requests[0].target()), "/api/initiate");
    EXPECT_EQ(text(requests[0][boost::beast::http::field::authorization]), "Bearer secret");
    EXPECT_EQ(json::parse(requests[0].body())["file_name"], "a.bin");
}

TEST_F(HttpStorageClientLoopbackTest, UploadBytesReturnsEtag) {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
        auto response = LoopbackHttpServer::reply(200);
        response.set(boost::beast::http::field::etag, "\"9b2cf535f27731c974343645a3985328\"");
        return response;
    });
    server.serve(1);

    auto client = client_for(server);
    transfer::PresignedPart target{server.url("/bucket/a.bin?partNumber=1"), {{"x-amz-acl", "private"}}};
    std::vector<uint8_t> bytes(4096, 7);

    std::string token;
    auto result = client->upload_bytes(target, bytes, std::chrono::seconds(5), cancelled, token);
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(token, "\"9b2cf535f27731c974343645a3985328\"");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(requests[0].method(), boost::beast::http::verb::put);
    EXPECT_EQ(requests[0].body().size(), 4096);
    EXPECT_EQ(text(requests[0]["x-amz-acl"]), "private");
    EXPECT_TRUE(requests[0][boost::beast::http::field::authorization].empty());
}

TEST_F(HttpStorageClientLoopbackTest, MissingEtagIsRejected) {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) { return LoopbackHttpServer::reply(200); });
    server.serve(1);

    auto client = client_for(server);
    std::vector<uint8_t> bytes(16, 1);
    std::string token;
    auto result = client->upload_bytes({server.url("/bucket/a"), {}}, bytes, std::chrono::seconds(5), cancelled, token);
    EXPECT_EQ(result.error, UploadError::PERMANENT_REJECTION);
}

TEST_F(HttpStorageClientLoopbackTest, ServerErrorIsTransient) {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) {
        return LoopbackHttpServer::reply(503, "slow down");
    });
    server.serve(1);

    auto client = client_for(server);
    auto result = client->complete({"u-1", "uploads/a.bin"}, {{1, "\"a\""}});
    EXPECT_EQ(result.error, UploadError::TRANSIENT_NETWORK);
    EXPECT_NE(result.message.find("slow down"), std::string::npos);
}

TEST_F(HttpStorageClientLoopbackTest, ForbiddenIsPermanent) {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) { return LoopbackHttpServer::reply(403); });
    server.serve(1);

    auto client = client_for(server);
    EXPECT_EQ(client->abort({"u-1", "uploads/a.bin"}).error, UploadError::PERMANENT_REJECTION);
}

TEST_F(HttpStorageClientLoopbackTest, SlowServerTimesOut) {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) { return LoopbackHttpServer::reply(200); },
                              std::chrono::milliseconds(600));
    server.serve(1);

    auto client = client_for(server, std::chrono::milliseconds(150));
    auto started = std::chrono::steady_clock::now();
    auto result = client->abort({"u-1", "uploads/a.bin"});

    EXPECT_EQ(result.error, UploadError::TRANSIENT_NETWORK);
    EXPECT_NE(result.message.find("Timed out"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(550));
}

TEST_F(HttpStorageClientLoopbackTest, CancelStopsPartUpload) {
    LoopbackHttpServer server([](const LoopbackHttpServer::Request&) { return LoopbackHttpServer::reply(200); },
                              std::chrono::milliseconds(600));
    server.serve(1);

    auto client = client_for(server);
    std::thread canceller([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancelled = true;
    });

    std::vector<uint8_t> bytes(16, 1);
    std::string token;
    auto result = client->upload_bytes({server.url("/bucket/a"), {}}, bytes, std::chrono::seconds(5), cancelled, token);
    canceller.join();

    EXPECT_EQ(result.error, UploadError::CANCELLED);
}

TEST(HttpClientTest, ConnectionRefusedIsTransient) {
    std::string url;
    {
        LoopbackHttpServer closed([](const LoopbackHttpServer::Request&) { return LoopbackHttpServer::reply(200); });
        url = closed.url("/api");
    }

    HttpClient http;
    HttpResponse response;
    auto result = http.request(boost::beast::http::verb::get, url, {}, "", std::chrono::seconds(2), nullptr, response);
    EXPECT_EQ(result.error, UploadError::TRANSIENT_NETWORK);
}

TEST(HttpClientTest, InvalidUrlIsPermanent) {
    HttpClient http;
    HttpResponse response;
    auto result = http.request(boost::beast::http::verb::get, "not a url", {}, "", std::chrono::seconds(1),
                               nullptr, response);
    EXPECT_EQ(result.error, UploadError::PERMANENT_REJECTION);
}

TEST(HttpClientTest, HeaderLookupIsCaseInsensitive) {
    HttpResponse response;
    response.headers["etag"] = "\"x\"";
    EXPECT_EQ(response.header("ETag").value(), "\"x\"");
    EXPECT_FALSE(response.header("Location").has_value());
}
