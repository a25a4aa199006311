#pragma once

#include "../core/result.hpp"
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace uplift::network {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool is_tls() const { return scheme == "https"; }
    std::string origin() const;

    // Accepts http:// and https:// URLs; the port defaults from the scheme
    static std::optional<Url> parse(const std::string& text);
};

struct HttpResponse {
    unsigned status = 0;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking HTTP/1.1 client on Boost.Beast. Each request uses a fresh
// connection and gives up at the deadline or when the cancel flag is raised.
class HttpClient {
public:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{50};
    static constexpr uint64_t MAX_RESPONSE_BODY = 16ULL * 1024 * 1024;

    explicit HttpClient(bool verify_tls = true);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Network failures and timeouts come back as TRANSIENT_NETWORK; the HTTP
    // status is left to the caller
    core::UploadResult request(boost::beast::http::verb verb,
                               const std::string& url,
                               const std::map<std::string, std::string>& headers,
                               std::string_view body,
                               std::chrono::milliseconds timeout,
                               const std::atomic<bool>* cancelled,
                               HttpResponse& response);

private:
    boost::asio::ssl::context ssl_context_;
    bool verify_tls_;
};

}
