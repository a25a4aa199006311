#include "uplift/network/http_client.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <functional>
#include <type_traits>

namespace uplift::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using core::UploadError;
using core::UploadResult;
using core::utils::StringUtils;

namespace {

using Deadline = std::chrono::steady_clock::time_point;
using Request = http::request<http::string_body>;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

constexpr const char* USER_AGENT = "uplift/1.0";

enum class Interrupt {
    NONE,
    CANCELLED,
    TIMED_OUT
};

std::string to_std(beast::string_view value) {
    return std::string(value.data(), value.size());
}

std::string default_port(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

// Runs the io_context until the operation started by `start` completes. When
// the deadline passes or the flag is raised, `interrupt` aborts the operation
// and the loop waits for its handler to run.
template <typename Start>
Interrupt run_until_done(asio::io_context& ioc, Deadline deadline, const std::atomic<bool>* cancelled,
                         const std::function<void()>& interrupt, boost::system::error_code& ec, Start&& start) {
    bool done = false;
    auto finish = [&ec, &done](const boost::system::error_code& result) {
        ec = result;
        done = true;
    };
    start(finish);

    Interrupt reason = Interrupt::NONE;
    while (!done) {
        if (ioc.stopped()) {
            ioc.restart();
        }
        ioc.run_for(HttpClient::POLL_INTERVAL);

        if (done || reason != Interrupt::NONE) {
            continue;
        }
        if (cancelled && cancelled->load()) {
            reason = Interrupt::CANCELLED;
            interrupt();
        } else if (std::chrono::steady_clock::now() >= deadline) {
            reason = Interrupt::TIMED_OUT;
            interrupt();
        }
    }

    ioc.restart();
    return reason;
}

std::optional<UploadResult> check(Interrupt reason, const boost::system::error_code& ec, const std::string& stage) {
    switch (reason) {
        case Interrupt::CANCELLED:
            return UploadResult(UploadError::CANCELLED, "Request cancelled during " + stage);
        case Interrupt::TIMED_OUT:
            return UploadResult(UploadError::TRANSIENT_NETWORK, "Timed out during " + stage);
        case Interrupt::NONE:
            break;
    }

    if (ec) {
        // Certificate problems will not go away on retry
        if (ec.category() == asio::error::get_ssl_category()) {
            return UploadResult(UploadError::PERMANENT_REJECTION, stage + " failed: " + ec.message());
        }
        return UploadResult(UploadError::TRANSIENT_NETWORK, stage + " failed: " + ec.message());
    }
    return std::nullopt;
}

template <typename Stream>
UploadResult exchange(asio::io_context& ioc, Stream& stream, const tcp::resolver::results_type& endpoints,
                      Request& request, Deadline deadline, const std::atomic<bool>* cancelled,
                      HttpResponse& response) {
    auto& socket = beast::get_lowest_layer(stream);
    auto interrupt = [&socket]() { socket.cancel(); };
    boost::system::error_code ec;

    auto reason = run_until_done(ioc, deadline, cancelled, interrupt, ec, [&](auto done) {
        socket.async_connect(endpoints, [done](const boost::system::error_code& e, const tcp::endpoint&) {
            done(e);
        });
    });
    if (auto failure = check(reason, ec, "connect")) {
        return *failure;
    }

    if constexpr (std::is_same_v<Stream, TlsStream>) {
        reason = run_until_done(ioc, deadline, cancelled, interrupt, ec, [&](auto done) {
            stream.async_handshake(ssl::stream_base::client, [done](const boost::system::error_code& e) {
                done(e);
            });
        });
        if (auto failure = check(reason, ec, "TLS handshake")) {
            return *failure;
        }
    }

    reason = run_until_done(ioc, deadline, cancelled, interrupt, ec, [&](auto done) {
        http::async_write(stream, request, [done](const boost::system::error_code& e, std::size_t) {
            done(e);
        });
    });
    if (auto failure = check(reason, ec, "send")) {
        return *failure;
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(HttpClient::MAX_RESPONSE_BODY);

    reason = run_until_done(ioc, deadline, cancelled, interrupt, ec, [&](auto done) {
        http::async_read(stream, buffer, parser, [done](const boost::system::error_code& e, std::size_t) {
            done(e);
        });
    });
    if (auto failure = check(reason, ec, "receive")) {
        return *failure;
    }

    auto message = parser.release();
    response.status = message.result_int();
    response.headers.clear();
    for (const auto& field : message) {
        response.headers[StringUtils::to_lower(to_std(field.name_string()))] = to_std(field.value());
    }
    response.body = std::move(message.body());

    // The response is complete; a failed shutdown changes nothing
    boost::system::error_code ignored;
    socket.socket().shutdown(tcp::socket::shutdown_both, ignored);

    return UploadResult();
}

}

std::string Url::origin() const {
    std::string result = scheme + "://" + host;
    if (port != default_port(scheme)) {
        result += ":" + port;
    }
    return result;
}

std::optional<Url> Url::parse(const std::string& text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = StringUtils::to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    auto authority_start = scheme_end + 3;
    auto path_start = text.find_first_of("/?#", authority_start);
    auto authority = text.substr(authority_start, path_start == std::string::npos
                                                      ? std::string::npos
                                                      : path_start - authority_start);

    // Drop credentials if present
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            url.port = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    } else {
        url.host = authority;
    }

    if (url.host.empty()) {
        return std::nullopt;
    }
    if (url.port.empty()) {
        url.port = default_port(url.scheme);
    }

    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (auto fragment = url.target.find('#'); fragment != std::string::npos) {
        url.target.erase(fragment);
    }
    if (url.target.empty() || url.target.front() != '/') {
        url.target.insert(url.target.begin(), '/');
    }

    return url;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpClient::HttpClient(bool verify_tls)
    : ssl_context_(ssl::context::tls_client), verify_tls_(verify_tls) {
    if (verify_tls_) {
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(ssl::verify_peer);
    } else {
        ssl_context_.set_verify_mode(ssl::verify_none);
    }
}

UploadResult HttpClient::request(http::verb verb,
                                 const std::string& url_text,
                                 const std::map<std::string, std::string>& headers,
                                 std::string_view body,
                                 std::chrono::milliseconds timeout,
                                 const std::atomic<bool>* cancelled,
                                 HttpResponse& response) {
    auto url = Url::parse(url_text);
    if (!url) {
        return UploadResult(UploadError::PERMANENT_REJECTION, "Invalid URL: " + url_text);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    try {
        asio::io_context ioc;

        Request request{verb, url->target, 11};
        auto host = url->origin().substr(url->scheme.size() + 3);
        request.set(http::field::host, host);
        request.set(http::field::user_agent, USER_AGENT);
        for (const auto& [name, value] : headers) {
            request.set(name, value);
        }
        request.body().assign(body.data(), body.size());
        request.prepare_payload();

        LOG_TRACE("{} {} ({} bytes)", to_std(http::to_string(verb)), url->origin() + url->target, body.size());

        tcp::resolver resolver(ioc);
        tcp::resolver::results_type endpoints;
        boost::system::error_code ec;

        auto reason = run_until_done(ioc, deadline, cancelled, [&resolver]() { resolver.cancel(); }, ec,
                                     [&](auto done) {
            resolver.async_resolve(url->host, url->port,
                                   [&endpoints, done](const boost::system::error_code& e,
                                                      tcp::resolver::results_type results) {
                endpoints = std::move(results);
                done(e);
            });
        });
        if (auto failure = check(reason, ec, "resolve " + url->host)) {
            return *failure;
        }

        UploadResult result;
        if (url->is_tls()) {
            TlsStream stream(ioc, ssl_context_);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
                return UploadResult(UploadError::PERMANENT_REJECTION, "Cannot set TLS server name for " + url->host);
            }
            if (verify_tls_) {
                stream.set_verify_callback(ssl::host_name_verification(url->host));
            }
            result = exchange(ioc, stream, endpoints, request, deadline, cancelled, response);
        } else {
            beast::tcp_stream stream(ioc);
            result = exchange(ioc, stream, endpoints, request, deadline, cancelled, response);
        }

        if (result) {
            LOG_TRACE("{} {} -> {}", to_std(http::to_string(verb)), url->origin() + url->target, response.status);
        }
        return result;
    } catch (const std::exception& e) {
        return UploadResult(UploadError::TRANSIENT_NETWORK, std::string("HTTP request failed: ") + e.what());
    }
}

}
