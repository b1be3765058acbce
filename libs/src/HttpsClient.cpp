#include "moiplink/rest/HttpsClient.h"

#include "moiplink/common/Errors.h"

#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace moiplink::rest {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;

constexpr const char* kUserAgent = "moiplink/0.1";

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

const std::string* HttpRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

std::shared_ptr<ssl::context> makeTlsContext(const HttpsEndpoint& endpoint) {
    auto context = std::make_shared<ssl::context>(ssl::context::tls_client);
    if (endpoint.verifyPeer) {
        context->set_verify_mode(ssl::verify_peer);
        if (!endpoint.caFile.empty()) {
            context->load_verify_file(endpoint.caFile);
        } else {
            context->set_default_verify_paths();
        }
    } else {
        context->set_verify_mode(ssl::verify_none);
        spdlog::warn("TLS certificate verification is disabled for {}:{}; the controller certificate will not be checked",
                     endpoint.host,
                     endpoint.port);
    }
    return context;
}

TlsConnection::TlsConnection(asio::io_context& ioContext, ssl::context& tls, const HttpsEndpoint& endpoint)
    : ioContext_(ioContext), endpoint_(endpoint), resolver_(ioContext), stream_(ioContext, tls) {}

void TlsConnection::run(const std::string& step) {
    lastError_ = {};
    ioContext_.restart();
    ioContext_.run();
    if (!lastError_) {
        return;
    }
    if (lastError_ == beast::error::timeout) {
        throw TimeoutError(step + " to " + endpoint_.host + " timed out");
    }
    if (lastError_.category() == asio::error::get_ssl_category()) {
        throw NetworkError(step + " to " + endpoint_.host + " failed (TLS): " + lastError_.message());
    }
    throw NetworkError(step + " to " + endpoint_.host + " failed: " + lastError_.message());
}

void TlsConnection::connect(std::chrono::milliseconds timeout) {
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), endpoint_.host.c_str())) {
        throw NetworkError("Failed to set TLS server name for " + endpoint_.host);
    }
    if (endpoint_.verifyPeer) {
        stream_.set_verify_callback(ssl::host_name_verification(endpoint_.host));
    }

    asio::ip::tcp::resolver::results_type results;
    bool resolved = false;
    boost::system::error_code resolveError;
    resolver_.async_resolve(endpoint_.host,
                            std::to_string(endpoint_.port),
                            [&](const boost::system::error_code& ec, asio::ip::tcp::resolver::results_type found) {
                                resolveError = ec;
                                results = std::move(found);
                                resolved = true;
                            });
    ioContext_.restart();
    ioContext_.run_for(timeout);
    if (!resolved) {
        resolver_.cancel();
        ioContext_.restart();
        ioContext_.run();
        throw TimeoutError("Resolving " + endpoint_.host + " timed out");
    }
    if (resolveError) {
        throw NetworkError("Resolving " + endpoint_.host + " failed: " + resolveError.message());
    }

    beast::get_lowest_layer(stream_).expires_after(timeout);
    beast::get_lowest_layer(stream_).async_connect(results, handler());
    run("Connect");

    beast::get_lowest_layer(stream_).expires_after(timeout);
    stream_.async_handshake(ssl::stream_base::client, handler());
    run("TLS handshake");
}

void TlsConnection::send(Request& request, std::chrono::milliseconds timeout) {
    beast::get_lowest_layer(stream_).expires_after(timeout);
    http::async_write(stream_, request, handler());
    run("Request");
}

TlsConnection::Response TlsConnection::receive(std::chrono::milliseconds timeout) {
    http::response_parser<http::string_body> parser;
    // Preview images can be larger than the default limit.
    parser.body_limit(32U * 1024U * 1024U);
    beast::get_lowest_layer(stream_).expires_after(timeout);
    http::async_read(stream_, buffer_, parser, handler());
    run("Response");
    return parser.release();
}

void TlsConnection::shutdown(std::chrono::milliseconds timeout) {
    beast::get_lowest_layer(stream_).expires_after(timeout);
    stream_.async_shutdown([this](const boost::system::error_code& ec) {
        // Controllers commonly drop the socket without a close_notify.
        if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
            spdlog::debug("TLS shutdown with {}: {}", endpoint_.host, ec.message());
        }
    });
    ioContext_.restart();
    ioContext_.run();
    beast::error_code ignored;
    beast::get_lowest_layer(stream_).socket().close(ignored);
}

HttpsClient::HttpsClient(HttpsEndpoint endpoint)
    : endpoint_(std::move(endpoint)), tls_(makeTlsContext(endpoint_)) {}

HttpResponse HttpsClient::perform(const HttpRequest& request) {
    asio::io_context ioContext;
    TlsConnection connection(ioContext, *tls_, endpoint_);
    connection.connect(endpoint_.timeout);

    TlsConnection::Request message{request.method, request.target, 11};
    message.set(http::field::host, endpoint_.host);
    message.set(http::field::user_agent, kUserAgent);
    message.set(http::field::accept, "application/json");
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
    if (!request.body.empty()) {
        message.set(http::field::content_type,
                    request.contentType.empty() ? std::string("application/json") : request.contentType);
        message.body() = request.body;
    }
    message.prepare_payload();

    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("HTTPS {} {}", std::string(http::to_string(request.method)), request.target);
    }
    connection.send(message, endpoint_.timeout);
    auto reply = connection.receive(endpoint_.timeout);
    connection.shutdown(endpoint_.timeout);

    HttpResponse response;
    response.status = reply.result_int();
    response.body = std::move(reply.body());
    if (auto it = reply.find(http::field::content_type); it != reply.end()) {
        response.contentType = std::string(it->value());
    }
    return response;
}

}  // namespace moiplink::rest
