#pragma once

#include "moiplink/rest/HttpClient.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace moiplink::rest {

struct HttpsEndpoint {
    std::string host;
    std::uint16_t port{443};
    bool verifyPeer{false};
    std::string caFile;
    std::chrono::milliseconds timeout{10000};
};

// Builds the client TLS context for the controller. The controller ships a
// self-signed certificate, so verification is opt-in; turning it off is
// logged.
std::shared_ptr<boost::asio::ssl::context> makeTlsContext(const HttpsEndpoint& endpoint);

// One TLS connection driven on a caller-owned io_context. Every step is an
// async operation followed by run(); the tcp_stream deadline bounds it.
class TlsConnection {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    TlsConnection(boost::asio::io_context& ioContext,
                  boost::asio::ssl::context& tls,
                  const HttpsEndpoint& endpoint);

    void connect(std::chrono::milliseconds timeout);
    void send(Request& request, std::chrono::milliseconds timeout);
    Response receive(std::chrono::milliseconds timeout);
    void shutdown(std::chrono::milliseconds timeout);

    Stream& stream() noexcept { return stream_; }
    boost::beast::flat_buffer& buffer() noexcept { return buffer_; }

    // Completion handler recording the outcome of the current step.
    auto handler() {
        return [this](const boost::system::error_code& ec, auto&&...) { lastError_ = ec; };
    }
    // Runs the io_context until the current step completes; throws
    // NetworkError/TimeoutError when it failed.
    void run(const std::string& step);

private:
    boost::asio::io_context& ioContext_;
    HttpsEndpoint endpoint_;
    boost::asio::ip::tcp::resolver resolver_;
    Stream stream_;
    boost::beast::flat_buffer buffer_;
    boost::system::error_code lastError_;
};

class HttpsClient : public HttpClient {
public:
    explicit HttpsClient(HttpsEndpoint endpoint);

    HttpResponse perform(const HttpRequest& request) override;

    const HttpsEndpoint& endpoint() const noexcept { return endpoint_; }

private:
    HttpsEndpoint endpoint_;
    std::shared_ptr<boost::asio::ssl::context> tls_;
};

}  // namespace moiplink::rest
