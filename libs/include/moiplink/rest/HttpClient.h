#pragma once

#include <boost/beast/http/verb.hpp>

#include <string>
#include <utility>
#include <vector>

namespace moiplink::rest {

struct HttpRequest {
    boost::beast::http::verb method{boost::beast::http::verb::get};
    std::string target;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;

    const std::string* header(const std::string& name) const;
};

struct HttpResponse {
    unsigned status{0};
    std::string body;
    std::string contentType;

    bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Request/response exchange with the management port. Implementations must
// be safe to call from several threads and must bound every call with a
// timeout, throwing NetworkError/TimeoutError on transport failure.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

}  // namespace moiplink::rest
