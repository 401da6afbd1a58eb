#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class HttpMethod {
    Get,
    Head,
    Post
};

const char* to_string(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string target;                         // path and query, already escaped
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<uint64_t> body_limit;         // unlimited when unset
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers; // names lower case
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
};

// One request/response exchange. Network level failures (resolve, connect,
// timeout, malformed response) throw TransferError(Network); HTTP error
// statuses are returned, not thrown.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& req) = 0;
};

// scheme://host[:port][/base]
struct HttpEndpoint {
    std::string scheme = "http";
    std::string host;
    std::string port = "80";
    std::string base_path;      // no trailing slash

    bool tls() const { return scheme == "https"; }

    // Throws std::invalid_argument on a malformed URL
    static HttpEndpoint parse(const std::string& url);
};

// HTTP/1.1 over Boost.Beast, one connection per request, TLS via
// boost::asio::ssl when the endpoint is https.
class BeastHttpClient : public HttpTransport {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{30};

    explicit BeastHttpClient(HttpEndpoint endpoint,
                             std::chrono::seconds timeout = kDefaultTimeout);

    HttpResponse perform(const HttpRequest& req) override;

    const HttpEndpoint& endpoint() const { return m_endpoint; }

private:
    HttpEndpoint m_endpoint;
    std::chrono::seconds m_timeout;
};

// Percent-encodes everything but RFC 3986 unreserved characters;
// keep_slash leaves '/' alone for path segments.
std::string url_encode(const std::string& s, bool keep_slash = false);

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);
