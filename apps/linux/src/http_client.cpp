#include "http_client.h"
#include "debug_utils.h"
#include "transfer_error.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

const char* to_string(HttpMethod method) {
    switch (method) {
    case HttpMethod::Get:  return "GET";
    case HttpMethod::Head: return "HEAD";
    case HttpMethod::Post: return "POST";
    }
    return "?";
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c){ return (char)std::tolower(c); });
    auto it = headers.find(key);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpEndpoint HttpEndpoint::parse(const std::string& url) {
    HttpEndpoint ep;
    std::string rest = url;

    auto sep = rest.find("://");
    if (sep != std::string::npos) {
        ep.scheme = rest.substr(0, sep);
        std::transform(ep.scheme.begin(), ep.scheme.end(), ep.scheme.begin(),
                       [](unsigned char c){ return (char)std::tolower(c); });
        rest = rest.substr(sep + 3);
    }
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw std::invalid_argument("unsupported scheme in '" + url + "'");
    }
    ep.port = ep.tls() ? "443" : "80";

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        ep.base_path = rest.substr(slash);
        while (!ep.base_path.empty() && ep.base_path.back() == '/') {
            ep.base_path.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        ep.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (ep.port.empty() ||
            !std::all_of(ep.port.begin(), ep.port.end(),
                         [](unsigned char c){ return std::isdigit(c); })) {
            throw std::invalid_argument("bad port in '" + url + "'");
        }
    }
    if (authority.empty()) {
        throw std::invalid_argument("no host in '" + url + "'");
    }
    ep.host = authority;
    return ep;
}

BeastHttpClient::BeastHttpClient(HttpEndpoint endpoint, std::chrono::seconds timeout)
    : m_endpoint(std::move(endpoint)), m_timeout(timeout) {}

namespace {

std::string sv_str(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

http::verb to_verb(HttpMethod m) {
    switch (m) {
    case HttpMethod::Get:  return http::verb::get;
    case HttpMethod::Head: return http::verb::head;
    case HttpMethod::Post: return http::verb::post;
    }
    return http::verb::get;
}

[[noreturn]] void fail(const char* step, const beast::error_code& ec) {
    std::string what = ec == beast::error::timeout ? "timed out" : ec.message();
    throw TransferError(TransferErrorKind::Network,
                        std::string("http ") + step + ": " + what);
}

// Runs the queued async operation to completion on 'ioc'
void run_op(net::io_context& ioc) {
    ioc.run();
    ioc.restart();
}

template <class Stream>
HttpResponse exchange(net::io_context& ioc,
                      Stream& stream,
                      http::request<http::string_body>& req,
                      std::optional<std::uint64_t> body_limit,
                      std::chrono::seconds timeout) {
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req,
                      [&](beast::error_code e, std::size_t) { ec = e; });
    run_op(ioc);
    if (ec) fail("write", ec);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(body_limit ? *body_limit : std::numeric_limits<std::uint64_t>::max());
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, parser,
                     [&](beast::error_code e, std::size_t) { ec = e; });
    run_op(ioc);
    if (ec) fail("read", ec);

    auto& res = parser.get();
    HttpResponse out;
    out.status = (int)res.result_int();
    for (auto const& field : res) {
        std::string name = sv_str(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c){ return (char)std::tolower(c); });
        out.headers[name] = sv_str(field.value());
    }
    out.body = std::move(res.body());
    return out;
}

} // namespace

HttpResponse BeastHttpClient::perform(const HttpRequest& in) {
    net::io_context ioc;

    http::request<http::string_body> req{to_verb(in.method),
                                         m_endpoint.base_path + in.target, 11};
    req.set(http::field::host, m_endpoint.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::connection, "close");
    for (const auto& [key, value] : in.headers) {
        req.set(key, value);
    }
    if (!in.body.empty() || in.method == HttpMethod::Post) {
        req.body() = in.body;
        req.prepare_payload();
    }

    PLOG("http", to_string(in.method) << " " << m_endpoint.host << ":"
         << m_endpoint.port << req.target());

    beast::error_code ec;
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(m_endpoint.host, m_endpoint.port, ec);
    if (ec) fail("resolve", ec);

    HttpResponse res;
    if (!m_endpoint.tls()) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(m_timeout);
        stream.async_connect(results, [&](beast::error_code e, tcp::endpoint) { ec = e; });
        run_op(ioc);
        if (ec) fail("connect", ec);

        res = exchange(ioc, stream, req, in.body_limit, m_timeout);

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    } else {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), m_endpoint.host.c_str())) {
            throw TransferError(TransferErrorKind::Network,
                                "http tls: cannot set SNI for " + m_endpoint.host);
        }
        stream.set_verify_callback(ssl::host_name_verification(m_endpoint.host));

        beast::get_lowest_layer(stream).expires_after(m_timeout);
        beast::get_lowest_layer(stream).async_connect(
            results, [&](beast::error_code e, tcp::endpoint) { ec = e; });
        run_op(ioc);
        if (ec) fail("connect", ec);

        beast::get_lowest_layer(stream).expires_after(m_timeout);
        stream.async_handshake(ssl::stream_base::client,
                               [&](beast::error_code e) { ec = e; });
        run_op(ioc);
        if (ec) fail("handshake", ec);

        res = exchange(ioc, stream, req, in.body_limit, m_timeout);

        beast::error_code ignored;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    PLOG("http", "-> " << res.status << " (" << res.body.size() << " bytes)");
    return res;
}

std::string url_encode(const std::string& s, bool keep_slash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        out += out.empty() ? "?" : "&";
        out += url_encode(key);
        out += "=";
        out += url_encode(value);
    }
    return out;
}
