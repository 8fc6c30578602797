#include "beast_client.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Ferret {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Ferret::Core::Constants;
using Ferret::Core::Logger;
using Ferret::Utils::Url;
using Ferret::Utils::UrlParsed;

namespace {

bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string strip_brackets(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

Response error_response(const std::string& url, ErrorType type, const std::string& message) {
    Response response;
    response.effective_url = url;
    response.success       = false;
    response.error         = message;
    response.error_type    = type;
    return response;
}

void collect_response(Response& response, http::response<http::string_body>& res) {
    response.status_code = res.result_int();
    response.success     = (response.status_code >= 200 && response.status_code < 400);
    for (const auto& field : res) {
        response.headers.emplace_back(std::string(field.name_string()),
                                      std::string(field.value()));
    }
    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    response.body = std::move(res.body());
}

}  // namespace

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

net::awaitable<Response> BeastClient::get(const Request& request) {
    std::string url = request.url;
    for (int hop = 0;; ++hop) {
        Response res = co_await fetch_once(request, url);
        if (!request.follow_redirects || !is_redirect(res.status_code))
            co_return res;

        std::string location = res.header("Location");
        if (location.empty())
            co_return res;
        if (hop >= Constants::MAX_REDIRECTS) {
            Logger::warn("Too many redirects: " + request.url);
            co_return res;
        }

        std::string next = Url::resolve(url, location);
        if (next.empty() || !Url::is_http(next))
            co_return res;
        Logger::debug("Redirect " + std::to_string(res.status_code) + ": " + url + " -> " + next);
        url = next;
    }
}

ErrorType BeastClient::classify_error(const boost::system::error_code& ec,
                                      Stage                            stage,
                                      bool                             via_proxy) {
    if (ec == beast::error::timeout || ec == net::error::timed_out)
        return ErrorType::Timeout;
    if (ec == http::error::body_limit)
        return ErrorType::Http;
    if (ec.category() == net::error::get_ssl_category()
        || ec.category() == ssl::error::get_stream_category() || stage == Stage::Handshake)
        return ErrorType::Ssl;
    if (via_proxy && stage != Stage::Exchange)
        return ErrorType::Proxy;
    return ErrorType::Connection;
}

net::awaitable<Response> BeastClient::fetch_once(const Request& request, const std::string& url) {
    UrlParsed parsed = Url::parse(url);
    Endpoint  ep;
    ep.url           = url;
    ep.is_ssl        = Utils::Text::to_lower(parsed.scheme) == "https";
    if (parsed.host.empty() || !Url::is_http(url)) {
        co_return error_response(url, ErrorType::InvalidUrl, "Invalid URL");
    }

    ep.host   = parsed.host;
    ep.port   = parsed.port.empty() ? (ep.is_ssl ? "443" : "80") : parsed.port;
    ep.target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        ep.target += "?" + parsed.query;

    ep.connect_host = ep.host;
    ep.connect_port = ep.port;

    if (!request.proxy.empty()) {
        std::string proxy = request.proxy;
        if (proxy.find("://") == std::string::npos)
            proxy = "http://" + proxy;
        UrlParsed proxy_parsed = Url::parse(proxy);
        if (Utils::Text::to_lower(proxy_parsed.scheme) != "http" || proxy_parsed.host.empty()) {
            co_return error_response(
                url, ErrorType::Proxy, "Unsupported proxy: " + request.proxy);
        }
        ep.via_proxy    = true;
        ep.connect_host = proxy_parsed.host;
        ep.connect_port = proxy_parsed.port.empty() ? "8080" : proxy_parsed.port;
    }

    Stage stage = Stage::Resolve;
    try {
        if (ep.is_ssl)
            co_return co_await perform_https_request(request, ep, stage);
        co_return co_await perform_http_request(request, ep, stage);
    } catch (const boost::system::system_error& e) {
        co_return error_response(url, classify_error(e.code(), stage, ep.via_proxy), e.what());
    } catch (const std::exception& e) {
        co_return error_response(url, ErrorType::Connection, e.what());
    }
}

template <class Body>
void BeastClient::apply_request_headers(http::request<Body>& req,
                                        const Request&       request,
                                        const std::string&   host) const {
    req.set(http::field::host, host);
    req.set(http::field::user_agent, user_agent_);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.cookies.empty()) {
        std::string cookie;
        for (const auto& [name, value] : request.cookies) {
            if (!cookie.empty())
                cookie += "; ";
            cookie += name + "=" + value;
        }
        req.set(http::field::cookie, cookie);
    }
}

net::awaitable<Response>
BeastClient::perform_http_request(const Request& request, const Endpoint& ep, Stage& stage) {
    Response response;
    response.effective_url = ep.url;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(
        strip_brackets(ep.connect_host), ep.connect_port, net::use_awaitable);

    stage = Stage::Connect;
    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(std::min(connect_timeout_, request.timeout));
    co_await stream.async_connect(results, net::use_awaitable);

    stage = Stage::Exchange;
    stream.expires_after(request.timeout);

    // Proxies expect the absolute-form request target.
    std::string req_target = ep.via_proxy ? ep.url.substr(0, ep.url.find('#')) : ep.target;

    http::request<http::empty_body> req{http::verb::get, req_target, 11};
    apply_request_headers(req, request, ep.port == "80" ? ep.host : ep.host + ":" + ep.port);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(Constants::MAX_BODY_BYTES);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    auto res = parser.release();
    collect_response(response, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response>
BeastClient::perform_https_request(const Request& request, const Endpoint& ep, Stage& stage) {
    Response response;
    response.effective_url = ep.url;

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(
        strip_brackets(ep.connect_host), ep.connect_port, net::use_awaitable);

    std::string sni_host = strip_brackets(ep.host);
    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), sni_host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }
    if (request.verify_ssl) {
        ssl_stream.set_verify_mode(ssl::verify_peer);
        ssl_stream.set_verify_callback(ssl::host_name_verification(sni_host));
    }
    else {
        ssl_stream.set_verify_mode(ssl::verify_none);
    }

    stage = Stage::Connect;
    beast::get_lowest_layer(ssl_stream).expires_after(std::min(connect_timeout_, request.timeout));
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);

    if (ep.via_proxy) {
        stage                = Stage::Tunnel;
        std::string authority = ep.host + ":" + ep.port;

        http::request<http::empty_body> connect_req{http::verb::connect, authority, 11};
        connect_req.set(http::field::host, authority);
        connect_req.set(http::field::user_agent, user_agent_);
        co_await http::async_write(
            beast::get_lowest_layer(ssl_stream), connect_req, net::use_awaitable);

        beast::flat_buffer                      tunnel_buffer;
        http::response_parser<http::empty_body> tunnel_parser;
        tunnel_parser.skip(true);
        co_await http::async_read_header(
            beast::get_lowest_layer(ssl_stream), tunnel_buffer, tunnel_parser, net::use_awaitable);

        if (tunnel_parser.get().result() != http::status::ok) {
            co_return error_response(
                ep.url,
                ErrorType::Proxy,
                "Proxy CONNECT failed (" + std::to_string(tunnel_parser.get().result_int()) + ")");
        }
    }

    stage = Stage::Handshake;
    beast::get_lowest_layer(ssl_stream).expires_after(std::min(connect_timeout_, request.timeout));
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    stage = Stage::Exchange;
    beast::get_lowest_layer(ssl_stream).expires_after(request.timeout);

    http::request<http::empty_body> req{http::verb::get, ep.target, 11};
    apply_request_headers(req, request, ep.port == "443" ? ep.host : ep.host + ":" + ep.port);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(Constants::MAX_BODY_BYTES);
    co_await http::async_read(ssl_stream, buffer, parser, net::use_awaitable);

    auto res = parser.release();
    collect_response(response, res);

    // Many servers close without a close_notify; the response is already complete.
    beast::error_code ec;
    beast::get_lowest_layer(ssl_stream).expires_after(std::chrono::seconds(2));
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Ferret
