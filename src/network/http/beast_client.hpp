#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Ferret {
namespace Network {
namespace Http {

/**
 * HTTP/1.1 client over Boost.Beast. One connection per request, TLS via OpenSSL.
 * Proxies are plain HTTP proxies: absolute-form requests for http targets and a
 * CONNECT tunnel for https targets. get() keeps no per-call state on the object,
 * so one instance may serve concurrent coroutines.
 */
class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_connect_timeout(std::chrono::milliseconds timeout);
    void set_user_agent(const std::string& user_agent);

    boost::asio::awaitable<Response> get(const Request& request) override;

private:
    enum class Stage { Resolve, Connect, Tunnel, Handshake, Exchange };

    struct Endpoint {
        std::string url;
        std::string host;
        std::string port;
        std::string target;
        std::string connect_host;
        std::string connect_port;
        bool        is_ssl    = false;
        bool        via_proxy = false;
    };

    std::chrono::milliseconds connect_timeout_{
        std::chrono::seconds(Ferret::Core::Constants::CONNECT_TIMEOUT_SECONDS)};
    std::string               user_agent_ = Ferret::Core::Constants::USER_AGENT;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};

    boost::asio::awaitable<Response> fetch_once(const Request& request, const std::string& url);
    boost::asio::awaitable<Response>
    perform_http_request(const Request& request, const Endpoint& ep, Stage& stage);
    boost::asio::awaitable<Response>
    perform_https_request(const Request& request, const Endpoint& ep, Stage& stage);

    template <class Body>
    void apply_request_headers(boost::beast::http::request<Body>& req,
                               const Request&                     request,
                               const std::string&                 host) const;

    static ErrorType
    classify_error(const boost::system::error_code& ec, Stage stage, bool via_proxy);
};

}  // namespace Http
}  // namespace Network
}  // namespace Ferret
