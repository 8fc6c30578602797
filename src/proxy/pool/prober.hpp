#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <string>
#include "../../network/http/beast_client.hpp"

namespace Ferret {
namespace Proxy {
namespace Pool {

struct ProbeResult {
    bool        ok              = false;
    double      latency_seconds = 0.0;
    std::string error;
};

class ProxyProber {
public:
    virtual ~ProxyProber() = default;

    virtual boost::asio::awaitable<ProbeResult> probe(const std::string& address) = 0;
};

// Fetches a test URL through the proxy; healthy means HTTP 200 within the timeout.
class HttpProber : public ProxyProber {
public:
    HttpProber(std::string test_url, std::chrono::milliseconds timeout, bool verify_ssl = true);

    boost::asio::awaitable<ProbeResult> probe(const std::string& address) override;

private:
    std::string                      test_url_;
    std::chrono::milliseconds        timeout_;
    bool                             verify_ssl_;
    Network::Http::BeastClient       client_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Ferret
