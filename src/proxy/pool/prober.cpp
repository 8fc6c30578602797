#include "prober.hpp"
#include "../../core/logger/logger.hpp"

namespace Ferret {
namespace Proxy {
namespace Pool {

using Ferret::Core::Logger;

HttpProber::HttpProber(std::string test_url, std::chrono::milliseconds timeout, bool verify_ssl)
    : test_url_(std::move(test_url)), timeout_(timeout), verify_ssl_(verify_ssl) {
    client_.set_connect_timeout(timeout_);
}

boost::asio::awaitable<ProbeResult> HttpProber::probe(const std::string& address) {
    Request request;
    request.url              = test_url_;
    request.proxy            = address;
    request.timeout          = timeout_;
    request.follow_redirects = false;
    request.verify_ssl       = verify_ssl_;

    auto     start = std::chrono::steady_clock::now();
    Response res   = co_await client_.get(request);
    auto     took  = std::chrono::steady_clock::now() - start;

    ProbeResult result;
    result.ok              = res.status_code == 200;
    result.latency_seconds = std::chrono::duration<double>(took).count();
    if (!result.ok) {
        result.error = res.error.empty() ? "HTTP " + std::to_string(res.status_code) : res.error;
        Logger::debug("Probe failed for " + address + ": " + result.error);
    }
    co_return result;
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Ferret
