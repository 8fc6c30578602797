#pragma once
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "prober.hpp"
#include "proxy_pool.hpp"

namespace Ferret {
namespace Proxy {
namespace Pool {

struct ProxyConfig {
    std::vector<std::string>  proxies;
    Strategy                  strategy     = Strategy::RoundRobin;
    int                       max_failures = Core::Constants::DEFAULT_PROXY_MAX_FAILURES;
    std::chrono::milliseconds health_check_interval{
        std::chrono::seconds(Core::Constants::DEFAULT_PROXY_CHECK_INTERVAL_S)};
    std::chrono::milliseconds cooldown{
        std::chrono::seconds(Core::Constants::DEFAULT_PROXY_COOLDOWN_S)};
    std::chrono::milliseconds probe_timeout{
        std::chrono::seconds(Core::Constants::DEFAULT_PROXY_PROBE_TIMEOUT_S)};
    std::string test_url     = Core::Constants::DEFAULT_PROXY_TEST_URL;
    bool        health_check = true;
};

/**
 * Async front of the ProxyPool. Probes run outside the pool lock; their
 * outcomes are fed back through record_probe(). The health loop is a
 * cancellable coroutine on its own strand, started and stopped by the owner.
 */
class ProxyManager {
public:
    ProxyManager(ProxyConfig config, std::shared_ptr<ProxyProber> prober);
    ~ProxyManager();

    ProxyManager(const ProxyManager&)            = delete;
    ProxyManager& operator=(const ProxyManager&) = delete;

    // Tries recovery of cooled-down dead proxies first when nothing is active.
    boost::asio::awaitable<std::optional<ProxyRecord>> acquire();

    void report_success(const std::string& address);
    void report_failure(const std::string& address);

    // One health pass: every active proxy plus recoverable dead ones.
    boost::asio::awaitable<void> check_all();

    void start(const boost::asio::any_io_executor& executor);
    void stop();
    bool running() const {
        return running_;
    }

    bool enabled() const {
        return !pool_.empty();
    }
    ProxyPool& pool() {
        return pool_;
    }
    const ProxyConfig& config() const {
        return config_;
    }

private:
    boost::asio::awaitable<void> health_loop();
    boost::asio::awaitable<void> probe_all(std::vector<std::string> addresses);
    boost::asio::awaitable<void> probe_one(std::string address);

    ProxyConfig                  config_;
    ProxyPool                    pool_;
    std::shared_ptr<ProxyProber> prober_;

    std::mutex                                 timer_mutex_;
    std::weak_ptr<boost::asio::steady_timer>   timer_;
    std::atomic<bool>                          stopping_{false};
    std::atomic<bool>                          running_{false};
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Ferret
