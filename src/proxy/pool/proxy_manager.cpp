#include "proxy_manager.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"

namespace Ferret {
namespace Proxy {
namespace Pool {

namespace net = boost::asio;
using Ferret::Core::Logger;

namespace {
constexpr int PROBE_POLL_INTERVAL_MS = 25;
}  // namespace

ProxyManager::ProxyManager(ProxyConfig config, std::shared_ptr<ProxyProber> prober)
    : config_(std::move(config)),
      pool_(config_.proxies, config_.max_failures, config_.cooldown),
      prober_(std::move(prober)) {
}

ProxyManager::~ProxyManager() {
    stop();
}

net::awaitable<std::optional<ProxyRecord>> ProxyManager::acquire() {
    if (pool_.empty())
        co_return std::nullopt;

    if (pool_.active_count() == 0 && prober_) {
        auto candidates = pool_.take_recoverable();
        if (!candidates.empty()) {
            Logger::info("No active proxies, probing " + std::to_string(candidates.size())
                         + " quarantined proxies");
            co_await probe_all(std::move(candidates));
        }
    }

    auto selected = pool_.select(config_.strategy);
    if (!selected)
        Logger::warn("No proxy available, continuing without one");
    co_return selected;
}

void ProxyManager::report_success(const std::string& address) {
    pool_.report_success(address);
}

void ProxyManager::report_failure(const std::string& address) {
    pool_.report_failure(address);
}

net::awaitable<void> ProxyManager::check_all() {
    if (!prober_)
        co_return;
    std::vector<std::string> targets = pool_.active_addresses();
    for (auto& address : pool_.take_recoverable())
        targets.push_back(std::move(address));
    if (targets.empty())
        co_return;

    Logger::debug("Health check: probing " + std::to_string(targets.size()) + " proxies");
    co_await probe_all(std::move(targets));

    auto stats = pool_.stats();
    Logger::info("Proxy health: " + std::to_string(stats.active) + " active, "
                 + std::to_string(stats.dead) + " dead");
}

net::awaitable<void> ProxyManager::probe_all(std::vector<std::string> addresses) {
    auto executor  = co_await net::this_coro::executor;
    auto remaining = std::make_shared<std::atomic<size_t>>(addresses.size());

    for (auto& address : addresses) {
        net::co_spawn(executor, probe_one(std::move(address)), [remaining](std::exception_ptr) {
            (*remaining)--;
        });
    }

    net::steady_timer timer(executor);
    while (*remaining > 0) {
        timer.expires_after(std::chrono::milliseconds(PROBE_POLL_INTERVAL_MS));
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

net::awaitable<void> ProxyManager::probe_one(std::string address) {
    ProbeResult result;
    try {
        result = co_await prober_->probe(address);
    } catch (const std::exception& e) {
        result.ok    = false;
        result.error = e.what();
    }
    if (!result.ok && !result.error.empty())
        Logger::debug("Probe " + address + ": " + result.error);
    pool_.record_probe(address, result.ok, result.latency_seconds);
}

void ProxyManager::start(const net::any_io_executor& executor) {
    if (!config_.health_check || pool_.empty() || !prober_ || running_.exchange(true))
        return;
    stopping_ = false;
    net::co_spawn(net::make_strand(executor), health_loop(), net::detached);
    Logger::info("Proxy health checks every "
                 + std::to_string(config_.health_check_interval.count()) + "ms");
}

void ProxyManager::stop() {
    stopping_ = true;
    std::lock_guard<std::mutex> lock(timer_mutex_);
    // Expired once the loop's frame is gone, including when its io_context was destroyed.
    if (auto timer = timer_.lock()) {
        net::post(timer->get_executor(), [timer]() { timer->cancel(); });
    }
    timer_.reset();
}

net::awaitable<void> ProxyManager::health_loop() {
    auto timer = std::make_shared<net::steady_timer>(co_await net::this_coro::executor);
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_ = timer;
    }

    try {
        while (!stopping_) {
            co_await check_all();
            if (stopping_)
                break;

            timer->expires_after(config_.health_check_interval);
            boost::system::error_code ec;
            co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec == net::error::operation_aborted)
                break;
        }
    } catch (const std::exception& e) {
        Logger::error("Proxy health loop failed: " + std::string(e.what()));
    }

    running_ = false;
    Logger::debug("Proxy health loop stopped");
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Ferret
