#include "robots_cache.hpp"
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Ferret {
namespace Engine {

namespace net = boost::asio;

using Ferret::Core::Logger;
using Ferret::Network::Http::HttpClient;
using Ferret::Utils::RobotsTxt;
using Ferret::Utils::Url;

RobotsCache::RobotsCache(std::string user_agent, std::chrono::milliseconds timeout, bool verify_ssl)
    : user_agent_(std::move(user_agent)), timeout_(timeout), verify_ssl_(verify_ssl) {
}

net::awaitable<bool> RobotsCache::is_allowed(const std::string& url, HttpClient& client) {
    auto parsed = Url::parse(url);
    if (parsed.host.empty() || parsed.path == "/robots.txt")
        co_return true;

    auto robots = co_await policy_for(Url::origin(url), client);
    std::string path = parsed.path;
    if (!parsed.query.empty())
        path += "?" + parsed.query;

    if (robots && !robots->is_allowed(user_agent_, path)) {
        Logger::info("Blocked by robots.txt: " + url);
        co_return false;
    }
    co_return true;
}

net::awaitable<std::shared_ptr<const RobotsTxt>>
RobotsCache::policy_for(const std::string& origin, HttpClient& client) {
    std::shared_ptr<Entry> entry;
    bool                   owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = entries_.find(origin);
        if (it == entries_.end()) {
            entry = std::make_shared<Entry>();
            entries_.emplace(origin, entry);
            owner = true;
        }
        else {
            entry = it->second;
            if (entry->ready)
                co_return entry->robots;
        }
    }

    if (owner) {
        auto robots = co_await fetch(origin, client);
        std::lock_guard<std::mutex> lock(mutex_);
        entry->robots = robots;
        entry->ready  = true;
        co_return robots;
    }

    net::steady_timer timer(co_await net::this_coro::executor);
    for (;;) {
        timer.expires_after(std::chrono::milliseconds(WAIT_POLL_MS));
        co_await timer.async_wait(net::use_awaitable);
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry->ready)
            co_return entry->robots;
    }
}

net::awaitable<std::shared_ptr<const RobotsTxt>>
RobotsCache::fetch(const std::string& origin, HttpClient& client) {
    Request request;
    request.url        = origin + "/robots.txt";
    request.timeout    = timeout_;
    request.verify_ssl = verify_ssl_;
    request.headers.emplace_back("User-Agent", user_agent_);

    Logger::debug("Fetching robots.txt: " + request.url);
    Response res;
    try {
        res = co_await client.get(request);
    } catch (const std::exception& e) {
        res.error = e.what();
    }

    if (res.status_code >= 200 && res.status_code < 300) {
        co_return std::make_shared<const RobotsTxt>(RobotsTxt::parse(res.body));
    }

    if (res.status_code != 0)
        Logger::warn("robots.txt unavailable for " + origin + " (HTTP "
                     + std::to_string(res.status_code) + "), allowing all");
    else
        Logger::warn("robots.txt unreachable for " + origin + " (" + res.error + "), allowing all");
    co_return std::make_shared<const RobotsTxt>();
}

double RobotsCache::crawl_delay(const std::string& url) const {
    std::shared_ptr<const RobotsTxt> robots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = entries_.find(Url::origin(url));
        if (it == entries_.end() || !it->second->ready)
            return 0.0;
        robots = it->second->robots;
    }
    return robots ? robots->get_crawl_delay(user_agent_) : 0.0;
}

size_t RobotsCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace Engine
}  // namespace Ferret
