#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../../network/http/http_client.hpp"
#include "../../utils/robotstxt/robotstxt.hpp"

namespace Ferret {
namespace Engine {

/**
 * robots.txt policies per origin, fetched once per run.
 *
 * The first caller for an origin registers a pending entry and performs the
 * fetch; concurrent callers for the same origin wait on a timer until the entry
 * is ready. Anything but a 2xx answer is cached as allow-all.
 */
class RobotsCache {
public:
    RobotsCache(std::string               user_agent,
                std::chrono::milliseconds timeout,
                bool                      verify_ssl = true);

    boost::asio::awaitable<bool> is_allowed(const std::string&           url,
                                            Network::Http::HttpClient& client);

    // Crawl-delay in seconds for our agent, 0 when unknown or not yet fetched.
    double crawl_delay(const std::string& url) const;
    size_t size() const;

    const std::string& user_agent() const {
        return user_agent_;
    }

private:
    struct Entry {
        bool                                    ready = false;
        std::shared_ptr<const Utils::RobotsTxt> robots;
    };

    boost::asio::awaitable<std::shared_ptr<const Utils::RobotsTxt>>
    policy_for(const std::string& origin, Network::Http::HttpClient& client);
    boost::asio::awaitable<std::shared_ptr<const Utils::RobotsTxt>>
    fetch(const std::string& origin, Network::Http::HttpClient& client);

    std::string               user_agent_;
    std::chrono::milliseconds timeout_;
    bool                      verify_ssl_;

    mutable std::mutex                                      mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    static constexpr int WAIT_POLL_MS = 25;
};

}  // namespace Engine
}  // namespace Ferret
