#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "../../cache/response_cache.hpp"
#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../../parser/page_parser.hpp"
#include "../../proxy/pool/proxy_manager.hpp"
#include "../ratelimit/rate_limiter.hpp"
#include "../robots/robots_cache.hpp"
#include "crawl_context.hpp"
#include "crawl_result.hpp"

class CrawlerTest_AdmissionFilters_Test;
class CrawlerTest_ClassifiesFetchOutcomes_Test;
class CrawlerTest_TooManyRequestsPenalizesProxyAndDomain_Test;

namespace Ferret {
namespace Engine {

struct CrawlerConfig {
    std::vector<std::string> seeds;
    int                      max_depth = Core::Constants::DEFAULT_DEPTH;
    int                      max_pages = Core::Constants::DEFAULT_MAX_PAGES;
    int                      workers   = Core::Constants::DEFAULT_WORKERS;
    int                      threads   = Core::Constants::DEFAULT_THREADS;

    RateLimiterConfig        rate_limit;
    Proxy::Pool::ProxyConfig proxy;
    Cache::CacheConfig       cache;
    bool                     clear_cache = false;

    std::vector<std::string> allowed_domains;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    std::chrono::milliseconds timeout{
        std::chrono::seconds(Core::Constants::REQUEST_TIMEOUT_SECONDS)};
    int                       retry_count = Core::Constants::DEFAULT_RETRY_COUNT;
    std::chrono::milliseconds retry_delay{Core::Constants::DEFAULT_RETRY_DELAY_MS};

    std::string                        user_agent = Core::Constants::USER_AGENT;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    bool                               preserve_cookies = true;

    bool respect_robots   = true;
    bool follow_redirects = true;
    bool verify_ssl       = true;
    bool handle_signals   = false;
};

using ClientFactory = std::function<std::unique_ptr<Network::Http::HttpClient>()>;

class Crawler {
#ifndef CPPCHECK
    friend class ::CrawlerTest_AdmissionFilters_Test;
    friend class ::CrawlerTest_ClassifiesFetchOutcomes_Test;
    friend class ::CrawlerTest_TooManyRequestsPenalizesProxyAndDomain_Test;
#endif

public:
    // Beast fetcher, gumbo parser, HTTP prober.
    explicit Crawler(CrawlerConfig config);
    Crawler(CrawlerConfig                             config,
            ClientFactory                             client_factory,
            std::shared_ptr<const Parser::PageParser> parser,
            std::shared_ptr<Proxy::Pool::ProxyProber> prober = nullptr);
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Runs one crawl to completion. May be called again; per-run state starts fresh.
    std::vector<CrawlResult> crawl();

    // Stops dispatching new tasks; in-flight tasks finish. Safe from any thread.
    void stop();

    // Stats of the last finished run.
    CrawlStats stats() const;

    const CrawlerConfig& config() const {
        return config_;
    }
    RateLimiter& rate_limiter() {
        return rate_limiter_;
    }
    RobotsCache& robots() {
        return robots_;
    }
    Cache::ResponseCache& cache() {
        return cache_;
    }
    Proxy::Pool::ProxyManager& proxies() {
        return proxies_;
    }

#ifdef CPPCHECK
public:
#else
private:
#endif
    CrawlerConfig                             config_;
    ClientFactory                             client_factory_;
    std::shared_ptr<const Parser::PageParser> parser_;

    std::vector<std::regex>         include_res_;
    std::vector<std::regex>         exclude_res_;
    std::unordered_set<std::string> allowed_domains_;

    RateLimiter               rate_limiter_;
    RobotsCache               robots_;
    Cache::ResponseCache      cache_;
    Proxy::Pool::ProxyManager proxies_;

    mutable std::mutex          stats_mutex_;
    CrawlStats                  last_stats_;
    std::atomic<CrawlContext*>  active_ctx_{nullptr};
    std::mutex                  done_mutex_;
    std::condition_variable     done_cv_;

    // Declared after the components: destroyed first, taking pending coroutine frames with it.
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                                             work_guard_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    std::vector<std::thread>                 io_threads_;

    void validate_config() const;
    void compile_filters();
    void seed_frontier(CrawlContext& ctx);

    void init_io_services();
    void init_signals(CrawlContext& ctx);
    void spawn_workers(CrawlContext& ctx);
    void await_completion(CrawlContext& ctx);
    void shutdown();

    boost::asio::awaitable<void> worker_loop(CrawlContext& ctx, int worker_id);
    boost::asio::awaitable<std::optional<CrawlResult>>
    process_task(CrawlContext& ctx, Network::Http::HttpClient& client, const CrawlTask& task);
    boost::asio::awaitable<Response> fetch_with_retry(CrawlContext&              ctx,
                                                      Network::Http::HttpClient& client,
                                                      const CrawlTask&           task);

    Request     build_request(CrawlContext& ctx, const std::string& url, const std::string& proxy);
    void        apply_crawl_delay(const std::string& url);
    std::vector<std::string> normalize_links(const std::vector<std::string>& links,
                                             const std::string&              base_url) const;

    bool passes_filters(const std::string& url) const;
    boost::asio::awaitable<bool> admit(CrawlContext&              ctx,
                                       Network::Http::HttpClient& client,
                                       const std::string&         url,
                                       int                        depth);
};

}  // namespace Engine
}  // namespace Ferret
