#include <exception>
#include <iostream>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"

namespace {

using Ferret::Core::Config;
using Ferret::Core::Logger;

Ferret::Engine::CrawlerConfig to_crawler_config(const Config& config) {
    namespace Pool = Ferret::Proxy::Pool;
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    Ferret::Engine::CrawlerConfig out;
    out.seeds     = config.urls;
    out.max_depth = config.depth;
    out.max_pages = config.max_pages;
    out.workers   = config.workers;
    out.threads   = config.threads;

    out.rate_limit.base_delay    = config.delay;
    out.rate_limit.min_delay     = config.min_delay;
    out.rate_limit.max_delay     = config.max_delay;
    out.rate_limit.random_range  = config.random_range;
    out.rate_limit.retry_factor  = config.retry_factor;
    out.rate_limit.domain_delays = config.domain_delays;

    out.proxy.proxies               = config.proxies;
    out.proxy.strategy              = Pool::parse_strategy(config.proxy_strategy);
    out.proxy.max_failures          = config.proxy_max_failures;
    out.proxy.health_check_interval = seconds(config.proxy_check_interval);
    out.proxy.cooldown              = seconds(config.proxy_cooldown);
    out.proxy.test_url              = config.proxy_test_url;
    out.proxy.health_check          = config.proxy_health_check;

    out.cache.enabled  = config.cache_enabled;
    out.cache.dir      = config.cache_dir;
    out.cache.expiry   = seconds(config.cache_expiry);
    out.cache.max_size = config.cache_max_size;
    out.clear_cache    = config.clear_cache;

    out.allowed_domains  = config.allowed_domains;
    out.include_patterns = config.include_patterns;
    out.exclude_patterns = config.exclude_patterns;

    out.timeout     = milliseconds(static_cast<long long>(config.timeout * 1000));
    out.retry_count = config.retries;
    out.retry_delay = milliseconds(config.retry_delay_ms);

    out.user_agent       = config.user_agent;
    out.headers          = config.headers;
    out.cookies          = config.cookies;
    out.preserve_cookies = config.preserve_cookies;

    out.respect_robots   = config.respect_robots;
    out.follow_redirects = config.follow_redirects;
    out.verify_ssl       = config.verify_ssl;
    out.handle_signals   = true;
    return out;
}

void print_summary(const std::vector<Ferret::Engine::CrawlResult>& results,
                   const Ferret::Engine::CrawlStats&               stats) {
    for (const auto& result : results) {
        std::string line = std::string(Ferret::Engine::to_string(result.status)) + " "
                           + std::to_string(result.depth) + " " + result.url;
        if (result.status_code != 0)
            line += " [" + std::to_string(result.status_code) + "]";
        if (result.from_cache)
            line += " (cached)";
        if (!result.error.empty())
            line += " - " + result.error;
        std::cout << line << std::endl;
    }

    Logger::info("Pages: " + std::to_string(stats.pages_crawled) + ", ok: "
                 + std::to_string(stats.successes) + ", failed: " + std::to_string(stats.errors)
                 + ", cache hits: " + std::to_string(stats.cache_hits) + ", robots blocked: "
                 + std::to_string(stats.robots_blocked));
    Logger::info("Domains: " + std::to_string(stats.unique_domains) + ", URLs discovered: "
                 + std::to_string(stats.urls_discovered) + ", bytes: "
                 + std::to_string(stats.bytes_downloaded));
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Config::parse(argc, argv);

        if (config.quiet)
            Logger::set_level(Ferret::Core::LOG_ERROR);
        else if (config.verbose)
            Logger::set_level(Ferret::Core::LOG_ALL | Ferret::Core::LOG_DEBUG);

        if (config.urls.empty()) {
            Logger::error("No URLs provided. See --help.");
            return 1;
        }

        Ferret::Engine::Crawler crawler(to_crawler_config(config));
        auto                    results = crawler.crawl();
        print_summary(results, crawler.stats());
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
    return 0;
}
