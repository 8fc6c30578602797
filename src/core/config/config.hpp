#pragma once
#include <map>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Ferret {
namespace Core {

struct Config {
    std::vector<std::string> urls;
    std::string              config_path;

    int depth     = Constants::DEFAULT_DEPTH;
    int max_pages = Constants::DEFAULT_MAX_PAGES;
    int workers   = Constants::DEFAULT_WORKERS;
    int threads   = Constants::DEFAULT_THREADS;

    // Politeness, seconds
    double                        delay        = Constants::DEFAULT_BASE_DELAY;
    double                        min_delay    = Constants::DEFAULT_MIN_DELAY;
    double                        max_delay    = Constants::DEFAULT_MAX_DELAY;
    double                        random_range = Constants::DEFAULT_RANDOM_RANGE;
    double                        retry_factor = Constants::DEFAULT_RETRY_FACTOR;
    std::map<std::string, double> domain_delays;

    std::vector<std::string> proxies;
    std::string              proxy_strategy       = "round_robin";
    int                      proxy_max_failures   = Constants::DEFAULT_PROXY_MAX_FAILURES;
    int                      proxy_check_interval = Constants::DEFAULT_PROXY_CHECK_INTERVAL_S;
    int                      proxy_cooldown       = Constants::DEFAULT_PROXY_COOLDOWN_S;
    std::string              proxy_test_url       = Constants::DEFAULT_PROXY_TEST_URL;
    bool                     proxy_health_check   = true;

    bool        cache_enabled  = true;
    std::string cache_dir      = Constants::DEFAULT_CACHE_DIR;
    int         cache_expiry   = Constants::DEFAULT_CACHE_EXPIRY_S;  // seconds
    size_t      cache_max_size = Constants::DEFAULT_CACHE_MAX_SIZE;
    bool        clear_cache    = false;

    std::vector<std::string> allowed_domains;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    double timeout        = Constants::REQUEST_TIMEOUT_SECONDS;  // seconds
    int    retries        = Constants::DEFAULT_RETRY_COUNT;
    int    retry_delay_ms = Constants::DEFAULT_RETRY_DELAY_MS;

    std::string                        user_agent = Constants::USER_AGENT;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    bool                               preserve_cookies = true;

    bool respect_robots   = true;
    bool follow_redirects = true;
    bool verify_ssl       = true;
    bool verbose          = false;
    bool quiet            = false;

    // CLI arguments win over the YAML file given with --config.
    static Config parse(int argc, char* argv[]);

    static void                     load_yaml(Config& config, const std::string& path);
    static std::vector<std::string> read_proxy_list(const std::string& path);
};

}  // namespace Core
}  // namespace Ferret
