#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"

namespace Ferret {
namespace Core {

using Ferret::Utils::Text::trim;

namespace {

template <typename T>
void read_key(const YAML::Node& yaml, const char* key, T& out) {
    if (yaml[key])
        out = yaml[key].as<T>();
}

template <typename T>
void read_list(const YAML::Node& yaml, const char* key, std::vector<T>& out) {
    const YAML::Node node = yaml[key];
    if (!node)
        return;
    if (node.IsSequence()) {
        for (const auto& item : node)
            out.push_back(item.as<T>());
    }
    else {
        out.push_back(node.as<T>());
    }
}

template <typename V>
void read_map(const YAML::Node& yaml, const char* key, std::map<std::string, V>& out) {
    const YAML::Node node = yaml[key];
    if (!node || !node.IsMap())
        return;
    for (auto it = node.begin(); it != node.end(); ++it)
        out[it->first.as<std::string>()] = it->second.as<V>();
}

// "Name: value" or "name=value", split at the first separator.
bool split_pair(const std::string& raw, char sep, std::pair<std::string, std::string>& out) {
    size_t pos = raw.find(sep);
    if (pos == std::string::npos)
        return false;
    out.first  = trim(raw.substr(0, pos));
    out.second = trim(raw.substr(pos + 1));
    return !out.first.empty();
}

}  // namespace

void Config::load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (!yaml.IsMap())
            return;

        read_list(yaml, "urls", config.urls);
        read_list(yaml, "seeds", config.urls);

        read_key(yaml, "depth", config.depth);
        read_key(yaml, "max_depth", config.depth);
        read_key(yaml, "max_pages", config.max_pages);
        read_key(yaml, "workers", config.workers);
        read_key(yaml, "threads", config.threads);

        read_key(yaml, "delay", config.delay);
        read_key(yaml, "base_delay", config.delay);
        read_key(yaml, "min_delay", config.min_delay);
        read_key(yaml, "max_delay", config.max_delay);
        read_key(yaml, "random_range", config.random_range);
        read_key(yaml, "retry_factor", config.retry_factor);
        read_map(yaml, "domain_delays", config.domain_delays);

        read_list(yaml, "proxies", config.proxies);
        if (yaml["proxy_list"]) {
            for (auto& proxy : read_proxy_list(yaml["proxy_list"].as<std::string>()))
                config.proxies.push_back(std::move(proxy));
        }
        read_key(yaml, "proxy_strategy", config.proxy_strategy);
        read_key(yaml, "proxy_max_failures", config.proxy_max_failures);
        read_key(yaml, "proxy_check_interval", config.proxy_check_interval);
        read_key(yaml, "proxy_cooldown", config.proxy_cooldown);
        read_key(yaml, "proxy_test_url", config.proxy_test_url);
        read_key(yaml, "proxy_health_check", config.proxy_health_check);

        read_key(yaml, "cache_enabled", config.cache_enabled);
        read_key(yaml, "cache_dir", config.cache_dir);
        read_key(yaml, "cache_expiry", config.cache_expiry);
        read_key(yaml, "cache_max_size", config.cache_max_size);

        read_list(yaml, "allowed_domains", config.allowed_domains);
        read_list(yaml, "include", config.include_patterns);
        read_list(yaml, "exclude", config.exclude_patterns);

        read_key(yaml, "timeout", config.timeout);
        read_key(yaml, "retries", config.retries);
        read_key(yaml, "retry_count", config.retries);
        read_key(yaml, "retry_delay", config.retry_delay_ms);

        read_key(yaml, "user_agent", config.user_agent);
        read_map(yaml, "headers", config.headers);
        read_map(yaml, "cookies", config.cookies);
        read_key(yaml, "preserve_cookies", config.preserve_cookies);

        read_key(yaml, "respect_robots", config.respect_robots);
        read_key(yaml, "follow_redirects", config.follow_redirects);
        read_key(yaml, "verify_ssl", config.verify_ssl);
        read_key(yaml, "verbose", config.verbose);
        read_key(yaml, "quiet", config.quiet);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

std::vector<std::string> Config::read_proxy_list(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open proxy list: " + path);

    std::vector<std::string> proxies;
    std::string              line;
    while (std::getline(file, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (!line.empty())
            proxies.push_back(line);
    }
    return proxies;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Ferret - polite breadth-first web crawler"};

    std::vector<std::string> single_proxies;
    std::string              proxy_list_path;
    std::vector<std::string> raw_headers;
    std::vector<std::string> raw_cookies;

    bool no_proxy_health_check = false;
    bool no_cache              = false;
    bool no_preserve_cookies   = false;
    bool no_robots             = false;
    bool no_redirects          = false;
    bool insecure              = false;

    app.add_option("urls", config.urls, "Seed URLs to crawl");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_option("-d,--depth", config.depth, "Maximum link depth");
    app.add_option("-m,--max-pages", config.max_pages, "Maximum number of pages");
    app.add_option("-w,--workers", config.workers, "Concurrent crawl workers");
    app.add_option("-t,--threads", config.threads, "IO threads");

    app.add_option("--delay", config.delay, "Base delay between requests to a domain (s)");
    app.add_option("--min-delay", config.min_delay, "Minimum delay (s)");
    app.add_option("--max-delay", config.max_delay, "Maximum delay (s)");
    app.add_option("--random-range", config.random_range, "Jitter as a fraction of the delay");
    app.add_option("--retry-factor", config.retry_factor, "Backoff multiplier per failure");

    app.add_option("-p,--proxy", single_proxies, "Proxy URL (repeatable)");
    app.add_option("--proxy-list", proxy_list_path, "File containing list of proxies");
    app.add_option("--proxy-strategy", config.proxy_strategy, "round_robin, random or fastest");
    app.add_option(
        "--proxy-max-failures", config.proxy_max_failures, "Failures before a proxy is dead");
    app.add_option(
        "--proxy-check-interval", config.proxy_check_interval, "Health check interval (s)");
    app.add_option("--proxy-cooldown", config.proxy_cooldown, "Dead proxy cool-down (s)");
    app.add_option("--proxy-test-url", config.proxy_test_url, "URL used to probe proxies");
    app.add_flag("--no-proxy-health-check", no_proxy_health_check, "Disable proxy health checks");

    app.add_flag("--no-cache", no_cache, "Disable the response cache");
    app.add_option("--cache-dir", config.cache_dir, "Cache directory");
    app.add_option("--cache-expiry", config.cache_expiry, "Cache entry lifetime (s)");
    app.add_option("--cache-max-size", config.cache_max_size, "Maximum cached entries");
    app.add_flag("--clear-cache", config.clear_cache, "Empty the cache before crawling");

    app.add_option("--allowed-domain", config.allowed_domains, "Restrict to domain (repeatable)");
    app.add_option("--include", config.include_patterns, "URL regex that must match");
    app.add_option("--exclude", config.exclude_patterns, "URL regex that must not match");

    app.add_option("--timeout", config.timeout, "Request timeout (s)");
    app.add_option("--retries", config.retries, "Retries per page");
    app.add_option("--retry-delay", config.retry_delay_ms, "Base retry backoff (ms)");

    app.add_option("--user-agent", config.user_agent, "User-Agent header");
    app.add_option("--header", raw_headers, "Extra header 'Name: value' (repeatable)");
    app.add_option("--cookie", raw_cookies, "Cookie 'name=value' (repeatable)");
    app.add_flag("--no-preserve-cookies", no_preserve_cookies, "Ignore Set-Cookie responses");

    app.add_flag("--no-robots", no_robots, "Ignore robots.txt");
    app.add_flag("--no-redirects", no_redirects, "Do not follow redirects");
    app.add_flag("--insecure", insecure, "Skip TLS certificate verification");
    app.add_flag("-v,--verbose", config.verbose, "Debug logging");
    app.add_flag("-q,--quiet", config.quiet, "Only log errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    for (auto& proxy : single_proxies)
        config.proxies.push_back(std::move(proxy));
    if (!proxy_list_path.empty()) {
        for (auto& proxy : read_proxy_list(proxy_list_path))
            config.proxies.push_back(std::move(proxy));
    }

    std::pair<std::string, std::string> kv;
    for (const auto& raw : raw_headers) {
        if (!split_pair(raw, ':', kv))
            throw std::invalid_argument("Malformed --header '" + raw + "', expected 'Name: value'");
        config.headers[kv.first] = kv.second;
    }
    for (const auto& raw : raw_cookies) {
        if (!split_pair(raw, '=', kv))
            throw std::invalid_argument("Malformed --cookie '" + raw + "', expected 'name=value'");
        config.cookies[kv.first] = kv.second;
    }

    if (no_proxy_health_check)
        config.proxy_health_check = false;
    if (no_cache)
        config.cache_enabled = false;
    if (no_preserve_cookies)
        config.preserve_cookies = false;
    if (no_robots)
        config.respect_robots = false;
    if (no_redirects)
        config.follow_redirects = false;
    if (insecure)
        config.verify_ssl = false;

    return config;
}

}  // namespace Core
}  // namespace Ferret
