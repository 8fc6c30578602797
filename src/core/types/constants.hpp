#pragma once
#include <cctype>
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace Ferret {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS   = 2;  // IO Threads
    static constexpr int         DEFAULT_WORKERS   = 5;  // Coroutines
    static constexpr int         DEFAULT_DEPTH     = 3;
    static constexpr int         DEFAULT_MAX_PAGES = 100;
    static constexpr const char* VERSION           = "0.1.0";

    static constexpr int         DEFAULT_RETRY_COUNT       = 3;
    static constexpr int         DEFAULT_RETRY_DELAY_MS    = 2000;
    static constexpr int         REQUEST_TIMEOUT_SECONDS   = 30;
    static constexpr int         CONNECT_TIMEOUT_SECONDS   = 10;
    static constexpr int         MAX_REDIRECTS             = 5;
    static constexpr size_t      MAX_BODY_BYTES            = 16 * 1024 * 1024;
    static constexpr const char* USER_AGENT                = "Ferret-Crawler/1.0";

    // Politeness (seconds)
    static constexpr double DEFAULT_BASE_DELAY      = 1.0;
    static constexpr double DEFAULT_MIN_DELAY       = 0.5;
    static constexpr double DEFAULT_MAX_DELAY       = 60.0;
    static constexpr double DEFAULT_RANDOM_RANGE    = 0.5;
    static constexpr double DEFAULT_RETRY_FACTOR    = 2.0;
    static constexpr double DEFAULT_TEMPORARY_DELAY = 300.0;
    static constexpr int    MAX_BACKOFF_EXPONENT    = 4;

    static constexpr int         DEFAULT_PROXY_MAX_FAILURES     = 3;
    static constexpr int         DEFAULT_PROXY_CHECK_INTERVAL_S = 300;
    static constexpr int         DEFAULT_PROXY_COOLDOWN_S       = 60;
    static constexpr int         DEFAULT_PROXY_PROBE_TIMEOUT_S  = 10;
    static constexpr const char* DEFAULT_PROXY_TEST_URL         = "https://httpbin.org/ip";
    static constexpr double      LATENCY_EMA_WEIGHT             = 0.3;

    static constexpr const char* DEFAULT_CACHE_DIR       = ".ferret_cache";
    static constexpr int         DEFAULT_CACHE_EXPIRY_S  = 3600;
    static constexpr size_t      DEFAULT_CACHE_MAX_SIZE  = 1000;
};

inline const std::map<std::string, std::string>& get_default_headers() {
    static const std::map<std::string, std::string> headers = {
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"},
        {"Connection", "close"}};
    return headers;
}

inline bool is_html_content_type(const std::string& content_type) {
    if (content_type.empty())
        return true;
    std::string lower = content_type;
    for (char& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower.find("text/html") != std::string::npos
           || lower.find("application/xhtml+xml") != std::string::npos;
}

inline std::chrono::milliseconds get_backoff_time(std::chrono::milliseconds base, int attempt) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    return base * (1 << (attempt - 1));
}

}  // namespace Core
}  // namespace Ferret
