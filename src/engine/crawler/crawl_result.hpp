#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace Ferret {
namespace Engine {

enum class CrawlStatus { Success, Error };

inline const char* to_string(CrawlStatus status) {
    return status == CrawlStatus::Success ? "success" : "error";
}

struct CrawlResult {
    std::string                        url;
    int                                depth       = 0;
    CrawlStatus                        status      = CrawlStatus::Success;
    long                               status_code = 0;
    std::string                        error;
    std::string                        error_type;  // "timeout", "http", "parse", "not_html", ...
    std::vector<std::string>           links;
    std::map<std::string, std::string> fields;
    bool                               from_cache = false;
};

struct CrawlStats {
    size_t                    pages_crawled    = 0;
    size_t                    successes        = 0;
    size_t                    errors           = 0;
    size_t                    cache_hits       = 0;
    size_t                    robots_blocked   = 0;
    size_t                    urls_discovered  = 0;
    size_t                    unique_domains   = 0;
    size_t                    bytes_downloaded = 0;
    std::chrono::milliseconds elapsed{0};
};

}  // namespace Engine
}  // namespace Ferret
