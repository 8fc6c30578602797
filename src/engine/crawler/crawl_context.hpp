#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "../../network/http/cookie_jar.hpp"
#include "../frontier/frontier.hpp"
#include "crawl_result.hpp"

namespace Ferret {
namespace Engine {

/**
 * Everything one crawl run mutates, handed to every worker by reference.
 *
 * The page budget is reserve/commit: a worker reserves a slot before popping a
 * task and either commits a result into it or releases it. Reservations plus
 * committed results never exceed max_pages, so neither can the result list.
 */
class CrawlContext {
public:
    explicit CrawlContext(size_t max_pages);

    CrawlContext(const CrawlContext&)            = delete;
    CrawlContext& operator=(const CrawlContext&) = delete;

    Frontier& frontier() {
        return frontier_;
    }
    Network::Http::CookieJar& cookies() {
        return cookies_;
    }

    bool try_reserve_page();
    void release_page();
    // Fills a reserved slot.
    void commit(CrawlResult result);
    // Every slot holds a committed result; outstanding reservations don't count.
    bool budget_exhausted() const;
    size_t                   result_count() const;
    std::vector<CrawlResult> results() const;
    std::vector<CrawlResult> take_results();

    void request_stop() {
        stop_ = true;
    }
    bool stop_requested() const {
        return stop_;
    }

    void worker_started() {
        ++live_workers_;
    }
    void worker_finished() {
        --live_workers_;
    }
    int live_workers() const {
        return live_workers_;
    }

    void record_cache_hit();
    void record_robots_block();
    void record_discovered(size_t count);
    void record_download(const std::string& domain, size_t bytes);
    CrawlStats stats() const;

private:
    const size_t max_pages_;

    Frontier                 frontier_;
    Network::Http::CookieJar cookies_;

    mutable std::mutex       budget_mutex_;
    size_t                   reserved_ = 0;
    std::vector<CrawlResult> results_;

    mutable std::mutex              stats_mutex_;
    CrawlStats                      stats_;
    std::unordered_set<std::string> domains_;

    std::atomic<bool> stop_{false};
    std::atomic<int>  live_workers_{0};
};

}  // namespace Engine
}  // namespace Ferret
