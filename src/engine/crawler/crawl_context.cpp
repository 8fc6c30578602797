#include "crawl_context.hpp"

namespace Ferret {
namespace Engine {

CrawlContext::CrawlContext(size_t max_pages) : max_pages_(max_pages) {
}

bool CrawlContext::try_reserve_page() {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    if (results_.size() + reserved_ >= max_pages_)
        return false;
    ++reserved_;
    return true;
}

void CrawlContext::release_page() {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    if (reserved_ > 0)
        --reserved_;
}

void CrawlContext::commit(CrawlResult result) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.pages_crawled;
        if (result.status == CrawlStatus::Success)
            ++stats_.successes;
        else
            ++stats_.errors;
    }
    std::lock_guard<std::mutex> lock(budget_mutex_);
    if (reserved_ > 0)
        --reserved_;
    results_.push_back(std::move(result));
}

bool CrawlContext::budget_exhausted() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return results_.size() >= max_pages_;
}

size_t CrawlContext::result_count() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return results_.size();
}

std::vector<CrawlResult> CrawlContext::results() const {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return results_;
}

std::vector<CrawlResult> CrawlContext::take_results() {
    std::lock_guard<std::mutex> lock(budget_mutex_);
    return std::move(results_);
}

void CrawlContext::record_cache_hit() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.cache_hits;
}

void CrawlContext::record_robots_block() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.robots_blocked;
}

void CrawlContext::record_discovered(size_t count) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.urls_discovered += count;
}

void CrawlContext::record_download(const std::string& domain, size_t bytes) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.bytes_downloaded += bytes;
    domains_.insert(domain);
}

CrawlStats CrawlContext::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    CrawlStats out     = stats_;
    out.unique_domains = domains_.size();
    return out;
}

}  // namespace Engine
}  // namespace Ferret
