#pragma once
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>

namespace Ferret {
namespace Engine {

struct CrawlTask {
    std::string url;
    int         depth = 0;
};

/**
 * FIFO of pending tasks plus the visited set. Both live under one mutex so that
 * claim() is a single check-mark-push step: a URL is handed out at most once
 * for the lifetime of the frontier, even when producers race.
 */
class Frontier {
public:
    Frontier() = default;

    Frontier(const Frontier&)            = delete;
    Frontier& operator=(const Frontier&) = delete;

    // Marks url visited and enqueues it. False if it was already claimed.
    bool claim(const std::string& url, int depth);
    bool seen(const std::string& url) const;

    // Pops the oldest task and counts it as in flight until task_done().
    std::optional<CrawlTask> pop();
    void                     task_done();

    // No queued work and nothing in flight that could still produce some.
    bool drained() const;

    size_t size() const;
    size_t visited_count() const;
    int    in_flight() const;

private:
    mutable std::mutex              mutex_;
    std::queue<CrawlTask>           queue_;
    std::unordered_set<std::string> visited_;
    int                             in_flight_ = 0;
};

}  // namespace Engine
}  // namespace Ferret
