#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Ferret {
namespace Proxy {
namespace Pool {

enum class ProxyState { Active, Dead };

enum class Strategy { RoundRobin, Random, Fastest };

Strategy    parse_strategy(const std::string& name);
std::string to_string(Strategy strategy);

struct ProxyRecord {
    using Clock = std::chrono::steady_clock;

    std::string           address;
    ProxyState            state                = ProxyState::Active;
    int                   consecutive_failures = 0;
    Clock::time_point     last_used_at;
    std::optional<double> avg_latency;  // seconds
    Clock::time_point     dead_since;
    bool                  probing = false;
};

struct ProxyStats {
    size_t                   total  = 0;
    size_t                   active = 0;
    size_t                   dead   = 0;
    std::vector<ProxyRecord> records;
};

/**
 * Proxy state machine. Active -> Dead once consecutive failures reach
 * max_failures; Dead -> Active only through a successful probe after the
 * cool-down. Every mutation happens under one mutex; nothing here does I/O.
 */
class ProxyPool {
public:
    using Clock = ProxyRecord::Clock;

    ProxyPool(const std::vector<std::string>& proxies,
              int                             max_failures,
              std::chrono::milliseconds       cooldown);

    std::optional<ProxyRecord> select(Strategy strategy);

    // Dead proxies past their cool-down, flagged so no other caller probes them too.
    std::vector<std::string> take_recoverable();
    std::vector<std::string> active_addresses() const;

    void record_probe(const std::string& address, bool ok, double latency_seconds);
    void report_success(const std::string& address);
    void report_failure(const std::string& address);

    bool add(const std::string& address);
    bool remove(const std::string& address);

    std::optional<ProxyRecord> find(const std::string& address) const;
    ProxyStats                 stats() const;
    bool                       empty() const;
    size_t                     size() const;
    size_t                     active_count() const;
    size_t                     dead_count() const;

    int max_failures() const {
        return max_failures_;
    }

private:
    ProxyRecord* find_locked(const std::string& address);
    void         register_failure_locked(ProxyRecord& record, const char* source);

    std::vector<ProxyRecord>  proxies_;
    mutable std::mutex        mutex_;
    int                       max_failures_;
    std::chrono::milliseconds cooldown_;
    size_t                    rr_index_ = 0;
    std::mt19937              rng_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Ferret
