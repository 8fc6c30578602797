#include "proxy_pool.hpp"
#include <algorithm>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Ferret {
namespace Proxy {
namespace Pool {

using namespace Ferret::Core;

Strategy parse_strategy(const std::string& name) {
    std::string lower = Utils::Text::to_lower(name);
    if (lower == "round_robin" || lower == "round-robin" || lower == "roundrobin")
        return Strategy::RoundRobin;
    if (lower == "random")
        return Strategy::Random;
    if (lower == "fastest")
        return Strategy::Fastest;
    throw std::invalid_argument("Unknown proxy strategy: " + name);
}

std::string to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::RoundRobin:
            return "round_robin";
        case Strategy::Random:
            return "random";
        case Strategy::Fastest:
            return "fastest";
    }
    return "round_robin";
}

ProxyPool::ProxyPool(const std::vector<std::string>& proxies,
                     int                             max_failures,
                     std::chrono::milliseconds       cooldown)
    : max_failures_(std::max(1, max_failures)), cooldown_(cooldown), rng_(std::random_device{}()) {
    for (const auto& address : proxies) {
        if (address.empty() || find_locked(address))
            continue;
        ProxyRecord record;
        record.address = address;
        proxies_.push_back(std::move(record));
    }
}

ProxyRecord* ProxyPool::find_locked(const std::string& address) {
    auto it = std::find_if(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return p.address == address;
    });
    return it == proxies_.end() ? nullptr : &*it;
}

std::optional<ProxyRecord> ProxyPool::select(Strategy strategy) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<size_t> active;
    for (size_t i = 0; i < proxies_.size(); ++i) {
        if (proxies_[i].state == ProxyState::Active)
            active.push_back(i);
    }
    if (active.empty())
        return std::nullopt;

    size_t chosen = active.front();
    switch (strategy) {
        case Strategy::RoundRobin:
            chosen = active[rr_index_ % active.size()];
            rr_index_++;
            break;
        case Strategy::Random: {
            std::uniform_int_distribution<size_t> dist(0, active.size() - 1);
            chosen = active[dist(rng_)];
            break;
        }
        case Strategy::Fastest: {
            std::optional<double> best;
            for (size_t idx : active) {
                const auto& latency = proxies_[idx].avg_latency;
                if (latency && (!best || *latency < *best)) {
                    best   = latency;
                    chosen = idx;
                }
            }
            break;
        }
    }

    proxies_[chosen].last_used_at = Clock::now();
    return proxies_[chosen];
}

std::vector<std::string> ProxyPool::take_recoverable() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    out;
    auto                        now = Clock::now();
    for (auto& p : proxies_) {
        if (p.state == ProxyState::Dead && !p.probing && now - p.dead_since >= cooldown_) {
            p.probing = true;
            out.push_back(p.address);
        }
    }
    return out;
}

std::vector<std::string> ProxyPool::active_addresses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    out;
    for (const auto& p : proxies_) {
        if (p.state == ProxyState::Active)
            out.push_back(p.address);
    }
    return out;
}

void ProxyPool::register_failure_locked(ProxyRecord& record, const char* source) {
    record.consecutive_failures++;
    if (record.state == ProxyState::Dead) {
        record.dead_since = Clock::now();
        return;
    }

    if (record.consecutive_failures >= max_failures_) {
        record.state      = ProxyState::Dead;
        record.dead_since = Clock::now();
        Logger::error("Proxy quarantined after " + std::to_string(record.consecutive_failures)
                      + " failures (" + source + "): " + record.address);
    }
    else {
        Logger::warn("Proxy failed (" + std::to_string(record.consecutive_failures) + "/"
                     + std::to_string(max_failures_) + "): " + record.address);
    }
}

void ProxyPool::record_probe(const std::string& address, bool ok, double latency_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    ProxyRecord*                record = find_locked(address);
    if (!record)
        return;
    record->probing = false;

    if (!ok) {
        register_failure_locked(*record, "probe");
        return;
    }

    record->consecutive_failures = 0;
    if (record->avg_latency) {
        record->avg_latency = (1.0 - Constants::LATENCY_EMA_WEIGHT) * *record->avg_latency
                              + Constants::LATENCY_EMA_WEIGHT * latency_seconds;
    }
    else {
        record->avg_latency = latency_seconds;
    }

    if (record->state == ProxyState::Dead) {
        record->state = ProxyState::Active;
        Logger::success("Proxy recovered: " + address);
    }
}

void ProxyPool::report_success(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    ProxyRecord*                record = find_locked(address);
    if (record && record->state == ProxyState::Active)
        record->consecutive_failures = 0;
}

void ProxyPool::report_failure(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    ProxyRecord*                record = find_locked(address);
    if (record && record->state == ProxyState::Active)
        register_failure_locked(*record, "request");
}

bool ProxyPool::add(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (address.empty() || find_locked(address))
        return false;
    ProxyRecord record;
    record.address = address;
    proxies_.push_back(std::move(record));
    return true;
}

bool ProxyPool::remove(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return p.address == address;
    });
    if (it == proxies_.end())
        return false;
    proxies_.erase(it);
    return true;
}

std::optional<ProxyRecord> ProxyPool::find(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : proxies_) {
        if (p.address == address)
            return p;
    }
    return std::nullopt;
}

ProxyStats ProxyPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProxyStats                  stats;
    stats.total   = proxies_.size();
    stats.records = proxies_;
    for (const auto& p : proxies_) {
        if (p.state == ProxyState::Active)
            stats.active++;
        else
            stats.dead++;
    }
    return stats;
}

bool ProxyPool::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.empty();
}

size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.size();
}

size_t ProxyPool::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(proxies_.begin(), proxies_.end(), [](const ProxyRecord& p) {
        return p.state == ProxyState::Active;
    });
}

size_t ProxyPool::dead_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(proxies_.begin(), proxies_.end(), [](const ProxyRecord& p) {
        return p.state == ProxyState::Dead;
    });
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Ferret
