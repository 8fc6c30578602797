#include "response_cache.hpp"
#include <algorithm>
#include "../core/logger/logger.hpp"
#include "../storage/disk_storage.hpp"
#include "../utils/crypto/digest.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Ferret {
namespace Cache {

using Ferret::Core::Logger;
using Ferret::Utils::InvalidUrl;
using Ferret::Utils::Url;
using Clock = std::chrono::system_clock;

ResponseCache::ResponseCache(const CacheConfig& config)
    : ResponseCache(config,
                    config.enabled ? std::make_unique<Storage::DiskStorage>(config.dir) : nullptr) {
}

ResponseCache::ResponseCache(const CacheConfig& config, std::unique_ptr<Storage::Storage> storage)
    : config_(config), storage_(std::move(storage)) {
    if (config_.max_size == 0)
        config_.max_size = 1;
    if (config_.enabled && !storage_)
        throw std::invalid_argument("ResponseCache: storage is required when enabled");
}

std::string ResponseCache::key_for(const std::string& url) {
    std::string canonical;
    try {
        canonical = Url::normalize(url);
    } catch (const InvalidUrl&) {
        canonical = url;
    }
    return Utils::Crypto::sha256_hex(canonical);
}

std::string ResponseCache::file_name(const std::string& key) {
    return key + ENTRY_SUFFIX;
}

bool ResponseCache::is_cacheable(const Response& response) {
    if (response.error_type != Network::Http::ErrorType::None || response.status_code != 200)
        return false;
    for (const auto& value : response.header_values("Cache-Control")) {
        std::string lower = Utils::Text::to_lower(value);
        if (lower.find("no-store") != std::string::npos
            || lower.find("no-cache") != std::string::npos)
            return false;
    }
    return true;
}

bool ResponseCache::is_expired(const CacheEntry& entry, Clock::time_point now) const {
    return now - entry.timestamp > config_.expiry;
}

std::optional<CachedResponse> ResponseCache::get(const std::string& url) {
    if (!config_.enabled)
        return std::nullopt;

    std::string key = key_for(url);
    auto        now = Clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = memory_.find(key);
        if (it != memory_.end()) {
            if (!is_expired(it->second, now))
                return it->second.response;
            memory_.erase(it);
        }
    }

    auto blob = storage_->load(file_name(key));
    if (!blob)
        return std::nullopt;

    CacheEntry entry;
    try {
        entry = EntryCodec::decode(*blob);
    } catch (const CacheCorruption& e) {
        Logger::warn("Cache: dropping corrupt entry for " + url + " (" + e.what() + ")");
        storage_->remove(file_name(key));
        return std::nullopt;
    }

    if (is_expired(entry, now)) {
        Logger::debug("Cache: expired " + url);
        storage_->remove(file_name(key));
        return std::nullopt;
    }

    CachedResponse response = entry.response;
    size_t         evicted  = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evicted = insert_locked(key, std::move(entry));
    }
    log_evicted(evicted);
    return response;
}

bool ResponseCache::put(const std::string& url, const Response& response) {
    if (!config_.enabled || !is_cacheable(response))
        return false;

    std::string key = key_for(url);
    CacheEntry  entry;
    entry.timestamp             = Clock::now();
    entry.response.url          = response.effective_url.empty() ? url : response.effective_url;
    entry.response.status_code  = response.status_code;
    entry.response.content_type = response.content_type;
    entry.response.headers      = response.headers;
    entry.response.body         = response.body;

    if (!storage_->save(file_name(key), EntryCodec::encode(entry))) {
        Logger::warn("Cache: failed to persist " + url);
        return false;
    }

    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evicted = insert_locked(key, std::move(entry));
    }
    log_evicted(evicted);
    return true;
}

size_t ResponseCache::insert_locked(const std::string& key, CacheEntry entry) {
    memory_[key] = std::move(entry);
    if (memory_.size() <= config_.max_size)
        return 0;

    std::vector<std::pair<Clock::time_point, std::string>> by_age;
    by_age.reserve(memory_.size());
    for (const auto& [k, e] : memory_) {
        if (k != key)
            by_age.emplace_back(e.timestamp, k);
    }
    std::sort(by_age.begin(), by_age.end());

    // Files stay on disk; they are reloaded on demand until TTL or clear_expired() drops them.
    size_t excess  = memory_.size() - config_.max_size;
    size_t evicted = 0;
    for (; evicted < excess && evicted < by_age.size(); ++evicted)
        memory_.erase(by_age[evicted].second);
    return evicted;
}

void ResponseCache::log_evicted(size_t count) {
    if (count > 0)
        Logger::debug("Cache: evicted " + std::to_string(count) + " entries from memory");
}

size_t ResponseCache::clear_expired() {
    if (!config_.enabled)
        return 0;

    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = memory_.begin(); it != memory_.end();) {
            if (is_expired(it->second, now))
                it = memory_.erase(it);
            else
                ++it;
        }
    }

    size_t removed = 0;
    for (const auto& name : storage_->keys()) {
        if (!Utils::Text::ends_with(name, ENTRY_SUFFIX))
            continue;
        auto blob = storage_->load(name);
        if (!blob)
            continue;

        bool drop = false;
        try {
            drop = is_expired(EntryCodec::decode(*blob), now);
        } catch (const CacheCorruption& e) {
            Logger::warn("Cache: removing corrupt file " + name + " (" + e.what() + ")");
            drop = true;
        }
        if (drop && storage_->remove(name))
            ++removed;
    }

    if (removed > 0)
        Logger::info("Cache: cleared " + std::to_string(removed) + " expired entries");
    return removed;
}

void ResponseCache::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_.clear();
    }
    if (storage_)
        storage_->clear();
}

CacheStats ResponseCache::stats() const {
    CacheStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.memory_entries = memory_.size();
    }
    if (storage_) {
        for (const auto& name : storage_->keys()) {
            if (Utils::Text::ends_with(name, ENTRY_SUFFIX))
                ++stats.disk_entries;
        }
        stats.disk_bytes = storage_->total_bytes();
    }
    return stats;
}

}  // namespace Cache
}  // namespace Ferret
