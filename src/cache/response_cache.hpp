#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../core/types/constants.hpp"
#include "../network/http/http_client.hpp"
#include "../storage/storage.hpp"
#include "entry_codec.hpp"

class ResponseCacheTest_EvictsOldestEntries_Test;

namespace Ferret {
namespace Cache {

struct CacheConfig {
    bool                      enabled = true;
    std::string               dir     = Ferret::Core::Constants::DEFAULT_CACHE_DIR;
    std::chrono::milliseconds expiry{
        std::chrono::seconds(Ferret::Core::Constants::DEFAULT_CACHE_EXPIRY_S)};
    size_t max_size = Ferret::Core::Constants::DEFAULT_CACHE_MAX_SIZE;
};

struct CacheStats {
    size_t memory_entries = 0;
    size_t disk_entries   = 0;
    size_t disk_bytes     = 0;
};

/**
 * Response snapshots keyed by the SHA-256 of the normalized URL.
 *
 * Lookups hit the in-memory index first and fall back to storage. Expiry is
 * lazy: a stale entry found by get() is purged from both layers and reported
 * as a miss. The index holds at most max_size entries, evicting the oldest
 * timestamps first. Eviction only touches the index: the files stay on disk
 * until they expire or clear_expired() sweeps them.
 */
class ResponseCache {
#ifndef CPPCHECK
    friend class ::ResponseCacheTest_EvictsOldestEntries_Test;
#endif

public:
    explicit ResponseCache(const CacheConfig& config);
    ResponseCache(const CacheConfig& config, std::unique_ptr<Storage::Storage> storage);

    std::optional<CachedResponse> get(const std::string& url);
    bool                          put(const std::string& url, const Response& response);

    // Removes expired and unreadable entries from storage. Returns how many went.
    size_t     clear_expired();
    void       clear();
    CacheStats stats() const;

    bool enabled() const {
        return config_.enabled;
    }
    const CacheConfig& config() const {
        return config_;
    }

    static bool        is_cacheable(const Response& response);
    static std::string key_for(const std::string& url);

private:
    CacheConfig                                 config_;
    std::unique_ptr<Storage::Storage>           storage_;
    std::unordered_map<std::string, CacheEntry> memory_;
    mutable std::mutex                          mutex_;

    static constexpr const char* ENTRY_SUFFIX = ".entry";

    static std::string file_name(const std::string& key);
    bool               is_expired(const CacheEntry&                       entry,
                                  std::chrono::system_clock::time_point now) const;

    // Caller holds mutex_. Returns how many entries left the index.
    size_t      insert_locked(const std::string& key, CacheEntry entry);
    static void log_evicted(size_t count);
};

}  // namespace Cache
}  // namespace Ferret
