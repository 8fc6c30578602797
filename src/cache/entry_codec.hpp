#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include "../network/http/http_client.hpp"

namespace Ferret {
namespace Cache {

struct CachedResponse {
    std::string            url;
    long                   status_code = 200;
    std::string            content_type;
    Network::Http::Headers headers;
    std::string            body;
};

struct CacheEntry {
    std::chrono::system_clock::time_point timestamp;
    CachedResponse                        response;
};

class CacheCorruption : public std::runtime_error {
public:
    explicit CacheCorruption(const std::string& what) : std::runtime_error(what) {
    }
};

/**
 * On-disk layout, all integers big-endian:
 *
 *   "FRC1" | u8 version | u64 timestamp_ms | u16 status
 *   | blob url | blob content_type | u32 header_count | (blob name, blob value)*
 *   | blob body | sha256 of all preceding bytes
 *
 * A blob is a u32 length followed by that many bytes. Truncated or altered
 * files fail the checksum and decode() throws CacheCorruption.
 */
class EntryCodec {
public:
    static constexpr uint8_t VERSION = 1;

    static std::string encode(const CacheEntry& entry);
    static CacheEntry  decode(const std::string& data);
};

}  // namespace Cache
}  // namespace Ferret
