#include "entry_codec.hpp"
#include <algorithm>
#include <cstring>
#include <vector>
#include "../binary/reader.hpp"
#include "../binary/writer.hpp"
#include "../utils/crypto/digest.hpp"

namespace Ferret {
namespace Cache {

namespace {
constexpr char   MAGIC[]    = {'F', 'R', 'C', '1'};
constexpr size_t MAGIC_SIZE = sizeof(MAGIC);
}  // namespace

std::string EntryCodec::encode(const CacheEntry& entry) {
    std::vector<uint8_t> data;
    data.reserve(entry.response.body.size() + 256);
    Binary::Writer writer(data);

    writer.write_bytes(reinterpret_cast<const uint8_t*>(MAGIC), MAGIC_SIZE);
    writer.write_uint8(VERSION);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch());
    writer.write_uint64_be(static_cast<uint64_t>(ms.count()));
    writer.write_uint16_be(static_cast<uint16_t>(entry.response.status_code));
    writer.write_blob(entry.response.url);
    writer.write_blob(entry.response.content_type);
    writer.write_uint32_be(static_cast<uint32_t>(entry.response.headers.size()));
    for (const auto& [name, value] : entry.response.headers) {
        writer.write_blob(name);
        writer.write_blob(value);
    }
    writer.write_blob(entry.response.body);

    auto digest = Utils::Crypto::sha256(data);
    writer.write_bytes(digest.data(), digest.size());

    return std::string(data.begin(), data.end());
}

CacheEntry EntryCodec::decode(const std::string& raw) {
    if (raw.size() < MAGIC_SIZE + Utils::Crypto::SHA256_SIZE)
        throw CacheCorruption("Cache entry truncated");

    std::vector<uint8_t> data(raw.begin(), raw.end() - Utils::Crypto::SHA256_SIZE);
    auto                 expected = Utils::Crypto::sha256(data);
    if (std::memcmp(expected.data(),
                    raw.data() + data.size(),
                    Utils::Crypto::SHA256_SIZE) != 0) {
        throw CacheCorruption("Cache entry checksum mismatch");
    }

    try {
        Binary::Reader reader(data);
        auto           magic = reader.read_bytes(MAGIC_SIZE);
        if (!std::equal(magic.begin(), magic.end(), reinterpret_cast<const uint8_t*>(MAGIC)))
            throw CacheCorruption("Bad cache entry magic");
        uint8_t version = reader.read_uint8();
        if (version != VERSION)
            throw CacheCorruption("Unsupported cache entry version " + std::to_string(version));

        CacheEntry entry;
        entry.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(static_cast<int64_t>(reader.read_uint64_be())));
        entry.response.status_code  = reader.read_uint16_be();
        entry.response.url          = reader.read_blob();
        entry.response.content_type = reader.read_blob();

        uint32_t header_count = reader.read_uint32_be();
        for (uint32_t i = 0; i < header_count; ++i) {
            std::string name  = reader.read_blob();
            std::string value = reader.read_blob();
            entry.response.headers.emplace_back(std::move(name), std::move(value));
        }
        entry.response.body = reader.read_blob();

        if (!reader.eof())
            throw CacheCorruption("Trailing bytes in cache entry");
        return entry;
    } catch (const std::out_of_range& e) {
        throw CacheCorruption(std::string("Cache entry truncated: ") + e.what());
    }
}

}  // namespace Cache
}  // namespace Ferret
