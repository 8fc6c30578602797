#include "digest.hpp"
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>
#include "../text/string_utils.hpp"

namespace Ferret {
namespace Utils {
namespace Crypto {

Sha256Digest sha256(const uint8_t* data, size_t length) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx)
        throw std::runtime_error("EVP_MD_CTX_new failed");

    Sha256Digest digest{};
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data, length) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest.data(), &out_len) != 1 || out_len != SHA256_SIZE) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

Sha256Digest sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::string sha256_hex(const std::string& data) {
    auto digest = sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return Text::to_hex(digest.data(), digest.size());
}

}  // namespace Crypto
}  // namespace Utils
}  // namespace Ferret
