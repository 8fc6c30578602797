#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Ferret {
namespace Network {
namespace Http {

// Per-domain name=value store fed from Set-Cookie. Attributes are ignored.
class CookieJar {
public:
    void store(const std::string& domain, const std::vector<std::string>& set_cookie_headers);
    void set(const std::string& domain, const std::string& name, const std::string& value);

    std::map<std::string, std::string> cookies_for(const std::string& domain) const;
    size_t                             domain_count() const;
    void                               clear();

private:
    mutable std::mutex                                                  mutex_;
    std::unordered_map<std::string, std::map<std::string, std::string>> cookies_;
};

}  // namespace Http
}  // namespace Network
}  // namespace Ferret
