#include "cookie_jar.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Ferret {
namespace Network {
namespace Http {

using Ferret::Utils::Text::trim;

void CookieJar::store(const std::string& domain, const std::vector<std::string>& headers) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& header : headers) {
        std::string pair = header.substr(0, header.find(';'));
        size_t      eq   = pair.find('=');
        if (eq == std::string::npos)
            continue;
        std::string name = trim(pair.substr(0, eq));
        if (name.empty())
            continue;
        cookies_[domain][name] = trim(pair.substr(eq + 1));
    }
}

void CookieJar::set(const std::string& domain, const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_[domain][name] = value;
}

std::map<std::string, std::string> CookieJar::cookies_for(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = cookies_.find(domain);
    if (it == cookies_.end())
        return {};
    return it->second;
}

size_t CookieJar::domain_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cookies_.size();
}

void CookieJar::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_.clear();
}

}  // namespace Http
}  // namespace Network
}  // namespace Ferret
