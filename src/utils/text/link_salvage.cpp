#include "link_salvage.hpp"
#include <regex>
#include <unordered_set>
#include "../url/url.hpp"
#include "string_utils.hpp"

namespace Ferret {
namespace Utils {
namespace Text {

std::vector<std::string> salvage_links(const std::string& body, const std::string& base_url) {
    static const std::regex href_re(R"re(href\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>"']+)))re",
                                    std::regex::icase);

    std::vector<std::string>        links;
    std::unordered_set<std::string> seen;
    for (std::sregex_iterator it(body.begin(), body.end(), href_re), end; it != end; ++it) {
        const std::smatch& m = *it;
        std::string        href =
            m[1].matched ? m[1].str() : (m[2].matched ? m[2].str() : m[3].str());
        href = trim(href);
        if (href.empty() || href[0] == '#')
            continue;

        std::string absolute = Url::resolve(base_url, href);
        if (absolute.empty() || !Url::is_http(absolute))
            continue;
        if (seen.insert(absolute).second)
            links.push_back(std::move(absolute));
    }
    return links;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Ferret
