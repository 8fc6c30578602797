/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <cctype>
#include <optional>
#include <stdexcept>
#include <vector>
#include "../../core/logger/logger.hpp"
#include "absl/strings/match.h"
#include "robots.h"

namespace Ferret {
namespace Utils {

namespace {
// Groups name product tokens: "Ferret-Crawler/1.0" is matched as "Ferret-Crawler".
std::string product_token(const std::string& user_agent) {
    size_t end = 0;
    while (end < user_agent.size()) {
        unsigned char c = user_agent[end];
        if (!std::isalpha(c) && c != '-' && c != '_')
            break;
        ++end;
    }
    return end == 0 ? user_agent : user_agent.substr(0, end);
}
}  // namespace

RobotsTxt RobotsTxt::parse(const std::string& content) {
    RobotsTxt robots;
    robots.content_ = content;
    return robots;
}

bool RobotsTxt::is_allowed(const std::string& user_agent, const std::string& path) const {
    if (content_.empty())
        return true;
    googlebot::RobotsMatcher matcher;
    std::vector<std::string> user_agents{product_token(user_agent)};
    return matcher.AllowedByRobots(content_, &user_agents, path.empty() ? "/" : path);
}

namespace {
class CrawlDelayMatcher : public googlebot::RobotsMatcher {
public:
    explicit CrawlDelayMatcher(const std::vector<std::string>& user_agents) {
        InitUserAgentsAndPath(&user_agents, "/");
    }

    double GetDelay(const std::string& content) {
        googlebot::ParseRobotsTxt(content, this);
        if (specific_delay_)
            return *specific_delay_;
        if (global_delay_)
            return *global_delay_;
        return 0.0;
    }

protected:
    void
    HandleUnknownAction(int line_num, absl::string_view action, absl::string_view value) override {
        if (absl::EqualsIgnoreCase(action, "Crawl-delay")) {
            try {
                double delay = std::stod(std::string(value));
                if (delay >= 0.0) {
                    if (seen_specific_agent_)
                        specific_delay_ = delay;
                    else if (seen_global_agent_)
                        global_delay_ = delay;
                }
            } catch (const std::logic_error&) {
                Core::Logger::debug("Ignoring malformed Crawl-delay on line "
                                    + std::to_string(line_num));
            }
        }
        googlebot::RobotsMatcher::HandleUnknownAction(line_num, action, value);
    }

private:
    std::optional<double> global_delay_;
    std::optional<double> specific_delay_;
};
}  // namespace

double RobotsTxt::get_crawl_delay(const std::string& user_agent) const {
    if (content_.empty())
        return 0.0;
    std::vector<std::string> ua_list{product_token(user_agent)};
    CrawlDelayMatcher        matcher(ua_list);
    return matcher.GetDelay(content_);
}

}  // namespace Utils
}  // namespace Ferret
