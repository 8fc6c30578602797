#pragma once
#include <map>
#include <string>
#include <vector>

namespace Ferret {
namespace Parser {

struct PageData {
    std::map<std::string, std::string> fields;
    std::vector<std::string>           links;
};

/**
 * Extracts structured fields and outgoing links from a fetched page.
 * Implementations may throw; the crawler then falls back to link salvage.
 * Called concurrently from several workers.
 */
class PageParser {
public:
    virtual ~PageParser() = default;

    virtual PageData parse(const std::string& body, const std::string& url) const = 0;
};

}  // namespace Parser
}  // namespace Ferret
