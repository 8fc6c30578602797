#pragma once
#include <string>
#include <vector>

namespace Ferret {
namespace Utils {
namespace Text {

/**
 * Best-effort href scan used when the page parser fails. Returns absolute
 * http(s) links resolved against base_url, in document order, deduplicated.
 */
std::vector<std::string> salvage_links(const std::string& body, const std::string& base_url);

}  // namespace Text
}  // namespace Utils
}  // namespace Ferret
