#pragma once
#include "page_parser.hpp"

namespace Ferret {
namespace Parser {

// gumbo-backed parser: title, description, keywords, canonical_url, page_size_bytes.
class HtmlParser : public PageParser {
public:
    PageData parse(const std::string& body, const std::string& url) const override;
};

}  // namespace Parser
}  // namespace Ferret
