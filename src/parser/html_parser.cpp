#include "html_parser.hpp"
#include <gumbo.h>
#include <memory>
#include <stdexcept>
#include <unordered_set>
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Ferret {
namespace Parser {

using namespace Ferret::Utils::Text;
using Ferret::Utils::Url;

namespace {

struct Collected {
    std::string              base_href;
    std::string              title;
    std::string              description;
    std::string              keywords;
    std::string              canonical;
    std::vector<std::string> hrefs;
};

const char* attribute(GumboNode* node, const char* name) {
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

std::string text_of(GumboNode* node) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE)
        return node->v.text.text;
    if (node->type != GUMBO_NODE_ELEMENT)
        return "";
    std::string        out;
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i)
        out += text_of(static_cast<GumboNode*>(children->data[i]));
    return out;
}

void collect(GumboNode* node, Collected& out) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    switch (node->v.element.tag) {
        case GUMBO_TAG_A:
        case GUMBO_TAG_AREA:
            if (const char* href = attribute(node, "href"))
                out.hrefs.emplace_back(href);
            break;
        case GUMBO_TAG_BASE:
            if (const char* href = attribute(node, "href"); href && out.base_href.empty())
                out.base_href = href;
            break;
        case GUMBO_TAG_TITLE:
            if (out.title.empty())
                out.title = trim(text_of(node));
            break;
        case GUMBO_TAG_META: {
            const char* name    = attribute(node, "name");
            const char* content = attribute(node, "content");
            if (name && content) {
                std::string key = to_lower(name);
                if (key == "description" && out.description.empty())
                    out.description = trim(content);
                else if (key == "keywords" && out.keywords.empty())
                    out.keywords = trim(content);
            }
            break;
        }
        case GUMBO_TAG_LINK: {
            const char* rel  = attribute(node, "rel");
            const char* href = attribute(node, "href");
            if (rel && href && to_lower(rel) == "canonical" && out.canonical.empty())
                out.canonical = href;
            break;
        }
        default:
            break;
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect(static_cast<GumboNode*>(children->data[i]), out);
    }
}

bool is_followable(const std::string& href) {
    std::string lower = to_lower(trim(href));
    return !lower.empty() && !starts_with(lower, "javascript:") && !starts_with(lower, "mailto:")
           && !starts_with(lower, "tel:") && !starts_with(lower, "data:") && lower[0] != '#';
}

}  // namespace

PageData HtmlParser::parse(const std::string& body, const std::string& url) const {
    PageData data;
    data.fields["page_size_bytes"] = std::to_string(body.size());
    if (body.empty())
        return data;

    auto deleter = [](GumboOutput* output) { gumbo_destroy_output(&kGumboDefaultOptions, output); };
    std::unique_ptr<GumboOutput, decltype(deleter)> output(
        gumbo_parse_with_options(&kGumboDefaultOptions, body.data(), body.size()), deleter);
    if (!output)
        throw std::runtime_error("HTML parse failed: " + url);

    Collected collected;
    collect(output->root, collected);

    std::string base = url;
    if (!collected.base_href.empty()) {
        std::string resolved = Url::resolve(url, trim(collected.base_href));
        if (!resolved.empty())
            base = resolved;
    }

    data.fields["title"]       = collected.title;
    data.fields["description"] = collected.description;
    data.fields["keywords"]    = collected.keywords;
    if (!collected.canonical.empty())
        data.fields["canonical_url"] = Url::resolve(base, trim(collected.canonical));

    std::unordered_set<std::string> seen;
    for (const auto& href : collected.hrefs) {
        if (!is_followable(href))
            continue;
        std::string absolute = Url::resolve(base, trim(href));
        if (absolute.empty())
            continue;
        if (seen.insert(absolute).second)
            data.links.push_back(std::move(absolute));
    }
    return data;
}

}  // namespace Parser
}  // namespace Ferret
