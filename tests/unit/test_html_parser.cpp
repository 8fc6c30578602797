#include <gtest/gtest.h>
#include <set>
#include "../../src/parser/html_parser.hpp"
#include "../../src/utils/text/link_salvage.hpp"
#include "../../src/utils/text/string_utils.hpp"

using namespace Ferret::Parser;
using namespace Ferret::Utils::Text;

TEST(HtmlParserTest, LinkExtractionRealistic) {
    std::string html = R"html(
        <div>
            <a href="https://example.com/1">Link 1</a>
            <p>Some text with <a href="/internal">internal link</a></p>
            <a href="javascript:void(0)">JS link</a>
            <a href="mailto:test@example.com">Mail link</a>
            <a class="no-href">No href</a>
            <a href="">Empty href</a>
            <nav>
                <ul>
                    <li><a href="https://extern.com">Extern</a></li>
                </ul>
            </nav>
            <footer>
                <a href="#top">Anchor</a>
            </footer>
        </div>
    )html";
    HtmlParser parser;
    auto       page = parser.parse(html, "https://example.com/dir/page");

    std::set<std::string> link_set(page.links.begin(), page.links.end());
    EXPECT_EQ(link_set.size(), 3u);
    EXPECT_TRUE(link_set.count("https://example.com/1"));
    EXPECT_TRUE(link_set.count("https://example.com/internal"));
    EXPECT_TRUE(link_set.count("https://extern.com"));
}

TEST(HtmlParserTest, CaseInsensitiveTags) {
    HtmlParser parser;
    auto       page = parser.parse("<A HREF='HTTP://UPPER.COM'>Upper</A>", "https://example.com/");
    ASSERT_EQ(page.links.size(), 1u);
    EXPECT_EQ(page.links[0], "HTTP://UPPER.COM");
}

TEST(HtmlParserTest, ExtractsMetadataFields) {
    std::string html = R"html(
        <html><head>
            <title>  Ferret Docs  </title>
            <meta name="Description" content="How the crawler works">
            <meta name="keywords" content="crawler, robots">
            <link rel="canonical" href="/docs/">
        </head><body><p>Body</p></body></html>
    )html";
    HtmlParser parser;
    auto       page = parser.parse(html, "https://example.com/docs/index.html");

    EXPECT_EQ(page.fields["title"], "Ferret Docs");
    EXPECT_EQ(page.fields["description"], "How the crawler works");
    EXPECT_EQ(page.fields["keywords"], "crawler, robots");
    EXPECT_EQ(page.fields["canonical_url"], "https://example.com/docs/");
    EXPECT_EQ(page.fields["page_size_bytes"], std::to_string(html.size()));
}

TEST(HtmlParserTest, BaseHrefChangesResolution) {
    std::string html = R"html(
        <head><base href="https://cdn.example.com/assets/"></head>
        <body><a href="page.html">p</a><a href="../up.html">u</a></body>
    )html";
    HtmlParser parser;
    auto       page = parser.parse(html, "https://example.com/");
    ASSERT_EQ(page.links.size(), 2u);
    EXPECT_EQ(page.links[0], "https://cdn.example.com/assets/page.html");
    EXPECT_EQ(page.links[1], "https://cdn.example.com/up.html");
}

TEST(HtmlParserTest, DuplicateLinksCollapsed) {
    std::string html = "<a href='/a'>1</a><a href='/a'>2</a><area href='/b'><a href='/a'>3</a>";
    HtmlParser  parser;
    auto        page = parser.parse(html, "https://example.com/");
    EXPECT_EQ(page.links, (std::vector<std::string>{"https://example.com/a", "https://example.com/b"}));
}

TEST(HtmlParserTest, MalformedHtmlIsTolerated) {
    std::string html = "<html><body><div><a href='/ok'>unclosed <p><a href=/bare>bare</a><<<>>>";
    HtmlParser  parser;
    auto        page = parser.parse(html, "https://example.com/");
    std::set<std::string> link_set(page.links.begin(), page.links.end());
    EXPECT_TRUE(link_set.count("https://example.com/ok"));
    EXPECT_TRUE(link_set.count("https://example.com/bare"));
}

TEST(HtmlParserTest, EmptyBody) {
    HtmlParser parser;
    auto       page = parser.parse("", "https://example.com/");
    EXPECT_TRUE(page.links.empty());
    EXPECT_EQ(page.fields["page_size_bytes"], "0");
}

TEST(LinkSalvageTest, FindsQuotedAndBareHrefs) {
    std::string body  = R"(junk <a href="/one">1</a> <A HREF='two'>2</a> <a href=three>3</a> <a href="#x">)";
    auto        links = salvage_links(body, "https://example.com/dir/");
    EXPECT_EQ(links, (std::vector<std::string>{"https://example.com/one",
                                               "https://example.com/dir/two",
                                               "https://example.com/dir/three"}));
}

TEST(LinkSalvageTest, SkipsNonHttpAndDuplicates) {
    std::string body  = R"(<a href="mailto:a@b.c"> <a href="/p"> <a href='/p'> <a href="ftp://x/y">)";
    auto        links = salvage_links(body, "https://example.com/");
    EXPECT_EQ(links, std::vector<std::string>{"https://example.com/p"});
}

TEST(StringUtilsTest, Basics) {
    EXPECT_EQ(trim("  \t a b \n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
    EXPECT_TRUE(starts_with("https://x", "https"));
    EXPECT_FALSE(starts_with("http", "https"));
    EXPECT_TRUE(ends_with("abc.entry", ".entry"));
    EXPECT_EQ(split("a, b,,c", ','), (std::vector<std::string>{"a", "b", "c"}));

    const unsigned char bytes[] = {0x00, 0xab, 0xff};
    EXPECT_EQ(to_hex(bytes, 3), "00abff");
}
