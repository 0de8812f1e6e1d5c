#include <gtest/gtest.h>
#include "../../src/utils/text/link_extractor.hpp"
#include "../../src/utils/text/string_utils.hpp"

using namespace Wikipath::Utils::Text;

TEST(TextTest, LinkExtractionRealistic) {
    std::string html = R"html(
        <div id="content">
            <p>The <a href="/wiki/Physics">physical sciences</a> study
               <a href="/wiki/Matter" title="Matter">matter</a>.</p>
            <a href="https://example.com/1">External</a>
            <a href="/w/index.php?title=Edit">Edit</a>
            <a href="javascript:void(0)">JS link</a>
            <a class="no-href">No href</a>
            <a href="#top">Anchor</a>
            <nav><ul><li><a href="/wiki/Main_Page">Main page</a></li></ul></nav>
        </div>
    )html";
    auto links = LinkExtractor::extract(html, "/wiki/");

    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0].href, "/wiki/Physics");
    EXPECT_EQ(links[0].text, "physical sciences");
    EXPECT_EQ(links[1].href, "/wiki/Matter");
    EXPECT_EQ(links[2].href, "/wiki/Main_Page");
}

TEST(TextTest, EmptyPrefixKeepsEveryHref) {
    std::string html = "<a href='/a'>a</a><a>none</a><a href=''>empty</a><a href='mailto:x@y.z'>m</a>";
    auto        links = LinkExtractor::extract(html, "");

    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0].href, "/a");
    EXPECT_EQ(links[1].href, "");
    EXPECT_EQ(links[2].href, "mailto:x@y.z");
}

TEST(TextTest, CaseInsensitiveTags) {
    std::string html  = "<A HREF='/wiki/Upper'>Upper</A>";
    auto        links = LinkExtractor::extract(html, "/wiki/");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "/wiki/Upper");
}

TEST(TextTest, NestedMarkupTextIsFlattened) {
    std::string html  = "<a href='/wiki/Q'>  <b>Quantum</b>\n\t<i>field</i>   theory </a>";
    auto        links = LinkExtractor::extract(html, "/wiki/");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].text, "Quantum field theory");
}

TEST(TextTest, CommentedLinksAreIgnored) {
    std::string html = R"html(
        <!-- <a href="/wiki/Hidden">Hidden</a> -->
        <a href="/wiki/Visible">Visible</a>
        <link rel="stylesheet" href="/wiki/style.css">
        <area shape="rect" coords="0,0,82,126" href="/wiki/Area">
    )html";
    auto links = LinkExtractor::extract(html, "/wiki/");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "/wiki/Visible");
}

TEST(TextTest, MalformedHtml) {
    auto links = LinkExtractor::extract("<div><a href='/wiki/Open'>Unclosed<p>nested", "/wiki/");
    ASSERT_FALSE(links.empty());
    EXPECT_EQ(links[0].href, "/wiki/Open");

    EXPECT_TRUE(LinkExtractor::extract("<<<<>>>>", "/wiki/").empty());
    EXPECT_TRUE(LinkExtractor::extract("", "/wiki/").empty());
}

TEST(TextTest, UnicodeInLinks) {
    std::string html  = "<a href='/wiki/Caf\xC3\xA9'>Caf\xC3\xA9</a>";
    auto        links = LinkExtractor::extract(html, "/wiki/");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "/wiki/Caf\xC3\xA9");
    EXPECT_EQ(links[0].text, "Caf\xC3\xA9");
}

TEST(TextTest, LargeHtml) {
    std::string html = "<html><body>";
    for (int i = 0; i < 1000; ++i) {
        html += "<p>Paragraph " + std::to_string(i) + " with <a href='/wiki/P" + std::to_string(i)
                + "'>link</a></p>";
    }
    html += "</body></html>";

    auto links = LinkExtractor::extract(html, "/wiki/");
    ASSERT_EQ(links.size(), 1000u);
    EXPECT_EQ(links.front().href, "/wiki/P0");
    EXPECT_EQ(links.back().href, "/wiki/P999");
}

TEST(TextTest, NestingStress) {
    std::string html;
    for (int i = 0; i < 1000; ++i)
        html += "<div>";
    html += "<a href='/wiki/Leaf'>Leaf</a>";
    for (int i = 0; i < 1000; ++i)
        html += "</div>";

    auto links = LinkExtractor::extract(html, "/wiki/");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].href, "/wiki/Leaf");
}

TEST(StringUtilsTest, Basics) {
    EXPECT_EQ(trim("  padded \t\n"), "padded");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("MiXeD Case"), "mixed case");
    EXPECT_TRUE(starts_with("/wiki/Physics", "/wiki/"));
    EXPECT_FALSE(starts_with("/w", "/wiki/"));
    EXPECT_TRUE(starts_with("anything", ""));
    EXPECT_EQ(collapse_whitespace("  a \n\n b\t c  "), "a b c");
    EXPECT_EQ(join({"x", "y", "z"}, " "), "x y z");
    EXPECT_EQ(join({}, " "), "");
}
