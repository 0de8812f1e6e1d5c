#include <gtest/gtest.h>
#include "../../src/engine/prioritizer/link_prioritizer.hpp"

using namespace Wikipath::Engine;
using Wikipath::Utils::Text::Anchor;

namespace {

std::vector<int> priorities_of(const std::vector<PrioritizedLink>& links) {
    std::vector<int> out;
    for (const auto& link : links)
        out.push_back(link.priority);
    return out;
}

}  // namespace

TEST(LinkPrioritizerTest, KeywordIndexBecomesPriority) {
    std::vector<Anchor> anchors = {
        {"/wiki/Chem", "Chemistry"}, {"/wiki/Phys", "Physics today"}, {"/wiki/X", "Unrelated"}};
    auto links = LinkPrioritizer::prioritize(anchors, {"physics", "math"});

    EXPECT_EQ(priorities_of(links), (std::vector<int>{2, 0, 2}));
}

TEST(LinkPrioritizerTest, KeepsInputOrderAndHrefs) {
    std::vector<Anchor> anchors = {
        {"/wiki/Zeta", "zeta"}, {"/wiki/Alpha", "alpha"}, {"/wiki/Mu", "mu"}};
    auto links = LinkPrioritizer::prioritize(anchors, {"alpha"});

    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0].href, "/wiki/Zeta");
    EXPECT_EQ(links[1].href, "/wiki/Alpha");
    EXPECT_EQ(links[2].href, "/wiki/Mu");
    EXPECT_EQ(priorities_of(links), (std::vector<int>{1, 0, 1}));
}

TEST(LinkPrioritizerTest, EmptyKeywordListGivesZero) {
    std::vector<Anchor> anchors = {{"/wiki/A", "A"}, {"/wiki/B", "B"}};
    auto                links   = LinkPrioritizer::prioritize(anchors, {});

    EXPECT_EQ(priorities_of(links), (std::vector<int>{0, 0}));
}

TEST(LinkPrioritizerTest, MatchesHrefCaseInsensitively) {
    std::vector<Anchor> anchors = {{"/wiki/Quantum_MECHANICS", "see here"}};
    auto                links   = LinkPrioritizer::prioritize(anchors, {"optics", "Mechanics"});

    EXPECT_EQ(priorities_of(links), (std::vector<int>{1}));
}

TEST(LinkPrioritizerTest, EarliestKeywordWins) {
    std::vector<Anchor> anchors = {{"/wiki/Mathematical_physics", "Mathematical physics"}};
    auto                links   = LinkPrioritizer::prioritize(anchors, {"physics", "math"});

    EXPECT_EQ(priorities_of(links), (std::vector<int>{0}));
}

TEST(LinkPrioritizerTest, NoAnchorsNoLinks) {
    EXPECT_TRUE(LinkPrioritizer::prioritize({}, {"physics"}).empty());
}
