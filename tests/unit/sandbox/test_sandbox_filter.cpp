#include <gtest/gtest.h>
#include <hyper-cri/sandbox/sandbox_filter.hpp>

#include "fakes/fake_engine_client.hpp"

using namespace hyper_cri;
using hyper_cri::fakes::makeRecord;

class SandboxFilterTest : public ::testing::Test {
protected:
    EngineRecord running_ = makeRecord("pod-1", "k8s_a_ns_u1_0", "running", 100,
                                       {{"app", "web"}, {"tier", "front"}, {"annotation.owner", "x"}});
    EngineRecord failed_ = makeRecord("pod-2", "k8s_b_ns_u2_0", "failed", 200, {{"app", "db"}});
};

TEST_F(SandboxFilterTest, EmptyFilterMatchesEverything)
{
    SandboxFilter filter;
    EXPECT_TRUE(matchesFilter(running_, filter));
    EXPECT_TRUE(matchesFilter(failed_, filter));
}

TEST_F(SandboxFilterTest, IdClause)
{
    SandboxFilter filter;
    filter.id = "pod-2";

    EXPECT_FALSE(matchesFilter(running_, filter));
    EXPECT_TRUE(matchesFilter(failed_, filter));
}

TEST_F(SandboxFilterTest, StateClauseUsesPhaseMapping)
{
    SandboxFilter ready;
    ready.state = SandboxState::READY;
    EXPECT_TRUE(matchesFilter(running_, ready));
    EXPECT_FALSE(matchesFilter(failed_, ready));

    SandboxFilter not_ready;
    not_ready.state = SandboxState::NOT_READY;
    EXPECT_FALSE(matchesFilter(running_, not_ready));
    EXPECT_TRUE(matchesFilter(failed_, not_ready));
}

TEST_F(SandboxFilterTest, LabelSelectorIsSubsetMatch)
{
    SandboxFilter filter;
    filter.label_selector = std::map<std::string, std::string>{{"app", "web"}};
    EXPECT_TRUE(matchesFilter(running_, filter));
    EXPECT_FALSE(matchesFilter(failed_, filter));

    filter.label_selector = std::map<std::string, std::string>{{"app", "web"}, {"tier", "back"}};
    EXPECT_FALSE(matchesFilter(running_, filter));

    filter.label_selector = std::map<std::string, std::string>{};
    EXPECT_TRUE(matchesFilter(running_, filter));
    EXPECT_TRUE(matchesFilter(failed_, filter));
}

TEST_F(SandboxFilterTest, SelectorDoesNotSeeAnnotations)
{
    SandboxFilter filter;
    filter.label_selector = std::map<std::string, std::string>{{"owner", "x"}};
    EXPECT_FALSE(matchesFilter(running_, filter));

    filter.label_selector = std::map<std::string, std::string>{{"annotation.owner", "x"}};
    EXPECT_FALSE(matchesFilter(running_, filter));
}

TEST_F(SandboxFilterTest, ClausesCompose)
{
    SandboxFilter filter;
    filter.id = "pod-1";
    filter.state = SandboxState::READY;
    filter.label_selector = std::map<std::string, std::string>{{"tier", "front"}};
    EXPECT_TRUE(matchesFilter(running_, filter));

    filter.state = SandboxState::NOT_READY;
    EXPECT_FALSE(matchesFilter(running_, filter));

    filter.state = SandboxState::READY;
    filter.id = "pod-2";
    EXPECT_FALSE(matchesFilter(running_, filter));
}

TEST_F(SandboxFilterTest, SelectorHelper)
{
    StringMap labels = {{"a", "1"}, {"b", "2"}};

    EXPECT_TRUE(labelsMatchSelector(labels, {}));
    EXPECT_TRUE(labelsMatchSelector(labels, {{"a", "1"}}));
    EXPECT_FALSE(labelsMatchSelector(labels, {{"a", "2"}}));
    EXPECT_FALSE(labelsMatchSelector(labels, {{"c", "1"}}));
    EXPECT_FALSE(labelsMatchSelector({}, {{"a", "1"}}));
}
