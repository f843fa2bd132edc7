#include <gtest/gtest.h>
#include <roundabout/roundabout.hpp>

#include <set>
#include <thread>
#include <vector>

using namespace roundabout;
using namespace std::chrono_literals;

namespace {

ConfigurationProfile profile_for(const std::string& scope) {
    ConfigurationProfile p;
    p.llm_model = "model";
    p.memory_scope = scope;
    return p;
}

} // namespace

// ===========================================================================
// Root threads
// ===========================================================================

TEST(ContextThreadTest, RootThreadUsesDefaultBudget) {
    Timestamp now = Timestamp{} + 1h;
    ResourceBudget fallback{10, 100, 1024, 30000};
    auto t = make_root_thread("thread-1", "goal", "task", profile_for("user:alice"),
                              fallback, now);
    EXPECT_EQ(t.budget, fallback);
    EXPECT_EQ(t.recursion_depth, 0);
    EXPECT_FALSE(t.parent_agent_id.has_value());
    EXPECT_EQ(t.memory_scope, "user:alice");
    EXPECT_EQ(t.created_at, now);
}

TEST(ContextThreadTest, ProfileBudgetWins) {
    auto p = profile_for("user:alice");
    p.resource_budget = ResourceBudget{1, 2, 3, 4};
    auto t = make_root_thread("thread-1", "goal", "task", p, ResourceBudget{10, 100, 1024, 30000},
                              Timestamp{});
    EXPECT_EQ(t.budget, (ResourceBudget{1, 2, 3, 4}));
}

// ===========================================================================
// Child derivation
// ===========================================================================

TEST(ContextThreadTest, ChildBudgetIsShareOfRemaining) {
    ResourceBudget budget{10, 100, 1024, 30000};
    ResourceUsage used{4, 40, 400, 12000};
    EXPECT_EQ(derive_child_budget(budget, used, 0.3), (ResourceBudget{1, 18, 187, 5400}));
}

TEST(ContextThreadTest, ChildBudgetOfExhaustedParentIsZero) {
    ResourceBudget budget{10, 100, 1024, 30000};
    EXPECT_TRUE(derive_child_budget(budget, ResourceUsage{20, 200, 2048, 60000}, 0.3).is_zero());
}

TEST(ContextThreadTest, ChildThreadSharesGoalAndIncrementsDepth) {
    auto parent = make_root_thread("thread-1", "ship it", "plan", profile_for("user:alice"),
                                   ResourceBudget{10, 100, 1024, 30000}, Timestamp{});
    Timestamp now = Timestamp{} + 5s;
    auto child = derive_child_thread(parent, "agent-1", "thread-2", "subtask",
                                     profile_for("user:alice"), ResourceUsage{}, 0.3, now);

    EXPECT_EQ(child.id, "thread-2");
    EXPECT_EQ(child.top_level_goal, "ship it");
    EXPECT_EQ(child.task_definition, "subtask");
    ASSERT_TRUE(child.parent_agent_id.has_value());
    EXPECT_EQ(*child.parent_agent_id, "agent-1");
    EXPECT_EQ(child.recursion_depth, 1);
    EXPECT_EQ(child.budget, (ResourceBudget{3, 30, 307, 9000}));
    EXPECT_EQ(child.created_at, now);
}

TEST(ContextThreadTest, ExplicitChildBudgetIsKept) {
    auto parent = make_root_thread("thread-1", "goal", "task", profile_for("user:alice"),
                                   ResourceBudget{10, 100, 1024, 30000}, Timestamp{});
    auto p = profile_for("user:alice");
    p.resource_budget = ResourceBudget{2, 2, 2, 2};
    auto child = derive_child_thread(parent, "agent-1", "thread-2", "sub", p, ResourceUsage{},
                                     0.3, Timestamp{});
    EXPECT_EQ(child.budget, (ResourceBudget{2, 2, 2, 2}));
}

// ===========================================================================
// Helpers
// ===========================================================================

TEST(ContextThreadTest, UserFromMemoryScope) {
    EXPECT_EQ(user_from_memory_scope("user:alice"), "alice");
    EXPECT_EQ(user_from_memory_scope("user:"), "default-user");
    EXPECT_EQ(user_from_memory_scope("session:42"), "default-user");
    EXPECT_EQ(user_from_memory_scope(""), "default-user");
}

TEST(ContextThreadTest, RecursionDepthFallsBack) {
    ContextThread t;
    EXPECT_EQ(max_recursion_depth(t, 5), 5);
    t.profile.max_recursion_depth = 2;
    EXPECT_EQ(max_recursion_depth(t, 5), 2);
}

TEST(IdGeneratorTest, IdsAreUniqueAcrossThreads) {
    IdGenerator ids("t-");
    EXPECT_EQ(ids.next("agent"), "t-agent-1");

    std::vector<std::vector<std::string>> produced(4);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            for (int n = 0; n < 250; ++n) produced[i].push_back(ids.next("agent"));
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> unique;
    for (auto& v : produced) unique.insert(v.begin(), v.end());
    EXPECT_EQ(unique.size(), 1000u);
}
