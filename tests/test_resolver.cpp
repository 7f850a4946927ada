#include <gtest/gtest.h>
#include "../src/catalog.hpp"
#include "../src/exception.hpp"
#include "../src/resolver.hpp"

#include <algorithm>
#include <functional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

using Edges = std::vector<std::pair<std::string, bool>>; // name, optional

Catalog make_catalog(const std::vector<std::pair<std::string, Edges>>& plugins) {
    Catalog::PluginMap map;
    for (const auto& [name, edges] : plugins) {
        PluginRecord record;
        record.name = name;
        record.version = "1.0";
        for (const auto& [dep, optional] : edges) {
            record.dependencies.push_back({dep, optional});
        }
        map.emplace(name, std::move(record));
    }
    Catalog catalog;
    catalog.populate(std::move(map));
    return catalog;
}

std::set<std::string> as_set(const std::vector<std::string>& v) {
    return {v.begin(), v.end()};
}

size_t position(const std::vector<std::string>& v, const std::string& name) {
    return static_cast<size_t>(std::find(v.begin(), v.end(), name) - v.begin());
}

} // anonymous namespace

TEST(ResolverTest, SkipsOptionalEdgesAndExcludesRoot) {
    Catalog catalog = make_catalog({
        {"A", {{"B", false}, {"C", true}}},
        {"B", {}},
        {"C", {}},
    });

    auto deps = resolve_dependencies(catalog, "A");
    EXPECT_EQ(deps, std::vector<std::string>{"B"});
}

TEST(ResolverTest, FollowsTransitiveRequiredEdgesOnly) {
    Catalog catalog = make_catalog({
        {"A", {{"B", false}}},
        {"B", {{"C", false}, {"D", true}}},
        {"C", {}},
        {"D", {{"E", false}}},
        {"E", {}},
    });

    auto deps = resolve_dependencies(catalog, "A");
    EXPECT_EQ(as_set(deps), (std::set<std::string>{"B", "C"}));
    // A dependency is listed before the plugin that needs it.
    EXPECT_LT(position(deps, "C"), position(deps, "B"));
}

TEST(ResolverTest, OptionalEdgeDoesNotHideRequiredPath) {
    Catalog catalog = make_catalog({
        {"A", {{"C", true}, {"B", false}}},
        {"B", {{"C", false}}},
        {"C", {}},
    });

    EXPECT_EQ(as_set(resolve_dependencies(catalog, "A")), (std::set<std::string>{"B", "C"}));
}

TEST(ResolverTest, SharedDependencyAppearsOnce) {
    Catalog catalog = make_catalog({
        {"A", {{"B", false}, {"C", false}}},
        {"B", {{"D", false}}},
        {"C", {{"D", false}}},
        {"D", {}},
    });

    auto deps = resolve_dependencies(catalog, "A");
    EXPECT_EQ(deps.size(), 3u);
    EXPECT_EQ(as_set(deps), (std::set<std::string>{"B", "C", "D"}));
    EXPECT_LT(position(deps, "D"), position(deps, "B"));
    EXPECT_LT(position(deps, "D"), position(deps, "C"));
}

TEST(ResolverTest, TwoPluginCycleTerminates) {
    Catalog catalog = make_catalog({
        {"A", {{"B", false}}},
        {"B", {{"A", false}}},
    });

    EXPECT_EQ(resolve_dependencies(catalog, "A"), std::vector<std::string>{"B"});
    EXPECT_EQ(resolve_dependencies(catalog, "B"), std::vector<std::string>{"A"});
}

TEST(ResolverTest, SelfDependencyAndLongCycle) {
    Catalog catalog = make_catalog({
        {"self", {{"self", false}}},
        {"A", {{"B", false}}},
        {"B", {{"C", false}}},
        {"C", {{"A", false}, {"B", false}}},
    });

    EXPECT_TRUE(resolve_dependencies(catalog, "self").empty());
    EXPECT_EQ(as_set(resolve_dependencies(catalog, "A")), (std::set<std::string>{"B", "C"}));
}

TEST(ResolverTest, DeepChainDoesNotRecurse) {
    const int depth = 100000;
    Catalog::PluginMap map;
    for (int i = 0; i < depth; ++i) {
        PluginRecord record;
        record.name = "p" + std::to_string(i);
        record.version = "1.0";
        if (i + 1 < depth) {
            record.dependencies.push_back({"p" + std::to_string(i + 1), false});
        }
        map.emplace(record.name, std::move(record));
    }
    Catalog catalog;
    catalog.populate(std::move(map));

    auto deps = resolve_dependencies(catalog, "p0");
    ASSERT_EQ(deps.size(), static_cast<size_t>(depth - 1));
    EXPECT_EQ(deps.front(), "p" + std::to_string(depth - 1));
    EXPECT_EQ(deps.back(), "p1");
}

TEST(ResolverTest, UnknownDependencyIsALeaf) {
    Catalog catalog = make_catalog({
        {"A", {{"ghost", false}, {"B", false}}},
        {"B", {}},
    });

    EXPECT_TRUE(catalog.dependencies_of("ghost").empty());
    EXPECT_EQ(as_set(resolve_dependencies(catalog, "A")), (std::set<std::string>{"ghost", "B"}));
}

TEST(ResolverTest, UnknownRootThrowsNotFound) {
    Catalog catalog = make_catalog({
        {"A", {{"ghost", false}}},
    });

    EXPECT_THROW(resolve_dependencies(catalog, "ghost"), NotFoundError);
    EXPECT_THROW(resolve_dependencies(catalog, "nothing"), NotFoundError);
}

// Random DAGs: the result must equal the set reachable over required edges.
TEST(ResolverTest, MatchesReachabilityOnRandomAcyclicCatalogs) {
    std::mt19937 rng(20261019);
    for (int round = 0; round < 50; ++round) {
        const int n = 30;
        std::vector<std::pair<std::string, Edges>> plugins;
        std::uniform_int_distribution<int> coin(0, 5);
        for (int i = 0; i < n; ++i) {
            Edges edges;
            for (int j = i + 1; j < n; ++j) {
                int roll = coin(rng);
                if (roll == 0) edges.emplace_back("p" + std::to_string(j), false);
                else if (roll == 1) edges.emplace_back("p" + std::to_string(j), true);
            }
            plugins.emplace_back("p" + std::to_string(i), edges);
        }
        Catalog catalog = make_catalog(plugins);

        std::set<std::string> expected;
        std::function<void(const std::string&)> walk = [&](const std::string& name) {
            for (const auto& dep : catalog.dependencies_of(name)) {
                if (!dep.optional && expected.insert(dep.name).second) {
                    walk(dep.name);
                }
            }
        };
        walk("p0");

        auto deps = resolve_dependencies(catalog, "p0");
        EXPECT_EQ(deps.size(), as_set(deps).size());
        EXPECT_EQ(as_set(deps), expected);
    }
}
