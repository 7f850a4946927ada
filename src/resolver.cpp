#include "resolver.hpp"

#include <unordered_set>

namespace {

struct Frame {
    std::string name;
    size_t next_dep = 0;
};

} // anonymous namespace

std::vector<std::string> resolve_dependencies(const Catalog& catalog, const std::string& root) {
    catalog.at(root);

    std::vector<std::string> resolved;
    std::unordered_set<std::string> visited{root};
    std::vector<Frame> stack;
    stack.push_back({root});

    // Iterative DFS; a plugin is emitted once all of its dependencies are.
    while (!stack.empty()) {
        Frame& frame = stack.back();
        const auto& deps = catalog.dependencies_of(frame.name);

        if (frame.next_dep == deps.size()) {
            if (frame.name != root) {
                resolved.push_back(frame.name);
            }
            stack.pop_back();
            continue;
        }

        const DependencyRef& dep = deps[frame.next_dep++];
        if (dep.optional || !visited.insert(dep.name).second) {
            continue;
        }
        stack.push_back({dep.name});
    }
    return resolved;
}
