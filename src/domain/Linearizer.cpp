#include "domain/Linearizer.hpp"
#include "domain/ContentNormalizer.hpp"
#include "domain/GraphErrors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace threadwalker::domain {

std::vector<std::string> Linearizer::SelectPath(const ConversationGraph& graph, LinearizationPolicy policy) {
    if (policy == LinearizationPolicy::CurrentNodePath) {
        const auto& current = graph.currentNodeId();
        if (!current || !graph.contains(*current)) {
            throw std::invalid_argument("Current node does not resolve in conversation " + graph.conversationId());
        }
        std::vector<std::string> path = graph.pathToRoot(*current);
        std::reverse(path.begin(), path.end());
        return path;
    }

    std::vector<std::string> path;
    std::unordered_set<std::string> visited;
    std::string cursor = graph.root();
    while (true) {
        if (!visited.insert(cursor).second) {
            throw CyclicGraph(graph.conversationId(), "Cycle through node " + cursor + " while descending from root");
        }
        path.push_back(cursor);
        const auto& next = graph.children(cursor);
        if (next.empty()) break;
        cursor = next.back();
    }
    return path;
}

LinearThread Linearizer::Linearize(const ConversationGraph& graph) {
    LinearThread thread;

    const auto& current = graph.currentNodeId();
    if (current && graph.contains(*current)) {
        thread.policy = LinearizationPolicy::CurrentNodePath;
    } else {
        thread.policy = LinearizationPolicy::LastChildFallback;
        std::cerr << "[Linearizer] Current node "
                  << (current ? "'" + *current + "' does not resolve" : "missing")
                  << " in conversation " << graph.conversationId()
                  << "; following last child at each fork" << std::endl;
    }

    for (const auto& id : SelectPath(graph, thread.policy)) {
        if (ContentNormalizer::IsFilterable(graph.node(id))) continue;
        thread.nodeIds.push_back(id);
    }
    return thread;
}

} // namespace threadwalker::domain
