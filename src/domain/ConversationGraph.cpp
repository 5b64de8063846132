#include "domain/ConversationGraph.hpp"
#include "domain/GraphErrors.hpp"
#include <stdexcept>
#include <unordered_set>

namespace threadwalker::domain {

const MessageNode& ConversationGraph::node(const std::string& id) const {
    const MessageNode* found = m_store.find(id);
    if (!found) {
        throw std::out_of_range("Unknown node id: " + id);
    }
    return *found;
}

const std::vector<std::string>& ConversationGraph::children(const std::string& id) const {
    static const std::vector<std::string> kNone;
    auto it = m_children.find(id);
    return it == m_children.end() ? kNone : it->second;
}

std::vector<std::string> ConversationGraph::pathToRoot(const std::string& leafId) const {
    std::vector<std::string> path;
    std::unordered_set<std::string> visited;

    const MessageNode* current = &node(leafId);
    while (current) {
        if (!visited.insert(current->id).second) {
            throw CyclicGraph(m_conversationId, "Cycle through node " + current->id + " while walking to root");
        }
        path.push_back(current->id);
        if (!current->parentId) break;
        // The parser cleared dangling parents, so this resolves.
        current = &node(*current->parentId);
    }
    return path;
}

} // namespace threadwalker::domain
