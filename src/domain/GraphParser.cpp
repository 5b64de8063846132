#include "domain/GraphParser.hpp"
#include "domain/GraphErrors.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace threadwalker::domain {

namespace {
    std::string DescribeRoots(const std::vector<std::string>& roots) {
        std::stringstream ss;
        ss << "Found " << roots.size() << " root nodes (";
        const size_t shown = std::min<size_t>(roots.size(), 3);
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) ss << ", ";
            ss << roots[i];
        }
        if (roots.size() > shown) ss << ", ...";
        ss << ")";
        return ss.str();
    }
}

ConversationGraph GraphParser::Parse(const std::string& conversationId,
                                     NodeStore store,
                                     std::optional<std::string> currentNodeId) {
    ConversationGraph graph;
    graph.m_conversationId = conversationId;
    graph.m_currentNodeId = std::move(currentNodeId);

    // --- Dangling parents ---
    for (const auto& id : store.ids()) {
        MessageNode node = *store.find(id);
        if (node.parentId && !store.contains(*node.parentId)) {
            std::cerr << "[GraphParser] Node " << id << " in conversation " << conversationId
                      << " points at missing parent " << *node.parentId << std::endl;
            node.parentId.reset();
        }
        graph.m_store.insert(std::move(node));
    }

    const NodeStore& nodes = graph.m_store;

    // --- Root Discovery ---
    std::vector<std::string> roots;
    for (const auto& id : nodes.ids()) {
        if (!nodes.find(id)->parentId) roots.push_back(id);
    }
    if (roots.empty()) {
        throw MalformedGraph(conversationId, "No root node among " + std::to_string(nodes.size()) + " node(s)");
    }
    if (roots.size() > 1) {
        throw MalformedGraph(conversationId, DescribeRoots(roots));
    }
    graph.m_rootId = roots.front();

    // --- Children Derivation ---
    std::unordered_map<std::string, std::vector<std::string>> declaredByParent;
    for (const auto& id : nodes.ids()) {
        const MessageNode* node = nodes.find(id);
        if (node->parentId) declaredByParent[*node->parentId].push_back(id);
    }

    size_t repaired = 0;
    for (const auto& id : nodes.ids()) {
        const MessageNode* node = nodes.find(id);
        std::vector<std::string> derived;
        std::unordered_set<std::string> placed;

        for (const auto& childId : node->childrenIds) {
            const MessageNode* child = nodes.find(childId);
            bool consistent = child && child->parentId && *child->parentId == id;
            if (!consistent || !placed.insert(childId).second) {
                ++repaired;
                continue;
            }
            derived.push_back(childId);
        }

        auto actual = declaredByParent.find(id);
        if (actual != declaredByParent.end()) {
            for (const auto& childId : actual->second) {
                if (placed.insert(childId).second) {
                    derived.push_back(childId);
                    ++repaired;
                }
            }
        }

        if (!derived.empty()) {
            graph.m_children.emplace(id, std::move(derived));
        }
    }

    graph.m_repairedLinks = repaired;
    if (repaired > 0) {
        std::cerr << "[GraphParser] Repaired " << repaired << " child link(s) in conversation "
                  << conversationId << std::endl;
    }

    return graph;
}

} // namespace threadwalker::domain
