/**
 * @file ConversationGraph.hpp
 * @brief Validated, indexed node graph of a single conversation.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include "NodeStore.hpp"

namespace threadwalker::domain {

class GraphParser;

/**
 * @class ConversationGraph
 * @brief Read-only view over a NodeStore with a single root and derived children.
 *
 * Only GraphParser builds instances, so every graph in circulation has passed
 * root validation. Children lists come from parent links, not from the
 * export's declared children.
 */
class ConversationGraph {
public:
    const std::string& conversationId() const { return m_conversationId; }

    /** @brief Id of the single parentless node. */
    const std::string& root() const { return m_rootId; }

    /** @brief Pointer set at export time; may not resolve. */
    const std::optional<std::string>& currentNodeId() const { return m_currentNodeId; }

    /**
     * @brief Looks up a node.
     * @throws std::out_of_range if the id is unknown.
     */
    const MessageNode& node(const std::string& id) const;

    /** @brief Returns the node or nullptr. */
    const MessageNode* findNode(const std::string& id) const { return m_store.find(id); }

    bool contains(const std::string& id) const { return m_store.contains(id); }

    /** @brief Derived children of a node, in declared order where consistent. */
    const std::vector<std::string>& children(const std::string& id) const;

    /**
     * @brief Ordered ancestor chain from a leaf up to the root (both included).
     * @throws std::out_of_range if leafId is unknown.
     * @throws CyclicGraph if an id repeats along the way.
     */
    std::vector<std::string> pathToRoot(const std::string& leafId) const;

    /** @brief Number of child-list entries corrected while parsing. */
    size_t repairedLinks() const { return m_repairedLinks; }

    size_t size() const { return m_store.size(); }

    /** @brief Node ids in export order. */
    const std::vector<std::string>& nodeIds() const { return m_store.ids(); }

private:
    friend class GraphParser;
    ConversationGraph() = default;

    std::string m_conversationId;
    NodeStore m_store;
    std::string m_rootId;
    std::optional<std::string> m_currentNodeId;
    std::unordered_map<std::string, std::vector<std::string>> m_children;
    size_t m_repairedLinks = 0;
};

} // namespace threadwalker::domain
