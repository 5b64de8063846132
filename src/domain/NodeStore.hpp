/**
 * @file NodeStore.hpp
 * @brief Arena of message nodes addressed by id.
 */

#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include "MessageNode.hpp"

namespace threadwalker::domain {

/**
 * @class NodeStore
 * @brief Holds one conversation's node table.
 *
 * Nodes never point at each other; every relation is an id looked up here.
 * Iteration follows insertion order so that anything derived from the table
 * is independent of hash ordering.
 */
class NodeStore {
public:
    /**
     * @brief Adds a node.
     * @return False if a node with the same id is already present (the first one wins).
     */
    bool insert(MessageNode node) {
        if (m_nodes.count(node.id) != 0) {
            return false;
        }
        m_order.push_back(node.id);
        std::string id = node.id;
        m_nodes.emplace(std::move(id), std::move(node));
        return true;
    }

    /** @brief Returns the node or nullptr. */
    const MessageNode* find(const std::string& id) const {
        auto it = m_nodes.find(id);
        return it == m_nodes.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& id) const { return m_nodes.count(id) != 0; }

    size_t size() const { return m_order.size(); }
    bool empty() const { return m_order.empty(); }

    /** @brief Node ids in insertion order. */
    const std::vector<std::string>& ids() const { return m_order; }

private:
    std::unordered_map<std::string, MessageNode> m_nodes;
    std::vector<std::string> m_order;
};

} // namespace threadwalker::domain
