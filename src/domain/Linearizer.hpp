/**
 * @file Linearizer.hpp
 * @brief Selects the single thread of a branching conversation graph.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ConversationGraph.hpp"

namespace threadwalker::domain {

/**
 * @enum LinearizationPolicy
 * @brief How the thread was chosen.
 */
enum class LinearizationPolicy {
    /** Ancestors of the export's current node. Exact: the branch the export marked active. */
    CurrentNodePath,
    /**
     * Used when the current node is missing or does not resolve. From the root,
     * always follow the last child. Exports append regenerations and edits, so
     * the last child approximates the most recent branch. Best effort only: it
     * can pick a branch the user never saw last.
     */
    LastChildFallback
};

inline const char* PolicyToString(LinearizationPolicy policy) {
    return policy == LinearizationPolicy::CurrentNodePath ? "current-node" : "last-child-fallback";
}

/**
 * @struct LinearThread
 * @brief Node ids of the selected thread in conversational (root to leaf) order.
 *
 * Structural placeholders are already removed; no id appears twice.
 */
struct LinearThread {
    std::vector<std::string> nodeIds;
    LinearizationPolicy policy = LinearizationPolicy::CurrentNodePath;
};

class Linearizer {
public:
    /**
     * @brief Produces the thread the user saw last.
     * @throws CyclicGraph if a walk revisits a node.
     */
    static LinearThread Linearize(const ConversationGraph& graph);

    /**
     * @brief Full root-to-leaf path under a given policy, structural nodes included.
     *
     * CurrentNodePath requires graph.currentNodeId() to resolve.
     */
    static std::vector<std::string> SelectPath(const ConversationGraph& graph, LinearizationPolicy policy);
};

} // namespace threadwalker::domain
