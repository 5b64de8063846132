#pragma once

#include "domain/ConversationGraph.hpp"
#include <string>
#include <optional>

namespace threadwalker::domain {

/**
 * @brief Validates a conversation's node table and indexes its parent/child links.
 * This service is stateless; it only reads and derives over the supplied table.
 */
class GraphParser {
public:
    /**
     * @brief Builds a ConversationGraph from a raw node table.
     *
     * parentId is authoritative. Children lists are rebuilt from parent links,
     * keeping the declared order for entries that agree with them; every
     * correction is counted and logged. A parentId naming a missing node is
     * cleared, which makes that node a root candidate.
     *
     * @param conversationId Used for diagnostics and error reporting.
     * @param store Node table to take over.
     * @param currentNodeId Export's active-leaf pointer, kept as is.
     * @throws MalformedGraph if the table does not have exactly one root.
     */
    static ConversationGraph Parse(const std::string& conversationId,
                                   NodeStore store,
                                   std::optional<std::string> currentNodeId);
};

} // namespace threadwalker::domain
