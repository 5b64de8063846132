/**
 * @file GraphErrors.hpp
 * @brief Exceptions raised when a conversation graph cannot be linearized.
 */

#pragma once
#include <string>
#include <stdexcept>

namespace threadwalker::domain {

/**
 * @class GraphError
 * @brief Base for per-conversation graph failures. Never fatal to a batch.
 */
class GraphError : public std::runtime_error {
public:
    GraphError(const std::string& conversationId, const std::string& message)
        : std::runtime_error(message), m_conversationId(conversationId) {}

    const std::string& conversationId() const { return m_conversationId; }

private:
    std::string m_conversationId;
};

/** @brief Zero or several parentless nodes. */
class MalformedGraph : public GraphError {
public:
    using GraphError::GraphError;
};

/** @brief A traversal came back to a node already on its path. */
class CyclicGraph : public GraphError {
public:
    using GraphError::GraphError;
};

} // namespace threadwalker::domain
