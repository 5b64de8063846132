/**
 * @file Conversation.hpp
 * @brief Domain entities produced by linearization: Message, Conversation, Project.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <sstream>
#include "MessageNode.hpp"
#include "Linearizer.hpp"

namespace threadwalker::domain {

/**
 * @class Message
 * @brief One entry of a linear thread. Immutable once built.
 */
class Message {
public:
    Message(Role role, std::string displayText, std::optional<double> timestamp,
            size_t sequenceIndex, std::string sourceNodeId,
            std::optional<std::string> modelSlug = std::nullopt)
        : m_role(role), m_displayText(std::move(displayText)), m_timestamp(timestamp),
          m_sequenceIndex(sequenceIndex), m_sourceNodeId(std::move(sourceNodeId)),
          m_modelSlug(std::move(modelSlug)) {}

    Role getRole() const { return m_role; }
    const std::string& getDisplayText() const { return m_displayText; }
    const std::optional<double>& getTimestamp() const { return m_timestamp; }

    /** @brief 0-based position in the thread. */
    size_t getSequenceIndex() const { return m_sequenceIndex; }

    /** @brief Id of the graph node this message was read from. */
    const std::string& getSourceNodeId() const { return m_sourceNodeId; }

    const std::optional<std::string>& getModelSlug() const { return m_modelSlug; }

    /** @brief Whitespace-separated word count. */
    size_t wordCount() const {
        std::stringstream ss(m_displayText);
        std::string word;
        size_t count = 0;
        while (ss >> word) ++count;
        return count;
    }

private:
    Role m_role;
    std::string m_displayText;
    std::optional<double> m_timestamp;
    size_t m_sequenceIndex;
    std::string m_sourceNodeId;
    std::optional<std::string> m_modelSlug;
};

/**
 * @class Conversation
 * @brief A conversation reduced to the thread that was current at export time.
 */
class Conversation {
public:
    /**
     * @struct Metadata
     * @brief Descriptive fields of a conversation.
     */
    struct Metadata {
        std::string id; ///< Export conversation id.
        std::string title; ///< Export title or one derived from the first user message.
        std::optional<double> createdAt; ///< Epoch seconds.
        std::optional<double> updatedAt; ///< Epoch seconds.
        std::optional<std::string> projectId;
        std::optional<std::string> projectName;
        std::optional<std::string> model;
    };

    Conversation(Metadata meta, std::vector<Message> messages,
                 std::vector<std::string> systemInstructions = {},
                 LinearizationPolicy linearization = LinearizationPolicy::CurrentNodePath)
        : m_metadata(std::move(meta)), m_messages(std::move(messages)),
          m_systemInstructions(std::move(systemInstructions)), m_linearization(linearization) {}

    const Metadata& getMetadata() const { return m_metadata; }
    const std::string& getId() const { return m_metadata.id; }
    const std::string& getTitle() const { return m_metadata.title; }
    const std::vector<Message>& getMessages() const { return m_messages; }

    /** @brief Non-empty system instruction texts kept out of the thread. */
    const std::vector<std::string>& getSystemInstructions() const { return m_systemInstructions; }

    /** @brief Policy that produced the thread. */
    LinearizationPolicy getLinearization() const { return m_linearization; }

    size_t wordCount() const {
        size_t total = 0;
        for (const auto& msg : m_messages) total += msg.wordCount();
        return total;
    }

private:
    Metadata m_metadata;
    std::vector<Message> m_messages;
    std::vector<std::string> m_systemInstructions;
    LinearizationPolicy m_linearization;
};

/** @brief Id and display name of the bucket for conversations without a project. */
inline constexpr const char* kUnassignedProjectId = "_Unassigned_";

/**
 * @struct Project
 * @brief User-defined folder of conversations. Members are referenced by id.
 */
struct Project {
    std::string id;
    std::string name;
    std::vector<std::string> conversationIds;
};

/**
 * @brief Display order: most recently updated first, then title, then id.
 * Conversations without an update time sort last.
 */
inline bool MoreRecentFirst(const Conversation& a, const Conversation& b) {
    const auto& ua = a.getMetadata().updatedAt;
    const auto& ub = b.getMetadata().updatedAt;
    if (ua.has_value() != ub.has_value()) return ua.has_value();
    if (ua && ub && *ua != *ub) return *ua > *ub;
    if (a.getTitle() != b.getTitle()) return a.getTitle() < b.getTitle();
    return a.getId() < b.getId();
}

} // namespace threadwalker::domain
