/**
 * @file ConversationRecord.hpp
 * @brief Decoded, typed form of one conversation entry of an export.
 */

#pragma once
#include <string>
#include <optional>
#include "NodeStore.hpp"

namespace threadwalker::domain {

/**
 * @struct ProjectRef
 * @brief Project (folder, custom GPT or template) a conversation belongs to.
 */
struct ProjectRef {
    std::string id;
    std::string name;
};

/**
 * @struct ConversationRecord
 * @brief Raw conversation as handed to the parsing core.
 *
 * Every field has been type-checked by the decoder; nothing downstream looks
 * at JSON again.
 */
struct ConversationRecord {
    std::string id;
    std::optional<std::string> title; ///< Absent or blank means derive one.
    std::optional<double> createTime;
    std::optional<double> updateTime;
    std::optional<std::string> model; ///< default_model_slug.
    std::optional<std::string> currentNode;
    std::optional<ProjectRef> project;
    NodeStore nodes;
    size_t sourceIndex = 0; ///< Position in the export array.
};

/**
 * @struct SkippedConversation
 * @brief A conversation that could not be produced, and why.
 */
struct SkippedConversation {
    std::string conversationId;
    std::string reason;
    size_t sourceIndex = 0; ///< Position in the export array.
};

} // namespace threadwalker::domain
