/**
 * @file MessageNode.hpp
 * @brief Raw message node as decoded from an export's mapping table.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace threadwalker::domain {

/**
 * @enum Role
 * @brief Author role of a message node.
 */
enum class Role {
    System,
    User,
    Assistant,
    Tool,
    Unknown ///< Any author role outside the known set.
};

/** @brief Maps an export author role string to a Role. */
inline Role RoleFromString(const std::string& role) {
    if (role == "user") return Role::User;
    if (role == "assistant") return Role::Assistant;
    if (role == "system") return Role::System;
    if (role == "tool") return Role::Tool;
    return Role::Unknown;
}

inline const char* RoleToString(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
        default: return "unknown";
    }
}

/**
 * @struct MessageNode
 * @brief One node of a conversation graph.
 *
 * The root placeholder carries no message (hasMessage == false) and no parent.
 */
struct MessageNode {
    std::string id; ///< Unique within its conversation.
    std::optional<std::string> parentId; ///< Absent only for the root placeholder.
    std::vector<std::string> childrenIds; ///< As declared by the export; not trusted.

    bool hasMessage = false;
    Role role = Role::Unknown;
    std::string contentType = "text";
    std::vector<std::string> contentParts;
    std::optional<double> createTime; ///< Epoch seconds.

    std::string recipient = "all"; ///< Anything but "all" is an internal tool call.
    bool hidden = false; ///< Export flag hiding the node from normal display.
    std::optional<std::string> modelSlug;
};

} // namespace threadwalker::domain
