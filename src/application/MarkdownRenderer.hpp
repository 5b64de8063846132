/**
 * @file MarkdownRenderer.hpp
 * @brief Serializes a conversation into the canonical markdown transcript.
 */

#pragma once

#include <string>
#include "domain/Conversation.hpp"

namespace threadwalker::application {

class MarkdownRenderer {
public:
    /**
     * @brief Renders the transcript: title, metadata block, rule, then one
     * section per message in thread order. Output is byte-stable for a given
     * conversation and time zone.
     */
    static std::string Render(const domain::Conversation& conversation);

    /**
     * @brief First user message, trimmed and cut to maxLength bytes plus "...".
     * @return "No preview available" when there is no user text.
     */
    static std::string Preview(const domain::Conversation& conversation, size_t maxLength = 200);

    /** @brief Heading icon for a role ("👤" user, "🤖" assistant). */
    static const char* RoleIcon(domain::Role role);

    /** @brief Heading label for a role ("User", "Assistant"). */
    static const char* RoleLabel(domain::Role role);
};

} // namespace threadwalker::application
