#include "application/MarkdownRenderer.hpp"
#include "domain/ContentNormalizer.hpp"
#include <sstream>

namespace threadwalker::application {

using namespace threadwalker::domain;

const char* MarkdownRenderer::RoleIcon(Role role) {
    switch (role) {
        case Role::User: return "👤";
        case Role::Assistant: return "🤖";
        case Role::System: return "⚙️";
        case Role::Tool: return "🔧";
        default: return "💬";
    }
}

const char* MarkdownRenderer::RoleLabel(Role role) {
    switch (role) {
        case Role::User: return "User";
        case Role::Assistant: return "Assistant";
        case Role::System: return "System";
        case Role::Tool: return "Tool";
        default: return "Unknown";
    }
}

std::string MarkdownRenderer::Render(const Conversation& conversation) {
    const auto& meta = conversation.getMetadata();
    std::stringstream ss;

    ss << "# " << meta.title << "\n\n";
    ss << "**Project:** " << (meta.projectName ? *meta.projectName : "None") << "\n";
    ss << "**Created:** " << ContentNormalizer::FormatDate(meta.createdAt) << "\n";
    ss << "**Last Updated:** " << ContentNormalizer::FormatDate(meta.updatedAt) << "\n";
    ss << "**Model:** " << (meta.model ? *meta.model : "unknown") << "\n";
    ss << "\n---\n";

    for (const auto& msg : conversation.getMessages()) {
        ss << "\n### " << RoleIcon(msg.getRole()) << " " << RoleLabel(msg.getRole())
           << " – " << ContentNormalizer::FormatTimestamp(msg.getTimestamp()) << "\n\n";
        ss << msg.getDisplayText() << "\n";
    }

    return ss.str();
}

std::string MarkdownRenderer::Preview(const Conversation& conversation, size_t maxLength) {
    for (const auto& msg : conversation.getMessages()) {
        if (msg.getRole() != Role::User) continue;
        std::string content = ContentNormalizer::Trim(msg.getDisplayText());
        if (content.empty()) continue;
        if (content.size() > maxLength) {
            return ContentNormalizer::TruncateUtf8(content, maxLength) + "...";
        }
        return content;
    }
    return "No preview available";
}

} // namespace threadwalker::application
