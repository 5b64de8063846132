/**
 * @file ArchiveSession.cpp
 * @brief Implementation of ArchiveSession.
 */

#include "application/ArchiveSession.hpp"
#include <algorithm>
#include <iostream>
#include "application/MarkdownRenderer.hpp"
#include "infrastructure/ExportRecordDecoder.hpp"

namespace threadwalker::application {

namespace {

ArchiveStats ComputeStats(const ArchiveSnapshot& snapshot) {
    ArchiveStats result;
    result.totalConversations = snapshot.conversations.size();
    result.skippedCount = snapshot.skipped.size();
    for (const auto& conv : snapshot.conversations) {
        result.totalMessages += conv.getMessages().size();
        result.totalWords += conv.wordCount();
        if (conv.getMetadata().model) {
            result.modelsUsed[*conv.getMetadata().model]++;
        }
    }
    for (const auto& [key, bucket] : snapshot.projects) {
        if (bucket.unassigned) {
            result.unassignedConversations = bucket.conversations.size();
        } else {
            result.totalProjects++;
        }
    }
    return result;
}

} // namespace

ArchiveSession::ArchiveSession(Settings settings)
    : m_settings(settings), m_builder(settings) {}

ArchiveStats ArchiveSession::load(const std::vector<domain::ConversationRecord>& records,
                                  std::vector<domain::SkippedConversation> decodeSkips) {
    ParseResult result = m_builder.Parse(records);

    auto next = std::make_shared<ArchiveSnapshot>();
    next->conversations = std::move(result.conversations);

    next->skipped = std::move(decodeSkips);
    next->skipped.insert(next->skipped.end(), result.skipped.begin(), result.skipped.end());
    std::stable_sort(next->skipped.begin(), next->skipped.end(),
                     [](const domain::SkippedConversation& a, const domain::SkippedConversation& b) {
                         return a.sourceIndex < b.sourceIndex;
                     });

    // Buckets point into next->conversations, which stays put from here on.
    next->projects = ProjectGrouper::Group(next->conversations);
    next->index.build(next->conversations);
    for (size_t i = 0; i < next->conversations.size(); ++i) {
        next->positionById.emplace(next->conversations[i].getId(), i);
    }

    // Counts describe this call's snapshot, whatever is published afterwards.
    ArchiveStats summary = ComputeStats(*next);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_snapshot = next;
    }

    std::cerr << "[ArchiveSession] Loaded " << summary.totalConversations << " conversation(s) in "
              << summary.totalProjects << " project(s), " << summary.skippedCount << " skipped" << std::endl;
    return summary;
}

ArchiveStats ArchiveSession::loadDocument(const nlohmann::json& document) {
    infrastructure::DecodeResult decoded = infrastructure::ExportRecordDecoder::Decode(document);
    return load(decoded.records, std::move(decoded.skipped));
}

std::shared_ptr<const ArchiveSnapshot> ArchiveSession::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

bool ArchiveSession::isLoaded() const {
    return snapshot() != nullptr;
}

std::vector<domain::Conversation> ArchiveSession::search(const std::string& query) const {
    std::vector<domain::Conversation> matches;
    auto current = snapshot();
    if (!current) return matches;

    for (const auto& id : current->index.query(query)) {
        auto it = current->positionById.find(id);
        if (it != current->positionById.end()) {
            matches.push_back(current->conversations[it->second]);
        }
    }
    return matches;
}

ArchiveStats ArchiveSession::stats() const {
    auto current = snapshot();
    if (!current) return {};
    return ComputeStats(*current);
}

std::optional<domain::Conversation> ArchiveSession::findConversation(const std::string& id) const {
    auto current = snapshot();
    if (!current) return std::nullopt;

    auto it = current->positionById.find(id);
    if (it == current->positionById.end()) return std::nullopt;
    return current->conversations[it->second];
}

std::optional<std::string> ArchiveSession::renderMarkdown(const std::string& id) const {
    auto current = snapshot();
    if (!current) return std::nullopt;

    auto it = current->positionById.find(id);
    if (it == current->positionById.end()) return std::nullopt;
    return MarkdownRenderer::Render(current->conversations[it->second]);
}

std::map<std::string, std::vector<domain::Conversation>> ArchiveSession::groupByProject() const {
    std::map<std::string, std::vector<domain::Conversation>> groups;
    auto current = snapshot();
    if (!current) return groups;

    for (const auto& [name, bucket] : ProjectGrouper::GroupByName(current->conversations)) {
        auto& members = groups[name];
        for (const auto* conv : bucket.conversations) {
            members.push_back(*conv);
        }
    }
    return groups;
}

std::vector<domain::Conversation> ArchiveSession::conversations() const {
    auto current = snapshot();
    if (!current) return {};
    return current->conversations;
}

std::vector<domain::SkippedConversation> ArchiveSession::skipped() const {
    auto current = snapshot();
    if (!current) return {};
    return current->skipped;
}

std::vector<BundleFile> ArchiveSession::planBundle() const {
    auto current = snapshot();
    if (!current) return {};
    return MarkdownBundle::Plan(current->conversations, m_settings.filenameMaxLength);
}

} // namespace threadwalker::application
