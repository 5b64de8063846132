/**
 * @file ArchiveSession.hpp
 * @brief Holds the currently loaded export and answers queries over it.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/ConversationBuilder.hpp"
#include "application/MarkdownBundle.hpp"
#include "application/ProjectGrouper.hpp"
#include "application/SearchIndex.hpp"
#include "application/Settings.hpp"

namespace threadwalker::application {

/**
 * @struct ArchiveStats
 * @brief Counters over the loaded export.
 */
struct ArchiveStats {
    size_t totalConversations = 0;
    size_t totalMessages = 0;
    size_t totalProjects = 0; ///< Real projects; the unassigned bucket is not counted.
    size_t skippedCount = 0;
    size_t unassignedConversations = 0;
    size_t totalWords = 0;
    std::map<std::string, size_t> modelsUsed; ///< Model slug -> conversation count.
};

/**
 * @struct ArchiveSnapshot
 * @brief Everything derived from one loaded export. Immutable once published.
 */
struct ArchiveSnapshot {
    std::vector<domain::Conversation> conversations; ///< Most recently updated first.
    std::vector<domain::SkippedConversation> skipped; ///< In export order.
    std::map<std::string, ProjectBucket> projects; ///< Keyed by project id; points into conversations.
    SearchIndex index;
    std::unordered_map<std::string, size_t> positionById;
};

/**
 * @class ArchiveSession
 * @brief Owns the loaded export for its caller (e.g. a server's user session).
 *
 * Loading builds a complete new snapshot and then swaps it in, so readers see
 * either the previous export or the new one, never a mix. Queries return
 * copies and stay valid across reloads.
 */
class ArchiveSession {
public:
    explicit ArchiveSession(Settings settings = {});

    /**
     * @brief Replaces the loaded export with the given records.
     * @param records Decoded conversation records.
     * @param decodeSkips Entries the decoder already rejected; merged into the skip report.
     */
    ArchiveStats load(const std::vector<domain::ConversationRecord>& records,
                      std::vector<domain::SkippedConversation> decodeSkips = {});

    /**
     * @brief Decodes an export document and loads it.
     * @throws std::invalid_argument if the document holds no conversation array.
     */
    ArchiveStats loadDocument(const nlohmann::json& document);

    /** @brief True once an export has been loaded. */
    bool isLoaded() const;

    /** @brief Conversations matching the query, most recently updated first. */
    std::vector<domain::Conversation> search(const std::string& query) const;

    ArchiveStats stats() const;

    std::optional<domain::Conversation> findConversation(const std::string& id) const;

    /** @brief Canonical markdown of one conversation, if loaded. */
    std::optional<std::string> renderMarkdown(const std::string& id) const;

    /** @brief Conversations keyed by project name, "_Unassigned_" included. */
    std::map<std::string, std::vector<domain::Conversation>> groupByProject() const;

    std::vector<domain::Conversation> conversations() const;
    std::vector<domain::SkippedConversation> skipped() const;

    /** @brief Bundle layout for the loaded export. */
    std::vector<BundleFile> planBundle() const;

    const Settings& settings() const { return m_settings; }

private:
    std::shared_ptr<const ArchiveSnapshot> snapshot() const;

    Settings m_settings;
    ConversationBuilder m_builder;

    mutable std::mutex m_mutex;
    std::shared_ptr<const ArchiveSnapshot> m_snapshot;
};

} // namespace threadwalker::application
