/**
 * @file SearchIndex.hpp
 * @brief Case-insensitive substring search over conversation titles and messages.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Conversation.hpp"

namespace threadwalker::application {

/**
 * @class SearchIndex
 * @brief Case-folded searchable fields per conversation, in display order.
 *
 * Matching is a plain substring test of the trimmed, case-folded query against
 * each field on its own (the title, then every message text); no tokenizing,
 * stemming or ranking. Folding is ICU's full Unicode case folding, so
 * "МАШИННОЕ" matches "машинное" and "Straße" matches "STRASSE". The index is a
 * snapshot: rebuild it whenever the conversation set changes.
 */
class SearchIndex {
public:
    /**
     * @brief Replaces the index contents. Building twice from the same input
     * yields the same index.
     */
    void build(const std::vector<domain::Conversation>& conversations);

    /**
     * @brief Ids of matching conversations, most recently updated first
     * (ties by title, then id). An empty query matches everything.
     */
    std::vector<std::string> query(const std::string& text) const;

    size_t size() const { return m_entries.size(); }

    /** @brief Unicode case folding of UTF-8 text (ICU). */
    static std::string Fold(const std::string& text);

private:
    struct Entry {
        std::string conversationId;
        std::vector<std::string> fields;
    };

    std::vector<Entry> m_entries;
};

} // namespace threadwalker::application
