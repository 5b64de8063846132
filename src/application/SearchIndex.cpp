#include "application/SearchIndex.hpp"
#include "domain/ContentNormalizer.hpp"
#include <algorithm>
#include <unicode/stringoptions.h>
#include <unicode/unistr.h>

namespace threadwalker::application {

using namespace threadwalker::domain;

std::string SearchIndex::Fold(const std::string& text) {
    // Ill-formed UTF-8 becomes U+FFFD, so folding never fails.
    std::string out;
    icu::UnicodeString::fromUTF8(text).foldCase(U_FOLD_CASE_DEFAULT).toUTF8String(out);
    return out;
}

void SearchIndex::build(const std::vector<Conversation>& conversations) {
    std::vector<const Conversation*> ordered;
    ordered.reserve(conversations.size());
    for (const auto& conv : conversations) ordered.push_back(&conv);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Conversation* a, const Conversation* b) { return MoreRecentFirst(*a, *b); });

    std::vector<Entry> entries;
    entries.reserve(ordered.size());
    for (const auto* conv : ordered) {
        Entry entry;
        entry.conversationId = conv->getId();
        entry.fields.push_back(Fold(conv->getTitle()));
        for (const auto& msg : conv->getMessages()) {
            entry.fields.push_back(Fold(msg.getDisplayText()));
        }
        entries.push_back(std::move(entry));
    }
    m_entries = std::move(entries);
}

std::vector<std::string> SearchIndex::query(const std::string& text) const {
    const std::string needle = Fold(ContentNormalizer::Trim(text));

    std::vector<std::string> hits;
    for (const auto& entry : m_entries) {
        bool matched = std::any_of(entry.fields.begin(), entry.fields.end(),
                                   [&](const std::string& field) { return field.find(needle) != std::string::npos; });
        if (matched) hits.push_back(entry.conversationId);
    }
    return hits;
}

} // namespace threadwalker::application
