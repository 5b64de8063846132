/**
 * @file ConversationBuilder.hpp
 * @brief Builds Conversation entities from decoded export records.
 */

#pragma once

#include <string>
#include <vector>
#include "application/Settings.hpp"
#include "domain/Conversation.hpp"
#include "domain/ConversationRecord.hpp"

namespace threadwalker::application {

/**
 * @struct ParseResult
 * @brief Output of a parse pass: built conversations plus what had to be skipped.
 */
struct ParseResult {
    std::vector<domain::Conversation> conversations; ///< Most recently updated first.
    std::vector<domain::SkippedConversation> skipped; ///< In export order.
};

/**
 * @class ConversationBuilder
 * @brief Runs GraphParser, Linearizer and ContentNormalizer for every record.
 *
 * Stateless apart from its settings. A record that fails graph validation is
 * reported in ParseResult::skipped and never stops the rest of the batch.
 */
class ConversationBuilder {
public:
    explicit ConversationBuilder(Settings settings = {});

    /**
     * @brief Builds one conversation.
     * @throws domain::GraphError when the graph cannot be linearized.
     */
    domain::Conversation Build(const domain::ConversationRecord& record) const;

    /**
     * @brief Builds every record, in parallel across records.
     *
     * The result is identical to a sequential run for the same input.
     */
    ParseResult Parse(const std::vector<domain::ConversationRecord>& records) const;

    /** @brief Title used when neither the export nor a user message provides one. */
    static constexpr const char* kUntitled = "Untitled Conversation";

    /**
     * @brief First user message collapsed to one line and cut to maxLength bytes plus "...".
     * @return kUntitled when there is no user text.
     */
    static std::string DeriveTitle(const std::vector<domain::Message>& messages, size_t maxLength);

private:
    size_t workerCount(size_t recordCount) const;

    Settings m_settings;
};

} // namespace threadwalker::application
