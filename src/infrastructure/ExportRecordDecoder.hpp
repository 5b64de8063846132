/**
 * @file ExportRecordDecoder.hpp
 * @brief Converts the export's JSON document into typed conversation records.
 *
 * This is the only place that inspects export JSON. Field types are checked
 * once here so the parsing core works on plain structs.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ConversationRecord.hpp"

namespace threadwalker::infrastructure {

/**
 * @struct DecodeResult
 * @brief Records that decoded, plus the entries that did not.
 */
struct DecodeResult {
    std::vector<domain::ConversationRecord> records;
    std::vector<domain::SkippedConversation> skipped;
};

class ExportRecordDecoder {
public:
    /**
     * @brief Locates the conversation array inside a document.
     *
     * Accepts a bare array, an object with a "conversations" or "data" array, or
     * an object whose first array member holds conversation-like objects.
     * @throws std::invalid_argument if no conversation array is found.
     */
    static const nlohmann::json& Unwrap(const nlohmann::json& document);

    /**
     * @brief Decodes every entry of a document. Entries that fail are reported,
     * never thrown.
     * @throws std::invalid_argument if the document holds no conversation array.
     */
    static DecodeResult Decode(const nlohmann::json& document);

    /**
     * @brief Decodes one conversation entry.
     * @param entry JSON object of a single conversation.
     * @param index Position in the export array; used for fallback ids.
     * @throws std::invalid_argument or nlohmann::json::exception on malformed fields.
     */
    static domain::ConversationRecord DecodeRecord(const nlohmann::json& entry, size_t index);
};

} // namespace threadwalker::infrastructure
