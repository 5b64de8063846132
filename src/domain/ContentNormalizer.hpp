/**
 * @file ContentNormalizer.hpp
 * @brief Turns raw node content into display text and decides what is shown.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include "domain/MessageNode.hpp"

namespace threadwalker::domain {

/**
 * @enum Visibility
 * @brief Display class of a node in the rendered thread.
 */
enum class Visibility {
    Visible,           ///< User or assistant text shown in the thread.
    Structural,        ///< No message or nothing but whitespace.
    ToolOutput,        ///< Tool role output.
    HiddenScaffolding, ///< Hidden flag, tool-directed call or editable-context block.
    SystemInstruction, ///< System text kept out of the thread, surfaced as metadata.
    UnknownRole        ///< Author role the renderer has no label for.
};

class ContentNormalizer {
public:
    /** @brief Marker rendered in place of a missing timestamp. */
    static constexpr const char* kTimeUnknown = "time unknown";

    /**
     * @brief Joins content parts with a newline, skipping empty parts.
     */
    static std::string JoinParts(const std::vector<std::string>& parts);

    /** @brief Normalized display text of a node. */
    static std::string DisplayText(const MessageNode& node);

    /** @brief True if the node has no message or its joined text is blank. */
    static bool IsFilterable(const MessageNode& node);

    /**
     * @brief Classifies a node for the rendered thread.
     *
     * Tool output, hidden scaffolding, system instructions and unknown roles stay
     * in the graph but are kept out of the thread.
     */
    static Visibility Classify(const MessageNode& node);

    /**
     * @brief Formats an epoch as local "Mon DD, YYYY HH:MM AM".
     * @return kTimeUnknown when absent or not representable.
     */
    static std::string FormatTimestamp(std::optional<double> epochSeconds);

    /**
     * @brief Formats an epoch as local "Month DD, YYYY".
     * @return kTimeUnknown when absent or not representable.
     */
    static std::string FormatDate(std::optional<double> epochSeconds);

    /** @brief Trims spaces, tabs and line breaks from both ends. */
    static std::string Trim(const std::string& text);

    /** @brief Collapses every whitespace run to a single space and trims. */
    static std::string CollapseWhitespace(const std::string& text);

    /**
     * @brief Cuts text to at most maxBytes without splitting a UTF-8 sequence.
     */
    static std::string TruncateUtf8(const std::string& text, size_t maxBytes);
};

} // namespace threadwalker::domain
