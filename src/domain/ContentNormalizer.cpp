/**
 * @file ContentNormalizer.cpp
 * @brief Implementation of ContentNormalizer.
 */

#include "domain/ContentNormalizer.hpp"
#include <cmath>
#include <ctime>

namespace threadwalker::domain {

namespace {
    const char* kWhitespace = " \t\r\n\f\v";

    // Upper bound keeps the value inside a four-digit year.
    constexpr double kMaxEpoch = 253402300799.0;

    bool IsBlank(const std::string& text) {
        return text.find_first_not_of(kWhitespace) == std::string::npos;
    }

    std::string FormatLocal(std::optional<double> epochSeconds, const char* pattern) {
        if (!epochSeconds || !std::isfinite(*epochSeconds) || *epochSeconds < 0.0 || *epochSeconds > kMaxEpoch) {
            return ContentNormalizer::kTimeUnknown;
        }
        std::time_t seconds = static_cast<std::time_t>(std::floor(*epochSeconds));
        std::tm local{};
        if (!localtime_r(&seconds, &local)) {
            return ContentNormalizer::kTimeUnknown;
        }
        char buf[64];
        if (std::strftime(buf, sizeof(buf), pattern, &local) == 0) {
            return ContentNormalizer::kTimeUnknown;
        }
        return buf;
    }
}

std::string ContentNormalizer::JoinParts(const std::vector<std::string>& parts) {
    std::string joined;
    bool first = true;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!first) joined += '\n';
        joined += part;
        first = false;
    }
    return joined;
}

std::string ContentNormalizer::DisplayText(const MessageNode& node) {
    if (!node.hasMessage) return {};
    return JoinParts(node.contentParts);
}

bool ContentNormalizer::IsFilterable(const MessageNode& node) {
    return IsBlank(DisplayText(node));
}

Visibility ContentNormalizer::Classify(const MessageNode& node) {
    if (IsFilterable(node)) return Visibility::Structural;
    if (node.role == Role::Tool) return Visibility::ToolOutput;

    if (node.hidden || node.recipient != "all" ||
        node.contentType == "user_editable_context" ||
        node.contentType == "model_editable_context") {
        return Visibility::HiddenScaffolding;
    }

    switch (node.role) {
        case Role::System: return Visibility::SystemInstruction;
        case Role::User:
        case Role::Assistant: return Visibility::Visible;
        default: return Visibility::UnknownRole;
    }
}

std::string ContentNormalizer::FormatTimestamp(std::optional<double> epochSeconds) {
    return FormatLocal(epochSeconds, "%b %d, %Y %I:%M %p");
}

std::string ContentNormalizer::FormatDate(std::optional<double> epochSeconds) {
    return FormatLocal(epochSeconds, "%B %d, %Y");
}

std::string ContentNormalizer::Trim(const std::string& text) {
    size_t start = text.find_first_not_of(kWhitespace);
    if (start == std::string::npos) return {};
    size_t end = text.find_last_not_of(kWhitespace);
    return text.substr(start, end - start + 1);
}

std::string ContentNormalizer::CollapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }
    return out;
}

std::string ContentNormalizer::TruncateUtf8(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t cut = maxBytes;
    // Step back over continuation bytes (10xxxxxx) to a sequence boundary.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

} // namespace threadwalker::domain
