/**
 * @file ConversationBuilder.cpp
 * @brief Implementation of ConversationBuilder.
 */

#include "application/ConversationBuilder.hpp"
#include "domain/ContentNormalizer.hpp"
#include "domain/GraphErrors.hpp"
#include "domain/GraphParser.hpp"
#include "domain/Linearizer.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <optional>
#include <thread>

namespace threadwalker::application {

using namespace threadwalker::domain;

ConversationBuilder::ConversationBuilder(Settings settings)
    : m_settings(settings) {}

Conversation ConversationBuilder::Build(const ConversationRecord& record) const {
    ConversationGraph graph = GraphParser::Parse(record.id, record.nodes, record.currentNode);
    LinearThread thread = Linearizer::Linearize(graph);

    std::vector<Message> messages;
    std::vector<std::string> systemInstructions;
    for (const auto& id : thread.nodeIds) {
        const MessageNode& node = graph.node(id);
        switch (ContentNormalizer::Classify(node)) {
            case Visibility::Visible:
                messages.emplace_back(node.role, ContentNormalizer::DisplayText(node), node.createTime,
                                      messages.size(), node.id, node.modelSlug);
                break;
            case Visibility::SystemInstruction:
                systemInstructions.push_back(ContentNormalizer::Trim(ContentNormalizer::DisplayText(node)));
                break;
            default:
                break;
        }
    }

    Conversation::Metadata meta;
    meta.id = record.id;
    if (record.title && !ContentNormalizer::Trim(*record.title).empty()) {
        meta.title = *record.title;
    } else {
        meta.title = DeriveTitle(messages, m_settings.titleMaxLength);
    }
    meta.createdAt = record.createTime;
    meta.updatedAt = record.updateTime;
    if (record.project) {
        meta.projectId = record.project->id;
        meta.projectName = record.project->name;
    }
    meta.model = record.model;
    if (!meta.model) {
        for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
            if (it->getRole() == Role::Assistant && it->getModelSlug()) {
                meta.model = it->getModelSlug();
                break;
            }
        }
    }

    if (messages.empty()) {
        std::cerr << "[ConversationBuilder] Conversation " << record.id
                  << " has no visible messages; keeping it empty" << std::endl;
    }

    return Conversation(std::move(meta), std::move(messages), std::move(systemInstructions), thread.policy);
}

std::string ConversationBuilder::DeriveTitle(const std::vector<Message>& messages, size_t maxLength) {
    for (const auto& msg : messages) {
        if (msg.getRole() != Role::User) continue;
        std::string line = ContentNormalizer::CollapseWhitespace(msg.getDisplayText());
        if (line.empty()) continue;
        if (line.size() <= maxLength) return line;
        std::string cut = ContentNormalizer::Trim(ContentNormalizer::TruncateUtf8(line, maxLength));
        return cut + "...";
    }
    return kUntitled;
}

size_t ConversationBuilder::workerCount(size_t recordCount) const {
    size_t workers = m_settings.parseWorkers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, recordCount));
}

ParseResult ConversationBuilder::Parse(const std::vector<ConversationRecord>& records) const {
    ParseResult result;
    if (records.empty()) return result;

    // One slot per record; workers only ever write their own slice.
    std::vector<std::optional<Conversation>> built(records.size());
    std::vector<std::optional<SkippedConversation>> skipped(records.size());

    auto buildSlice = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            const auto& record = records[i];
            try {
                built[i] = Build(record);
            } catch (const GraphError& e) {
                skipped[i] = SkippedConversation{record.id, e.what(), record.sourceIndex};
            } catch (const std::exception& e) {
                skipped[i] = SkippedConversation{record.id, std::string("Unexpected error: ") + e.what(), record.sourceIndex};
            }
        }
    };

    const size_t workers = workerCount(records.size());
    const size_t sliceSize = (records.size() + workers - 1) / workers;
    std::vector<std::future<void>> tasks;
    for (size_t begin = 0; begin < records.size(); begin += sliceSize) {
        size_t end = std::min(records.size(), begin + sliceSize);
        tasks.push_back(std::async(std::launch::async, buildSlice, begin, end));
    }
    for (auto& task : tasks) {
        task.get();
    }

    for (size_t i = 0; i < records.size(); ++i) {
        if (built[i]) {
            result.conversations.push_back(std::move(*built[i]));
        } else if (skipped[i]) {
            std::cerr << "[ConversationBuilder] Skipped conversation " << skipped[i]->conversationId
                      << ": " << skipped[i]->reason << std::endl;
            result.skipped.push_back(std::move(*skipped[i]));
        }
    }

    std::stable_sort(result.conversations.begin(), result.conversations.end(), MoreRecentFirst);

    std::cerr << "[ConversationBuilder] Built " << result.conversations.size() << " of " << records.size()
              << " conversation(s) on " << tasks.size() << " worker(s), skipped " << result.skipped.size()
              << std::endl;
    return result;
}

} // namespace threadwalker::application
