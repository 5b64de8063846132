/**
 * @file ExportRecordDecoder.cpp
 * @brief Implementation of ExportRecordDecoder.
 */

#include "infrastructure/ExportRecordDecoder.hpp"
#include <iostream>
#include <stdexcept>

namespace threadwalker::infrastructure {

using json = nlohmann::json;
using namespace threadwalker::domain;

namespace {
    std::optional<std::string> OptionalString(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        if (!it->is_string()) {
            throw std::invalid_argument(std::string("Field '") + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    // Timestamps of the wrong type are dropped rather than failing the record.
    std::optional<double> OptionalEpoch(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number()) return std::nullopt;
        return it->get<double>();
    }

    std::optional<std::string> NonEmpty(std::optional<std::string> value) {
        if (value && value->empty()) return std::nullopt;
        return value;
    }

    std::string ConversationId(const json& entry, size_t index) {
        for (const char* key : {"id", "conversation_id", "uuid"}) {
            auto it = entry.find(key);
            if (it == entry.end()) continue;
            if (it->is_string() && !it->get<std::string>().empty()) return it->get<std::string>();
            if (it->is_number_integer()) return std::to_string(it->get<long long>());
        }
        return "conv-" + std::to_string(index);
    }

    std::optional<ProjectRef> DecodeProject(const json& entry) {
        if (auto folder = NonEmpty(OptionalString(entry, "folder_id"))) {
            auto name = NonEmpty(OptionalString(entry, "folder_name"));
            return ProjectRef{*folder, name ? *name : "Project " + folder->substr(0, 8)};
        }
        if (auto gizmo = NonEmpty(OptionalString(entry, "gizmo_id"))) {
            auto name = NonEmpty(OptionalString(entry, "gizmo_name"));
            return ProjectRef{*gizmo, name ? *name : "GPT " + gizmo->substr(0, 8)};
        }
        if (auto tmpl = NonEmpty(OptionalString(entry, "conversation_template_id"))) {
            auto name = NonEmpty(OptionalString(entry, "conversation_template_name"));
            return ProjectRef{*tmpl, name ? *name : "Custom GPT"};
        }
        return std::nullopt;
    }

    std::string DecodeRole(const json& message) {
        auto author = message.find("author");
        if (author == message.end() || author->is_null()) return "unknown";
        if (author->is_string()) return author->get<std::string>();
        if (author->is_object()) return OptionalString(*author, "role").value_or("unknown");
        throw std::invalid_argument("Field 'author' must be an object or a string");
    }

    void DecodeContent(const json& content, MessageNode& node) {
        if (content.is_null()) return;
        if (content.is_string()) {
            node.contentParts.push_back(content.get<std::string>());
            return;
        }
        if (!content.is_object()) {
            throw std::invalid_argument("Field 'content' must be an object or a string");
        }

        node.contentType = OptionalString(content, "content_type").value_or("text");

        auto parts = content.find("parts");
        if (parts != content.end() && parts->is_array() && !parts->empty()) {
            for (const auto& part : *parts) {
                if (part.is_string()) {
                    node.contentParts.push_back(part.get<std::string>());
                } else if (part.is_object()) {
                    // Rich parts: keep their text, skip attachments.
                    auto text = part.find("text");
                    auto inner = part.find("content");
                    if (text != part.end() && text->is_string()) {
                        node.contentParts.push_back(text->get<std::string>());
                    } else if (inner != part.end() && !inner->is_null()) {
                        node.contentParts.push_back(inner->is_string() ? inner->get<std::string>() : inner->dump());
                    }
                }
            }
        } else if (auto text = OptionalString(content, "text")) {
            node.contentParts.push_back(*text);
        }
    }

    void DecodeMessage(const json& message, MessageNode& node) {
        if (!message.is_object()) {
            throw std::invalid_argument("Node " + node.id + ": 'message' must be an object");
        }
        node.hasMessage = true;
        node.role = RoleFromString(DecodeRole(message));

        auto content = message.find("content");
        if (content != message.end()) {
            DecodeContent(*content, node);
        }

        node.createTime = OptionalEpoch(message, "create_time");
        node.recipient = NonEmpty(OptionalString(message, "recipient")).value_or("all");

        auto metadata = message.find("metadata");
        if (metadata != message.end() && metadata->is_object()) {
            auto hidden = metadata->find("is_visually_hidden_from_conversation");
            node.hidden = hidden != metadata->end() && hidden->is_boolean() && hidden->get<bool>();
            node.modelSlug = NonEmpty(OptionalString(*metadata, "model_slug"));
        }
    }

    MessageNode DecodeNode(const std::string& key, const json& value) {
        if (!value.is_object()) {
            throw std::invalid_argument("Mapping entry '" + key + "' must be an object");
        }
        MessageNode node;
        node.id = NonEmpty(OptionalString(value, "id")).value_or(key);
        node.parentId = OptionalString(value, "parent");

        auto children = value.find("children");
        if (children != value.end() && !children->is_null()) {
            if (!children->is_array()) {
                throw std::invalid_argument("Node " + node.id + ": 'children' must be an array");
            }
            for (const auto& child : *children) {
                if (!child.is_string()) {
                    throw std::invalid_argument("Node " + node.id + ": child ids must be strings");
                }
                node.childrenIds.push_back(child.get<std::string>());
            }
        }

        auto message = value.find("message");
        if (message != value.end() && !message->is_null()) {
            DecodeMessage(*message, node);
        }
        return node;
    }

    // Exports without a mapping carry a flat message list; chain it under a placeholder root.
    void DecodeFlatMessages(const json& messages, ConversationRecord& record) {
        MessageNode root;
        root.id = record.id + "-root";
        std::string previous = root.id;
        std::vector<MessageNode> chain;

        for (const auto& entry : messages) {
            if (!entry.is_object()) continue;
            MessageNode node;
            node.id = NonEmpty(OptionalString(entry, "id")).value_or("msg-" + std::to_string(chain.size()));
            node.parentId = previous;
            node.hasMessage = true;

            auto role = OptionalString(entry, "role");
            node.role = RoleFromString(role ? *role : DecodeRole(entry));

            auto content = entry.find("content");
            if (content != entry.end()) {
                DecodeContent(*content, node);
            }
            node.createTime = OptionalEpoch(entry, "create_time");
            node.modelSlug = NonEmpty(OptionalString(entry, "model"));

            if (chain.empty()) {
                root.childrenIds.push_back(node.id);
            } else {
                chain.back().childrenIds.push_back(node.id);
            }
            previous = node.id;
            chain.push_back(std::move(node));
        }

        record.nodes.insert(std::move(root));
        for (auto& node : chain) {
            record.nodes.insert(std::move(node));
        }
        if (!chain.empty()) {
            record.currentNode = previous;
        }
    }
}

const json& ExportRecordDecoder::Unwrap(const json& document) {
    if (document.is_array()) return document;

    if (document.is_object()) {
        for (const char* key : {"conversations", "data"}) {
            auto it = document.find(key);
            if (it != document.end() && it->is_array()) return *it;
        }
        for (const auto& item : document.items()) {
            const json& value = item.value();
            if (!value.is_array() || value.empty() || !value.front().is_object()) continue;
            const json& first = value.front();
            if (first.contains("id") || first.contains("conversation_id") || first.contains("mapping")) {
                return value;
            }
        }
    }

    throw std::invalid_argument("Invalid data format. Expected a list of conversations.");
}

ConversationRecord ExportRecordDecoder::DecodeRecord(const json& entry, size_t index) {
    if (!entry.is_object()) {
        throw std::invalid_argument("Entry " + std::to_string(index) + " is not an object");
    }

    ConversationRecord record;
    record.sourceIndex = index;
    record.id = ConversationId(entry, index);
    record.title = OptionalString(entry, "title");
    record.createTime = OptionalEpoch(entry, "create_time");
    record.updateTime = OptionalEpoch(entry, "update_time");
    record.model = NonEmpty(OptionalString(entry, "default_model_slug"));
    record.currentNode = NonEmpty(OptionalString(entry, "current_node"));
    record.project = DecodeProject(entry);

    auto mapping = entry.find("mapping");
    if (mapping != entry.end() && mapping->is_object() && !mapping->empty()) {
        for (const auto& item : mapping->items()) {
            MessageNode node = DecodeNode(item.key(), item.value());
            std::string nodeId = node.id;
            if (!record.nodes.insert(std::move(node))) {
                std::cerr << "[ExportRecordDecoder] Duplicate node id " << nodeId << " in conversation "
                          << record.id << "; keeping the first" << std::endl;
            }
        }
    } else if (mapping != entry.end() && !mapping->is_null() && !mapping->is_object()) {
        throw std::invalid_argument("Field 'mapping' must be an object");
    } else {
        auto messages = entry.find("messages");
        if (messages != entry.end() && messages->is_array()) {
            DecodeFlatMessages(*messages, record);
        }
    }

    return record;
}

DecodeResult ExportRecordDecoder::Decode(const json& document) {
    const json& entries = Unwrap(document);

    DecodeResult result;
    for (size_t i = 0; i < entries.size(); ++i) {
        const json& entry = entries[i];
        try {
            result.records.push_back(DecodeRecord(entry, i));
        } catch (const std::exception& e) {
            std::string id = "entry-" + std::to_string(i);
            if (entry.is_object()) {
                auto it = entry.find("id");
                if (it != entry.end() && it->is_string()) id = it->get<std::string>();
            }
            std::cerr << "[ExportRecordDecoder] Entry " << i << " (" << id << ") not decodable: "
                      << e.what() << std::endl;
            result.skipped.push_back(SkippedConversation{id, std::string("Undecodable record: ") + e.what(), i});
        }
    }
    return result;
}

} // namespace threadwalker::infrastructure
