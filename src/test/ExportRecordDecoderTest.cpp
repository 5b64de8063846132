#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "infrastructure/ExportFileLoader.hpp"
#include "infrastructure/ExportRecordDecoder.hpp"

using json = nlohmann::json;
using namespace threadwalker::domain;
using threadwalker::infrastructure::ExportFileLoader;
using threadwalker::infrastructure::ExportRecordDecoder;

namespace fs = std::filesystem;

static const char* kExport = R"([
  {
    "id": "conv-a",
    "title": "Regex help",
    "create_time": 1704153600.5,
    "update_time": 1704465000,
    "default_model_slug": "gpt-4",
    "current_node": "n2",
    "folder_id": "0123456789abcdef",
    "mapping": {
      "root": {"id": "root", "message": null, "parent": null, "children": ["n1"]},
      "n1": {
        "id": "n1", "parent": "root", "children": ["n2"],
        "message": {
          "author": {"role": "user"},
          "content": {"content_type": "text", "parts": ["Match digits", {"text": "only"}, {"asset_pointer": "file-1"}]},
          "create_time": 1704153601
        }
      },
      "n2": {
        "id": "n2", "parent": "n1", "children": [],
        "message": {
          "author": {"role": "assistant"},
          "content": {"content_type": "text", "parts": ["Use \\d+"]},
          "create_time": "not a number",
          "recipient": "all",
          "metadata": {"model_slug": "gpt-4", "is_visually_hidden_from_conversation": false}
        }
      }
    }
  },
  {
    "conversation_id": "conv-b",
    "gizmo_id": "g-abcdefghijk",
    "mapping": {
      "r": {"parent": null, "children": ["h"]},
      "h": {
        "parent": "r", "children": [],
        "message": {
          "author": {"role": "system"},
          "content": {"content_type": "text", "parts": ["ctx"]},
          "recipient": "browser",
          "metadata": {"is_visually_hidden_from_conversation": true}
        }
      }
    }
  },
  "not an object",
  {
    "id": "conv-bad",
    "mapping": {"x": {"parent": 42}}
  },
  {
    "title": "Flat export",
    "conversation_template_id": "tmpl-1",
    "messages": [
      {"role": "user", "content": "hello", "create_time": 10},
      {"role": "assistant", "content": {"parts": ["hi there"]}, "model": "gpt-3.5"}
    ]
  }
])";

static void testDecodesMappingRecord() {
    std::cout << "[Test] Mapping record..." << std::endl;
    auto result = ExportRecordDecoder::Decode(json::parse(kExport));
    assert(result.records.size() == 3);

    const ConversationRecord& a = result.records[0];
    assert(a.id == "conv-a");
    assert(a.sourceIndex == 0);
    assert(a.title && *a.title == "Regex help");
    assert(a.createTime && *a.createTime == 1704153600.5);
    assert(a.updateTime && *a.updateTime == 1704465000.0);
    assert(a.model && *a.model == "gpt-4");
    assert(a.currentNode && *a.currentNode == "n2");
    assert(a.project && a.project->id == "0123456789abcdef");
    assert(a.project->name == "Project 01234567");
    assert(a.nodes.size() == 3);

    const MessageNode* root = a.nodes.find("root");
    assert(root && !root->hasMessage && !root->parentId);

    const MessageNode* n1 = a.nodes.find("n1");
    assert(n1->role == Role::User);
    assert((n1->contentParts == std::vector<std::string>{"Match digits", "only"}));
    assert(n1->createTime && *n1->createTime == 1704153601.0);

    const MessageNode* n2 = a.nodes.find("n2");
    assert(n2->role == Role::Assistant);
    assert(!n2->createTime); // Wrong type is dropped.
    assert(n2->modelSlug && *n2->modelSlug == "gpt-4");
    assert(!n2->hidden);
    std::cout << "[PASS] Mapping record." << std::endl;
}

static void testFallbackIdsAndProjects() {
    std::cout << "[Test] Fallback ids and project sources..." << std::endl;
    auto result = ExportRecordDecoder::Decode(json::parse(kExport));

    const ConversationRecord& b = result.records[1];
    assert(b.id == "conv-b");
    assert(b.sourceIndex == 1);
    assert(!b.title);
    assert(b.project && b.project->name == "GPT g-abcdef");
    // Node ids fall back to mapping keys.
    const MessageNode* h = b.nodes.find("h");
    assert(h && h->parentId && *h->parentId == "r");
    assert(h->hidden);
    assert(h->recipient == "browser");
    assert(h->role == Role::System);

    const ConversationRecord& flat = result.records[2];
    assert(flat.id == "conv-4");
    assert(flat.sourceIndex == 4);
    assert(flat.project && flat.project->id == "tmpl-1" && flat.project->name == "Custom GPT");
    std::cout << "[PASS] Fallback ids and project sources." << std::endl;
}

static void testFlatMessagesBecomeChain() {
    std::cout << "[Test] Flat message list..." << std::endl;
    auto result = ExportRecordDecoder::Decode(json::parse(kExport));
    const ConversationRecord& flat = result.records[2];

    assert(flat.nodes.size() == 3);
    const std::string& rootId = flat.nodes.ids()[0];
    assert(rootId == "conv-4-root");
    assert(!flat.nodes.find(rootId)->hasMessage);

    const MessageNode* first = flat.nodes.find(flat.nodes.ids()[1]);
    const MessageNode* second = flat.nodes.find(flat.nodes.ids()[2]);
    assert(first->parentId && *first->parentId == rootId);
    assert(second->parentId && *second->parentId == first->id);
    assert((first->contentParts == std::vector<std::string>{"hello"}));
    assert((second->contentParts == std::vector<std::string>{"hi there"}));
    assert(second->modelSlug && *second->modelSlug == "gpt-3.5");
    assert(flat.currentNode && *flat.currentNode == second->id);
    std::cout << "[PASS] Flat message list." << std::endl;
}

static void testBadEntriesAreReported() {
    std::cout << "[Test] Undecodable entries..." << std::endl;
    auto result = ExportRecordDecoder::Decode(json::parse(kExport));
    assert(result.skipped.size() == 2);
    assert(result.skipped[0].conversationId == "entry-2");
    assert(result.skipped[0].sourceIndex == 2);
    assert(result.skipped[1].conversationId == "conv-bad");
    assert(result.skipped[1].reason.find("Undecodable record") == 0);
    std::cout << "[PASS] Undecodable entries." << std::endl;
}

static void testEnvelopes() {
    std::cout << "[Test] Document envelopes..." << std::endl;
    json list = json::array({json{{"id", "x"}, {"mapping", json::object()}}});

    assert(ExportRecordDecoder::Unwrap(list).size() == 1);
    assert(ExportRecordDecoder::Unwrap(json{{"conversations", list}}).size() == 1);
    assert(ExportRecordDecoder::Unwrap(json{{"data", list}}).size() == 1);
    assert(ExportRecordDecoder::Unwrap(json{{"meta", 1}, {"items", list}}).size() == 1);

    for (const json& bad : {json("text"), json{{"items", json::array({1, 2})}}, json::object()}) {
        bool thrown = false;
        try {
            ExportRecordDecoder::Unwrap(bad);
        } catch (const std::invalid_argument& e) {
            thrown = true;
            assert(std::string(e.what()) == "Invalid data format. Expected a list of conversations.");
        }
        assert(thrown);
    }
    std::cout << "[PASS] Document envelopes." << std::endl;
}

static void testFileLoader() {
    std::cout << "[Test] Export file loading..." << std::endl;
    fs::path dir = fs::temp_directory_path() / "threadwalker_loader_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    bool missing = false;
    try {
        ExportFileLoader::Load(dir);
    } catch (const std::runtime_error& e) {
        missing = std::string(e.what()).find("conversations.json not found") == 0;
    }
    assert(missing);

    {
        std::ofstream out(dir / "conversations.json");
        out << "[{\"id\": \"x\"";
    }
    bool invalid = false;
    try {
        ExportFileLoader::Load(dir);
    } catch (const std::runtime_error& e) {
        invalid = std::string(e.what()).find("Invalid JSON") == 0;
    }
    assert(invalid);

    {
        std::ofstream out(dir / "conversations.json", std::ios::trunc);
        out << kExport;
    }
    assert(ExportFileLoader::ResolveConversationsFile(dir) == dir / "conversations.json");
    assert(ExportFileLoader::Load(dir).size() == 5);
    assert(ExportFileLoader::Load(dir / "conversations.json").is_array());

    fs::remove_all(dir);
    std::cout << "[PASS] Export file loading." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ExportRecordDecoder Test..." << std::endl;
    testDecodesMappingRecord();
    testFallbackIdsAndProjects();
    testFlatMessagesBecomeChain();
    testBadEntriesAreReported();
    testEnvelopes();
    testFileLoader();
    std::cout << "[PASS] ExportRecordDecoder Test." << std::endl;
    return 0;
}
