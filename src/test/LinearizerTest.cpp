#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "domain/GraphErrors.hpp"
#include "domain/GraphParser.hpp"
#include "domain/Linearizer.hpp"

using namespace threadwalker::domain;

static MessageNode MakeNode(const std::string& id, std::optional<std::string> parent,
                            std::vector<std::string> children, Role role, const std::string& text) {
    MessageNode node;
    node.id = id;
    node.parentId = std::move(parent);
    node.childrenIds = std::move(children);
    node.hasMessage = true;
    node.role = role;
    node.contentParts.push_back(text);
    return node;
}

static MessageNode MakePlaceholder(const std::string& id, std::vector<std::string> children) {
    MessageNode node;
    node.id = id;
    node.childrenIds = std::move(children);
    return node;
}

// R -> A (user) -> B (assistant fork point, blank) -> {C, D}
static NodeStore RegenerationStore() {
    NodeStore store;
    store.insert(MakePlaceholder("R", {"A"}));
    store.insert(MakeNode("A", "R", {"B"}, Role::User, "Explain fork handling"));
    store.insert(MakeNode("B", "A", {"C", "D"}, Role::Assistant, "   "));
    store.insert(MakeNode("C", "B", {}, Role::Assistant, "First answer"));
    store.insert(MakeNode("D", "B", {}, Role::Assistant, "Regenerated answer"));
    return store;
}

static void testFollowsCurrentNode() {
    std::cout << "[Test] Current node selects the branch..." << std::endl;
    ConversationGraph graph = GraphParser::Parse("regen", RegenerationStore(), std::string("D"));
    LinearThread thread = Linearizer::Linearize(graph);

    assert(thread.policy == LinearizationPolicy::CurrentNodePath);
    assert((thread.nodeIds == std::vector<std::string>{"A", "D"}));

    // Choosing the other sibling yields the other branch.
    ConversationGraph other = GraphParser::Parse("regen", RegenerationStore(), std::string("C"));
    assert((Linearizer::Linearize(other).nodeIds == std::vector<std::string>{"A", "C"}));
    std::cout << "[PASS] Current node selects the branch." << std::endl;
}

static void testMissingCurrentNodeFallsBack() {
    std::cout << "[Test] Missing current node falls back to last child..." << std::endl;
    ConversationGraph missing = GraphParser::Parse("regen", RegenerationStore(), std::nullopt);
    LinearThread thread = Linearizer::Linearize(missing);
    assert(thread.policy == LinearizationPolicy::LastChildFallback);
    assert((thread.nodeIds == std::vector<std::string>{"A", "D"}));

    ConversationGraph dangling = GraphParser::Parse("regen", RegenerationStore(), std::string("gone"));
    LinearThread fromDangling = Linearizer::Linearize(dangling);
    assert(fromDangling.policy == LinearizationPolicy::LastChildFallback);
    assert((fromDangling.nodeIds == std::vector<std::string>{"A", "D"}));
    assert(std::string(PolicyToString(fromDangling.policy)) == "last-child-fallback");
    std::cout << "[PASS] Missing current node falls back to last child." << std::endl;
}

static void testSelectPathKeepsStructuralNodes() {
    std::cout << "[Test] SelectPath returns the full root-to-leaf path..." << std::endl;
    ConversationGraph graph = GraphParser::Parse("regen", RegenerationStore(), std::string("C"));

    auto current = Linearizer::SelectPath(graph, LinearizationPolicy::CurrentNodePath);
    assert((current == std::vector<std::string>{"R", "A", "B", "C"}));
    auto fallback = Linearizer::SelectPath(graph, LinearizationPolicy::LastChildFallback);
    assert((fallback == std::vector<std::string>{"R", "A", "B", "D"}));

    // Path validity: each id is the parent of the next.
    for (size_t i = 1; i < current.size(); ++i) {
        assert(graph.node(current[i]).parentId == current[i - 1]);
    }

    ConversationGraph noCurrent = GraphParser::Parse("regen", RegenerationStore(), std::nullopt);
    bool thrown = false;
    try {
        Linearizer::SelectPath(noCurrent, LinearizationPolicy::CurrentNodePath);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] SelectPath returns the full root-to-leaf path." << std::endl;
}

static void testCurrentNodeInsideCycle() {
    std::cout << "[Test] Current node on a cycle..." << std::endl;
    NodeStore store;
    store.insert(MakePlaceholder("R", {"A"}));
    store.insert(MakeNode("A", "R", {}, Role::User, "hi"));
    store.insert(MakeNode("X", "Y", {"Y"}, Role::User, "x"));
    store.insert(MakeNode("Y", "X", {"X"}, Role::Assistant, "y"));

    ConversationGraph graph = GraphParser::Parse("cyclic", store, std::string("Y"));
    bool thrown = false;
    try {
        Linearizer::Linearize(graph);
    } catch (const CyclicGraph& e) {
        thrown = true;
        assert(e.conversationId() == "cyclic");
    }
    assert(thrown);
    std::cout << "[PASS] Current node on a cycle." << std::endl;
}

static void testNoDuplicateNodes() {
    std::cout << "[Test] Thread never repeats a node..." << std::endl;
    NodeStore store;
    store.insert(MakePlaceholder("R", {"A"}));
    std::string parent = "A";
    store.insert(MakeNode("A", "R", {}, Role::User, "turn 0"));
    for (int i = 1; i < 20; ++i) {
        std::string id = "N" + std::to_string(i);
        store.insert(MakeNode(id, parent, {}, i % 2 ? Role::Assistant : Role::User, "turn " + std::to_string(i)));
        parent = id;
    }

    ConversationGraph graph = GraphParser::Parse("long", store, parent);
    LinearThread thread = Linearizer::Linearize(graph);
    assert(thread.nodeIds.size() == 20);
    std::set<std::string> unique(thread.nodeIds.begin(), thread.nodeIds.end());
    assert(unique.size() == thread.nodeIds.size());
    std::cout << "[PASS] Thread never repeats a node." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Linearizer Test..." << std::endl;
    testFollowsCurrentNode();
    testMissingCurrentNodeFallsBack();
    testSelectPathKeepsStructuralNodes();
    testCurrentNodeInsideCycle();
    testNoDuplicateNodes();
    std::cout << "[PASS] Linearizer Test." << std::endl;
    return 0;
}
