#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "application/ProjectGrouper.hpp"

using namespace threadwalker::domain;
using namespace threadwalker::application;

static Conversation MakeConversation(const std::string& id, const std::string& title,
                                     std::optional<double> updated,
                                     std::optional<std::string> projectId = std::nullopt,
                                     std::optional<std::string> projectName = std::nullopt) {
    Conversation::Metadata meta;
    meta.id = id;
    meta.title = title;
    meta.updatedAt = updated;
    meta.projectId = std::move(projectId);
    meta.projectName = std::move(projectName);
    return Conversation(meta, {Message(Role::User, "hi", updated, 0, id + "-u")});
}

static void testMostRecentFirstWithinProject() {
    std::cout << "[Test] Project members ordered by update time..." << std::endl;
    // 2024-01-02 and 2024-01-05 (UTC midnight)
    std::vector<Conversation> convs{
        MakeConversation("older", "Older", 1704153600.0, std::string("proj-1"), std::string("Research")),
        MakeConversation("newer", "Newer", 1704412800.0, std::string("proj-1"), std::string("Research")),
    };

    auto buckets = ProjectGrouper::Group(convs);
    const auto& bucket = buckets.at("proj-1");
    assert(bucket.project.name == "Research");
    assert(bucket.conversations.size() == 2);
    assert(bucket.conversations[0]->getId() == "newer");
    assert((bucket.project.conversationIds == std::vector<std::string>{"newer", "older"}));
    std::cout << "[PASS] Project members ordered by update time." << std::endl;
}

static void testUnassignedBucketAlwaysPresent() {
    std::cout << "[Test] Unassigned bucket..." << std::endl;
    auto none = ProjectGrouper::Group({});
    assert(none.size() == 1);
    assert(none.count(kUnassignedProjectId) == 1);
    assert(none.at(kUnassignedProjectId).conversations.empty());

    std::vector<Conversation> convs{
        MakeConversation("loose", "Loose", 5.0),
        MakeConversation("undated", "Undated", std::nullopt),
    };
    auto buckets = ProjectGrouper::Group(convs);
    const auto& unassigned = buckets.at(kUnassignedProjectId);
    assert(unassigned.conversations.size() == 2);
    assert(unassigned.conversations[0]->getId() == "loose");
    assert(unassigned.conversations[1]->getId() == "undated");
    std::cout << "[PASS] Unassigned bucket." << std::endl;
}

static void testEveryConversationInExactlyOneBucket() {
    std::cout << "[Test] Grouping completeness..." << std::endl;
    std::vector<Conversation> convs;
    for (int i = 0; i < 30; ++i) {
        std::optional<std::string> project;
        if (i % 3 != 0) project = "proj-" + std::to_string(i % 4);
        convs.push_back(MakeConversation("c" + std::to_string(i), "T", 100.0 + i, project));
    }

    auto buckets = ProjectGrouper::Group(convs);
    std::map<std::string, int> seen;
    for (const auto& [id, bucket] : buckets) {
        for (const auto* conv : bucket.conversations) {
            seen[conv->getId()]++;
            std::string expected = conv->getMetadata().projectId ? *conv->getMetadata().projectId
                                                                 : kUnassignedProjectId;
            assert(expected == id);
        }
        // A project without a name falls back to its id.
        assert(bucket.project.name == id);
    }
    assert(seen.size() == convs.size());
    for (const auto& [id, count] : seen) {
        assert(count == 1);
    }
    std::cout << "[PASS] Grouping completeness." << std::endl;
}

static void testGroupByNameDisambiguates() {
    std::cout << "[Test] Group by name..." << std::endl;
    std::vector<Conversation> convs{
        MakeConversation("a", "A", 1.0, std::string("p1"), std::string("Notes")),
        MakeConversation("b", "B", 2.0, std::string("p2"), std::string("Notes")),
        MakeConversation("c", "C", 3.0, std::string("p3"), std::string("Work")),
        MakeConversation("d", "D", 4.0),
    };

    auto byName = ProjectGrouper::GroupByName(convs);
    assert(byName.size() == 4);
    assert(byName.count("Notes (p1)") == 1);
    assert(byName.count("Notes (p2)") == 1);
    assert(byName.at("Work").conversations.size() == 1);
    assert(byName.at(kUnassignedProjectId).conversations[0]->getId() == "d");
    std::cout << "[PASS] Group by name." << std::endl;
}

static void testGroupByNameKeepsEveryBucket() {
    std::cout << "[Test] Group by name with a colliding disambiguated key..." << std::endl;
    // "Foo (b)" is a real name and also what project b would be called.
    std::vector<Conversation> convs{
        MakeConversation("x", "X", 1.0, std::string("a"), std::string("Foo")),
        MakeConversation("y", "Y", 2.0, std::string("b"), std::string("Foo")),
        MakeConversation("z", "Z", 3.0, std::string("c"), std::string("Foo (b)")),
    };

    auto byName = ProjectGrouper::GroupByName(convs);
    size_t grouped = 0;
    for (const auto& [name, bucket] : byName) {
        grouped += bucket.conversations.size();
    }
    assert(grouped == convs.size());
    assert(byName.size() == 4);
    assert(byName.at("Foo (b)").project.id == "c");
    assert(byName.at("Foo (a)").project.id == "a");
    assert(byName.at("Foo (b)-2").project.id == "b");
    assert(byName.at(kUnassignedProjectId).conversations.empty());
    std::cout << "[PASS] Group by name with a colliding disambiguated key." << std::endl;
}

static void testProjectIdMatchingReservedId() {
    std::cout << "[Test] Real project with the reserved id..." << std::endl;
    std::vector<Conversation> convs{
        MakeConversation("loose", "Loose", 1.0),
        MakeConversation("odd", "Odd", 2.0, std::string(kUnassignedProjectId), std::string("Odd project")),
        MakeConversation("next", "Next", 3.0, std::string("_Unassigned_-2"), std::string("Next project")),
    };

    auto buckets = ProjectGrouper::Group(convs);
    assert(buckets.size() == 4);

    const auto& synthetic = buckets.at(kUnassignedProjectId);
    assert(synthetic.unassigned);
    assert(synthetic.conversations.size() == 1);
    assert(synthetic.conversations[0]->getId() == "loose");

    // The real id stays on the project; the key skips ids already in use.
    const auto& real = buckets.at("_Unassigned_-3");
    assert(!real.unassigned);
    assert(real.project.id == kUnassignedProjectId);
    assert(real.project.name == "Odd project");
    assert((real.project.conversationIds == std::vector<std::string>{"odd"}));
    assert(buckets.at("_Unassigned_-2").project.name == "Next project");

    auto byName = ProjectGrouper::GroupByName(convs);
    assert(byName.at(kUnassignedProjectId).unassigned);
    assert(byName.at(kUnassignedProjectId).conversations.size() == 1);
    assert(byName.at("Odd project").conversations[0]->getId() == "odd");
    std::cout << "[PASS] Real project with the reserved id." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ProjectGrouper Test..." << std::endl;
    testMostRecentFirstWithinProject();
    testUnassignedBucketAlwaysPresent();
    testEveryConversationInExactlyOneBucket();
    testGroupByNameDisambiguates();
    testGroupByNameKeepsEveryBucket();
    testProjectIdMatchingReservedId();
    std::cout << "[PASS] ProjectGrouper Test." << std::endl;
    return 0;
}
