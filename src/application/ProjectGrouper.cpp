#include "application/ProjectGrouper.hpp"
#include <algorithm>
#include <functional>
#include <set>

namespace threadwalker::application {

using namespace threadwalker::domain;

namespace {

// First of base, base-2, base-3... that is not taken.
std::string FreeKey(const std::string& base, const std::function<bool(const std::string&)>& taken) {
    std::string key = base;
    for (int n = 2; taken(key); ++n) {
        key = base + "-" + std::to_string(n);
    }
    return key;
}

} // namespace

std::map<std::string, ProjectBucket> ProjectGrouper::Group(const std::vector<Conversation>& conversations) {
    std::map<std::string, ProjectBucket> buckets;

    ProjectBucket& unassigned = buckets[kUnassignedProjectId];
    unassigned.project.id = kUnassignedProjectId;
    unassigned.project.name = kUnassignedProjectId;
    unassigned.unassigned = true;

    // A real project id equal to the reserved one gets its own key.
    std::set<std::string> realIds;
    for (const auto& conv : conversations) {
        if (conv.getMetadata().projectId) realIds.insert(*conv.getMetadata().projectId);
    }
    std::string reservedIdKey;
    if (realIds.count(kUnassignedProjectId)) {
        reservedIdKey = FreeKey(kUnassignedProjectId, [&](const std::string& key) {
            return key == kUnassignedProjectId || realIds.count(key) > 0;
        });
    }

    for (const auto& conv : conversations) {
        const auto& meta = conv.getMetadata();
        std::string key = kUnassignedProjectId;
        if (meta.projectId) {
            key = *meta.projectId == kUnassignedProjectId ? reservedIdKey : *meta.projectId;
        }

        ProjectBucket& bucket = buckets[key];
        if (bucket.project.id.empty() && meta.projectId) {
            bucket.project.id = *meta.projectId;
        }
        if (bucket.project.name.empty() && meta.projectName && !meta.projectName->empty()) {
            bucket.project.name = *meta.projectName;
        }
        bucket.conversations.push_back(&conv);
    }

    for (auto& [key, bucket] : buckets) {
        if (bucket.project.name.empty()) {
            bucket.project.name = bucket.project.id;
        }
        std::stable_sort(bucket.conversations.begin(), bucket.conversations.end(),
                         [](const Conversation* a, const Conversation* b) { return MoreRecentFirst(*a, *b); });
        bucket.project.conversationIds.clear();
        for (const auto* conv : bucket.conversations) {
            bucket.project.conversationIds.push_back(conv->getId());
        }
    }

    return buckets;
}

std::map<std::string, ProjectBucket> ProjectGrouper::GroupByName(const std::vector<Conversation>& conversations) {
    auto byId = Group(conversations);

    std::map<std::string, int> nameUse;
    for (const auto& [key, bucket] : byId) {
        nameUse[bucket.project.name]++;
    }

    std::map<std::string, ProjectBucket> byName;
    std::vector<ProjectBucket*> shared;
    for (auto& [key, bucket] : byId) {
        if (bucket.unassigned) {
            byName.emplace(kUnassignedProjectId, std::move(bucket));
        } else if (nameUse[bucket.project.name] == 1) {
            std::string name = bucket.project.name;
            byName.emplace(name, std::move(bucket));
        } else {
            shared.push_back(&bucket);
        }
    }

    for (ProjectBucket* bucket : shared) {
        std::string key = FreeKey(bucket->project.name + " (" + bucket->project.id + ")",
                                  [&](const std::string& candidate) { return byName.count(candidate) > 0; });
        byName.emplace(key, std::move(*bucket));
    }
    return byName;
}

} // namespace threadwalker::application
