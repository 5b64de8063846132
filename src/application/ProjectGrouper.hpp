/**
 * @file ProjectGrouper.hpp
 * @brief Partitions conversations into project buckets.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "domain/Conversation.hpp"

namespace threadwalker::application {

/**
 * @struct ProjectBucket
 * @brief A project and its member conversations in display order.
 */
struct ProjectBucket {
    domain::Project project;
    std::vector<const domain::Conversation*> conversations; ///< Most recently updated first.
    bool unassigned = false; ///< True only for the synthetic "_Unassigned_" bucket.
};

class ProjectGrouper {
public:
    /**
     * @brief Buckets conversations by project id.
     *
     * Conversations without a project id go to the "_Unassigned_" bucket, which
     * is always present. Every input conversation lands in exactly one bucket.
     * The returned pointers refer into the input vector.
     *
     * A real project whose id is literally "_Unassigned_" keeps that id in
     * `project.id` but is keyed "_Unassigned_-2" (or the next free suffix).
     *
     * @return Buckets keyed by project id.
     */
    static std::map<std::string, ProjectBucket> Group(const std::vector<domain::Conversation>& conversations);

    /**
     * @brief Same partition keyed by project name.
     *
     * Unique names are claimed first. Distinct projects sharing a name are
     * told apart as "name (id)", with "-2", "-3"... appended while that key
     * is already taken, so no bucket is ever lost.
     */
    static std::map<std::string, ProjectBucket> GroupByName(const std::vector<domain::Conversation>& conversations);
};

} // namespace threadwalker::application
