/**
 * @file MarkdownBundle.hpp
 * @brief Lays out the markdown export bundle: one file per conversation, one folder per project.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Conversation.hpp"

namespace threadwalker::application {

/**
 * @struct BundleFile
 * @brief One planned file of the bundle.
 */
struct BundleFile {
    std::string relativePath; ///< "{Project|_Unassigned_}/{slug}.md"
    std::string content;      ///< Rendered markdown.
    std::string conversationId;
};

class MarkdownBundle {
public:
    /**
     * @brief Plans the bundle for a conversation set.
     *
     * Folder and file names are unique within their parent (compared after
     * SearchIndex::Fold); later claimants get "-2", "-3", ... appended. Folders are
     * assigned in project-id order, files in each project's display order.
     */
    static std::vector<BundleFile> Plan(const std::vector<domain::Conversation>& conversations,
                                        size_t maxNameLength = 80);

    /**
     * @brief Makes a name safe as a single path component.
     *
     * Replaces <>:"/\|?* and control characters with '_', cuts to maxLength
     * bytes on a UTF-8 boundary and trims. Blank, "." and ".." become "untitled".
     */
    static std::string Slugify(const std::string& name, size_t maxLength = 80);
};

} // namespace threadwalker::application
