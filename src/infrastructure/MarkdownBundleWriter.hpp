/**
 * @file MarkdownBundleWriter.hpp
 * @brief Writes a planned markdown bundle to disk.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "application/MarkdownBundle.hpp"

namespace threadwalker::infrastructure {

/**
 * @class MarkdownBundleWriter
 * @brief Writes bundle files under a root directory, each one atomically.
 *
 * Every file is written to a temporary sibling and renamed into place, so a
 * reader never sees a half-written transcript. A failing file is logged and
 * does not stop the others.
 */
class MarkdownBundleWriter {
public:
    /**
     * @brief Writes all files, creating folders as needed.
     * @param root Bundle root directory.
     * @param files Output of MarkdownBundle::Plan.
     * @return Number of files written.
     */
    static size_t Write(const std::filesystem::path& root, const std::vector<application::BundleFile>& files);

    /**
     * @brief Atomic write of one file (temp -> rename).
     * @return False on any failure; the temp file is removed.
     */
    static bool WriteAtomic(const std::filesystem::path& target, const std::string& content);
};

} // namespace threadwalker::infrastructure
