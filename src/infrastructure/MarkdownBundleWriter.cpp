/**
 * @file MarkdownBundleWriter.cpp
 * @brief Implementation of MarkdownBundleWriter.
 */

#include "infrastructure/MarkdownBundleWriter.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>

namespace threadwalker::infrastructure {

namespace fs = std::filesystem;

bool MarkdownBundleWriter::WriteAtomic(const fs::path& target, const std::string& content) {
    // Unique temp path: <file>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[MarkdownBundleWriter] Error creating directories for " << target << ": "
                      << ec.message() << std::endl;
            return false;
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[MarkdownBundleWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[MarkdownBundleWriter] Write failed: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic Rename
    fs::rename(tempPath, target, ec);
    if (ec) {
        std::cerr << "[MarkdownBundleWriter] Rename failed for " << target << ": " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

size_t MarkdownBundleWriter::Write(const fs::path& root, const std::vector<application::BundleFile>& files) {
    size_t written = 0;
    for (const auto& file : files) {
        if (WriteAtomic(root / fs::path(file.relativePath), file.content)) {
            ++written;
        }
    }
    if (written != files.size()) {
        std::cerr << "[MarkdownBundleWriter] Wrote " << written << " of " << files.size()
                  << " file(s) under " << root << std::endl;
    }
    return written;
}

} // namespace threadwalker::infrastructure
