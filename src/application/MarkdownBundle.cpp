#include "application/MarkdownBundle.hpp"
#include "application/MarkdownRenderer.hpp"
#include "application/ProjectGrouper.hpp"
#include "application/SearchIndex.hpp"
#include "domain/ContentNormalizer.hpp"
#include <cstring>
#include <set>

namespace threadwalker::application {

using namespace threadwalker::domain;

namespace {
    // Reserves the first free "stem[-n]extension" in `used` and returns it.
    std::string ClaimName(std::set<std::string>& used, const std::string& stem, const std::string& extension) {
        std::string candidate = stem;
        for (int n = 2; !used.insert(SearchIndex::Fold(candidate + extension)).second; ++n) {
            candidate = stem + "-" + std::to_string(n);
        }
        return candidate + extension;
    }
}

std::string MarkdownBundle::Slugify(const std::string& name, size_t maxLength) {
    static const char* kInvalid = "<>:\"/\\|?*";

    std::string safe = name;
    for (auto& c : safe) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F || std::strchr(kInvalid, c) != nullptr) {
            c = '_';
        }
    }
    safe = ContentNormalizer::Trim(ContentNormalizer::TruncateUtf8(safe, maxLength));
    if (safe.empty() || safe == "." || safe == "..") {
        return "untitled";
    }
    return safe;
}

std::vector<BundleFile> MarkdownBundle::Plan(const std::vector<Conversation>& conversations, size_t maxNameLength) {
    std::vector<BundleFile> files;
    // The reserved folder never yields its name to a project.
    std::set<std::string> folders{SearchIndex::Fold(kUnassignedProjectId)};

    for (const auto& [key, bucket] : ProjectGrouper::Group(conversations)) {
        if (bucket.conversations.empty()) continue;

        std::string folder = kUnassignedProjectId;
        if (!bucket.unassigned) {
            folder = ClaimName(folders, Slugify(bucket.project.name, maxNameLength), "");
        }

        std::set<std::string> names;
        for (const auto* conv : bucket.conversations) {
            BundleFile file;
            file.relativePath = folder + "/" + ClaimName(names, Slugify(conv->getTitle(), maxNameLength), ".md");
            file.content = MarkdownRenderer::Render(*conv);
            file.conversationId = conv->getId();
            files.push_back(std::move(file));
        }
    }
    return files;
}

} // namespace threadwalker::application
