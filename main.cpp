#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "application/ArchiveSession.hpp"
#include "application/MarkdownRenderer.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ExportFileLoader.hpp"
#include "infrastructure/MarkdownBundleWriter.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace threadwalker;

// === COMMAND LINE ===
struct CliOptions {
    std::string exportPath;
    bool exportBundle = false;
    std::optional<std::string> bundleDir;
    std::optional<std::string> searchQuery;
    std::optional<std::string> showId;
    std::optional<std::string> configPath;
};

static void PrintUsage() {
    std::cout << "Usage: threadwalker <path_to_chatgpt_export>\n"
              << "       threadwalker <path_to_chatgpt_export> --export [output_dir]\n"
              << "       threadwalker <path_to_chatgpt_export> --search <query>\n"
              << "       threadwalker <path_to_chatgpt_export> --show <conversation_id>\n"
              << "Options:\n"
              << "       --config <settings.json>   Override the settings file" << std::endl;
}

static std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    if (argc < 2) return std::nullopt;

    CliOptions opts;
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0;
        if (arg == "--export") {
            opts.exportBundle = true;
            if (hasValue) opts.bundleDir = args[++i];
        } else if (arg == "--search" || arg == "--show" || arg == "--config") {
            if (!hasValue) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            std::string value = args[++i];
            if (arg == "--search") opts.searchQuery = value;
            else if (arg == "--show") opts.showId = value;
            else opts.configPath = value;
        } else if (opts.exportPath.empty() && arg.rfind("--", 0) != 0) {
            opts.exportPath = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (opts.exportPath.empty()) return std::nullopt;
    return opts;
}

static void PrintStats(const application::ArchiveStats& stats) {
    std::cout << "\n📊 Statistics:\n"
              << "   Total Conversations: " << stats.totalConversations << "\n"
              << "   Total Projects: " << stats.totalProjects << "\n"
              << "   Unassigned Conversations: " << stats.unassignedConversations << "\n"
              << "   Total Messages: " << stats.totalMessages << "\n"
              << "   Total Words: " << stats.totalWords << "\n"
              << "   Skipped: " << stats.skippedCount << std::endl;

    if (!stats.modelsUsed.empty()) {
        std::vector<std::pair<std::string, size_t>> models(stats.modelsUsed.begin(), stats.modelsUsed.end());
        std::stable_sort(models.begin(), models.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        std::cout << "\n🤖 Models Used:" << std::endl;
        for (const auto& [model, count] : models) {
            std::cout << "   " << model << ": " << count << std::endl;
        }
    }
}

int main(int argc, char** argv) {
    auto opts = ParseArgs(argc, argv);
    if (!opts) {
        PrintUsage();
        return 1;
    }

    fs::path configPath = opts->configPath ? fs::path(*opts->configPath)
                                           : infrastructure::PathUtils::GetSettingsPath();
    application::ArchiveSession session(infrastructure::ConfigLoader::Load(configPath));

    std::cout << "📂 Parsing ChatGPT export from: " << opts->exportPath << std::endl;
    try {
        auto document = infrastructure::ExportFileLoader::Load(opts->exportPath);
        PrintStats(session.loadDocument(document));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    for (const auto& skip : session.skipped()) {
        std::cout << "   ⚠️  Skipped " << skip.conversationId << ": " << skip.reason << std::endl;
    }

    if (opts->searchQuery) {
        auto matches = session.search(*opts->searchQuery);
        std::cout << "\n🔎 " << matches.size() << " match(es) for \"" << *opts->searchQuery << "\":" << std::endl;
        for (const auto& conv : matches) {
            std::cout << "   [" << conv.getId() << "] " << conv.getTitle() << "\n      "
                      << application::MarkdownRenderer::Preview(conv, session.settings().previewMaxLength)
                      << std::endl;
        }
    }

    if (opts->showId) {
        auto markdown = session.renderMarkdown(*opts->showId);
        if (!markdown) {
            std::cerr << "Conversation not found: " << *opts->showId << std::endl;
            return 1;
        }
        std::cout << "\n" << *markdown;
    }

    if (opts->exportBundle) {
        fs::path outputDir = opts->bundleDir ? fs::path(*opts->bundleDir)
                                             : infrastructure::PathUtils::GetDefaultBundleDir(opts->exportPath);
        std::cout << "\n📝 Exporting to markdown: " << outputDir.string() << std::endl;
        auto files = session.planBundle();
        size_t written = infrastructure::MarkdownBundleWriter::Write(outputDir, files);
        if (written != files.size()) {
            std::cerr << "Export incomplete: " << written << " of " << files.size() << " file(s) written" << std::endl;
            return 1;
        }
        std::cout << "✅ Export complete!" << std::endl;
    }

    return 0;
}
