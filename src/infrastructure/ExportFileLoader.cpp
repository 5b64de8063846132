#include "infrastructure/ExportFileLoader.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace threadwalker::infrastructure {

namespace fs = std::filesystem;

fs::path ExportFileLoader::ResolveConversationsFile(const fs::path& exportPath) {
    if (fs::is_directory(exportPath)) {
        return exportPath / "conversations.json";
    }
    return exportPath;
}

nlohmann::json ExportFileLoader::Load(const fs::path& exportPath) {
    fs::path file = ResolveConversationsFile(exportPath);
    if (!fs::exists(file)) {
        throw std::runtime_error("conversations.json not found in " + exportPath.string());
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + file.string());
    }

    try {
        nlohmann::json document;
        in >> document;
        std::cerr << "[ExportFileLoader] Loaded " << file << std::endl;
        return document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + file.string() + ": " + e.what());
    }
}

} // namespace threadwalker::infrastructure
