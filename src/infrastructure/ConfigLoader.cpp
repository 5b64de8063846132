/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace threadwalker::infrastructure {

namespace {
    void ReadLength(const nlohmann::json& j, const char* key, size_t& target, bool allowZero) {
        if (!j.contains(key)) return;
        const auto& value = j[key];
        if (!value.is_number_integer() || value.get<long long>() < 0 || (!allowZero && value.get<long long>() == 0)) {
            std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a "
                      << (allowZero ? "non-negative" : "positive") << " integer" << std::endl;
            return;
        }
        target = value.get<size_t>();
    }
}

application::Settings ConfigLoader::FromJsonText(const std::string& text) {
    application::Settings settings;

    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] settings.json must hold an object; using defaults" << std::endl;
            return settings;
        }

        ReadLength(j, "title_max_length", settings.titleMaxLength, false);
        ReadLength(j, "preview_max_length", settings.previewMaxLength, false);
        ReadLength(j, "filename_max_length", settings.filenameMaxLength, false);
        ReadLength(j, "parse_workers", settings.parseWorkers, true);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return application::Settings{};
    }

    return settings;
}

application::Settings ConfigLoader::Load(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        return application::Settings{};
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << "; using defaults" << std::endl;
        return application::Settings{};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return FromJsonText(buffer.str());
}

} // namespace threadwalker::infrastructure
