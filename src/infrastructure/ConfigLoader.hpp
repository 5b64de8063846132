/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application settings (settings.json).
 * 
 * Keeps JSON parsing of configuration in one place; services receive a plain
 * Settings value.
 */

#pragma once

#include <filesystem>
#include <string>
#include "application/Settings.hpp"

namespace threadwalker::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Defaults for a missing file or unreadable content; per-key defaults
     *         for keys that are absent, mistyped or not positive where a length is expected.
     */
    static application::Settings Load(const std::filesystem::path& configPath);

    /**
     * @brief Applies the keys of a settings JSON text on top of defaults.
     */
    static application::Settings FromJsonText(const std::string& text);
};

} // namespace threadwalker::infrastructure
