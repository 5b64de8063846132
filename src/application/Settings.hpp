/**
 * @file Settings.hpp
 * @brief Tunables shared by the application services.
 */

#pragma once

#include <cstddef>

namespace threadwalker::application {

/**
 * @struct Settings
 * @brief Values read from settings.json; defaults apply to anything not configured.
 */
struct Settings {
    size_t titleMaxLength = 50;     ///< Bytes kept when deriving a title from the first user message.
    size_t previewMaxLength = 200;  ///< Bytes kept in search previews.
    size_t filenameMaxLength = 80;  ///< Bytes kept in bundle file and folder names.
    size_t parseWorkers = 0;        ///< 0 means hardware concurrency.
};

} // namespace threadwalker::application
