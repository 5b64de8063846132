// ExportFileLoader Header
#pragma once
#include <filesystem>
#include <nlohmann/json.hpp>

namespace threadwalker::infrastructure {

class ExportFileLoader {
public:
    /**
     * @brief Resolves the conversations file of an export.
     * A directory resolves to its conversations.json; a file path is used as is.
     */
    static std::filesystem::path ResolveConversationsFile(const std::filesystem::path& exportPath);

    /**
     * @brief Reads and parses the export's conversations file.
     * @throws std::runtime_error if the file is missing, unreadable or not valid JSON.
     */
    static nlohmann::json Load(const std::filesystem::path& exportPath);
};

} // namespace threadwalker::infrastructure
