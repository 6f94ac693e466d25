#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace FlapEvo {

/**
 * @brief Loads JSON configuration files with multi-path search and .local override support.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/flapevo/ (user overrides)
 * 4. /etc/flapevo/ (system defaults)
 *
 * At each location, checks for .local version first (e.g., evolution.json.local),
 * then falls back to base file. The .local file is a complete replacement, not a merge.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    template <typename T>
    static Result<T, std::string> loadFromPath(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(const nlohmann::json& json, const std::string& source);
};

template <typename T>
Result<T, std::string> ConfigLoader::parse(const nlohmann::json& json, const std::string& source)
{
    try {
        T config;
        // Unqualified call so ADL finds the type's from_json.
        from_json(json, config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + source + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return parse<T>(jsonResult.value(), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFromPath(const std::filesystem::path& path)
{
    auto jsonResult = tryLoadJson(path);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return parse<T>(jsonResult.value(), path.string());
}

} // namespace FlapEvo
