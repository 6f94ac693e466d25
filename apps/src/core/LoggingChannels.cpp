#include "LoggingChannels.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace FlapEvo {

namespace {
constexpr const char* kLogFile = "flapevo.log";
constexpr const char* kChannelNames[] = { "brain", "config", "evolution", "storage" };

std::string patternFor(const std::string& componentName)
{
    return componentName == "default"
        ? "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] [%s:%#] %v";
}

std::string defaultPatternFor(const std::string& componentName)
{
    return componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";
}
} // namespace

// Static member initialization.
bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    spdlog::sink_ptr console_sink;
    if (consoleToStderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };

    const std::string pattern = patternFor(componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createLogger("brain", sharedSinks_, spdlog::level::info);
    createLogger("config", sharedSinks_, spdlog::level::info);
    createLogger("evolution", sharedSinks_, spdlog::level::info);
    createLogger("storage", sharedSinks_, spdlog::level::info);

    // Separate sinks for the default logger so its pattern doesn't affect channel loggers.
    spdlog::sink_ptr default_console_sink;
    if (consoleToStderr) {
        default_console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        default_console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    default_console_sink->set_level(consoleLevel);
    auto default_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
    default_file_sink->set_level(fileLevel);

    const std::string defaultPattern = defaultPatternFor(componentName);
    default_console_sink->set_pattern(defaultPattern);
    default_file_sink->set_pattern(defaultPattern);

    std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { default_console_sink, default_file_sink };
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);

    spdlog::set_default_logger(default_logger);
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    // Parse format: "channel:level,channel2:level2"
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);

        channel.erase(0, channel.find_first_not_of(" \t"));
        channel.erase(channel.find_last_not_of(" \t") + 1);
        levelStr.erase(0, levelStr.find_first_not_of(" \t"));
        levelStr.erase(levelStr.find_last_not_of(" \t") + 1);

        auto level = parseLevelString(levelStr);

        if (channel == "*") {
            for (const char* name : kChannelNames) {
                setChannelLevel(name, level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}', ignoring", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    auto config = loadConfigFile(configPath);
    applyConfig(config, componentName);

    initialized_ = true;
    return true;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v" },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" }, { "stderr", true } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "brain", "info" },
            { "config", "info" },
            { "evolution", "info" },
            { "storage", "info" } } }
    };
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::debug("Logging config {} not found, using built-in defaults", configPath);
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open logging config {}, using built-in defaults", pathToUse);
            return defaultConfig();
        }

        nlohmann::json config = nlohmann::json::parse(configFile);
        spdlog::debug("Loaded logging config from {}", pathToUse);
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error(
            "Failed to parse logging config {}: {}, using built-in defaults", pathToUse, e.what());
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = patternFor(componentName);
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            auto& defaults = config["defaults"];
            if (defaults.contains("console_level")) {
                consoleLevel = parseLevelString(defaults["console_level"].get<std::string>());
            }
            if (defaults.contains("file_level")) {
                fileLevel = parseLevelString(defaults["file_level"].get<std::string>());
            }
            if (defaults.contains("pattern")) {
                std::string configPattern = defaults["pattern"].get<std::string>();
                // Inject component name after the timestamp if not default.
                if (componentName != "default") {
                    size_t pos = configPattern.find("] ");
                    if (pos != std::string::npos) {
                        pattern = configPattern.substr(0, pos + 2) + "[" + componentName + "] "
                            + configPattern.substr(pos + 2);
                    }
                    else {
                        pattern = "[" + componentName + "] " + configPattern;
                    }
                }
                else {
                    pattern = configPattern;
                }
            }
            if (defaults.contains("flush_interval_ms")) {
                flushIntervalMs = defaults["flush_interval_ms"].get<int>();
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }

    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.contains("sinks")) {
            auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    spdlog::sink_ptr console_sink;
                    if (consoleCfg.value("stderr", false)) {
                        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                    }
                    else {
                        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                    }
                    console_sink->set_level(
                        parseLevelString(consoleCfg.value("level", std::string("info"))));
                    sinks.push_back(console_sink);
                }
            }

            if (sinksConfig.contains("file")) {
                auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    std::string path = fileCfg.value("path", std::string(kLogFile));
                    auto level = parseLevelString(fileCfg.value("level", std::string("debug")));

                    // Use rotating sink if max_size_mb is specified, otherwise basic sink.
                    std::shared_ptr<spdlog::sinks::sink> file_sink;
                    if (fileCfg.contains("max_size_mb")) {
                        size_t maxSizeMB = fileCfg.value("max_size_mb", 100);
                        size_t maxFiles = fileCfg.value("max_files", 3);
                        file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                            path, maxSizeMB * 1024 * 1024, maxFiles);
                    }
                    else {
                        bool truncate = fileCfg.value("truncate", true);
                        file_sink =
                            std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, truncate);
                    }

                    file_sink->set_level(level);
                    sinks.push_back(file_sink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(consoleLevel);
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
        file_sink->set_level(fileLevel);
        sinks = { console_sink, file_sink };
    }

    sharedSinks_ = sinks;

    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    for (const char* name : kChannelNames) {
        createLogger(name, sharedSinks_, spdlog::level::info);
    }

    try {
        if (config.contains("channels")) {
            for (auto& [channel, levelStr] : config["channels"].items()) {
                auto logger = spdlog::get(channel);
                if (!logger) {
                    spdlog::warn("Unknown log channel '{}' in config, ignoring", channel);
                    continue;
                }
                logger->set_level(parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    // The default logger shares the sinks but omits the channel name.
    std::string loggerName = componentName.empty() ? "default" : componentName;
    auto default_logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
}

} // namespace FlapEvo
