#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace soksak {
namespace utils {

namespace {

const char* const kConfigEnvVar = "SOKSAK_BRIDGE_CONFIG";
const char* const kLogLevelEnvVar = "SOKSAK_LOG_LEVEL";

std::string readEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

Config::Config()
    : modelCacheDir_(defaultModelCacheDir()) {
}

std::string Config::defaultModelCacheDir() {
    std::string xdg = readEnv("XDG_CACHE_HOME");
    if (!xdg.empty()) {
        return (std::filesystem::path(xdg) / "soksak" / "models").string();
    }
    std::string home = readEnv("HOME");
    if (!home.empty()) {
        return (std::filesystem::path(home) / ".cache" / "soksak" / "models").string();
    }
    return (std::filesystem::temp_directory_path() / "soksak" / "models").string();
}

Config Config::load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        Logger::info("Configuration file not found: " + configPath + ", using defaults");
        return Config();
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string jsonStr = buffer.str();
    if (jsonStr.empty()) {
        Logger::info("Empty configuration file, using defaults");
        return Config();
    }

    Config config = fromJson(jsonStr, configPath);
    Logger::info("Bridge configuration loaded from: " + configPath);
    return config;
}

Config Config::fromJson(const std::string& jsonStr, const std::string& origin) {
    Config config;
    try {
        nlohmann::json j = nlohmann::json::parse(jsonStr);
        if (!j.is_object()) {
            throw ConfigurationException("Configuration root must be a JSON object", origin);
        }

        config.logLevel_ = j.value("logLevel", config.logLevel_);
        config.workerThreads_ = j.value("workerThreads", config.workerThreads_);
        config.defaultModelName_ = j.value("defaultModelName", config.defaultModelName_);
        config.modelCacheDir_ = j.value("modelCacheDir", config.modelCacheDir_);
        config.modelBaseUrl_ = j.value("modelBaseUrl", config.modelBaseUrl_);
        config.allowDownload_ = j.value("allowDownload", config.allowDownload_);
        config.vadModelPath_ = j.value("vadModelPath", config.vadModelPath_);
        config.vadModelName_ = j.value("vadModelName", config.vadModelName_);
        config.vadModelBaseUrl_ = j.value("vadModelBaseUrl", config.vadModelBaseUrl_);
        config.useGpu_ = j.value("useGpu", config.useGpu_);
        config.flashAttention_ = j.value("flashAttention", config.flashAttention_);
        config.translationModelsPath_ = j.value("translationModelsPath", config.translationModelsPath_);
        config.translationBeamSize_ = j.value("translationBeamSize", config.translationBeamSize_);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationException("JSON parsing error: " + std::string(e.what()), origin);
    }

    if (config.workerThreads_ < 0) {
        throw ConfigurationException("workerThreads must not be negative", origin);
    }
    if (config.translationBeamSize_ < 1) {
        throw ConfigurationException("translationBeamSize must be at least 1", origin);
    }
    if (config.defaultModelName_.empty()) {
        throw ConfigurationException("defaultModelName must not be empty", origin);
    }
    return config;
}

Config Config::fromEnvironment() {
    Config config;
    std::string path = readEnv(kConfigEnvVar);
    if (!path.empty()) {
        try {
            config = load(path);
        } catch (const ConfigurationException& e) {
            ErrorHandler::getInstance().reportError(e, "Config::fromEnvironment");
            Logger::warn("Ignoring invalid configuration, using defaults");
            config = Config();
        }
    }
    config.applyEnvironmentOverrides();
    return config;
}

void Config::applyEnvironmentOverrides() {
    std::string level = readEnv(kLogLevelEnvVar);
    if (!level.empty()) {
        logLevel_ = level;
    }
}

size_t Config::getEffectiveWorkerThreads() const {
    if (workerThreads_ > 0) {
        return static_cast<size_t>(workerThreads_);
    }
    return std::max<size_t>(4, std::thread::hardware_concurrency());
}

} // namespace utils
} // namespace soksak
