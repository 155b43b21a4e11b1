#include "config/GeocodingConfig.hpp"
#include "core/Logger.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>

namespace Atlas {

const char* ToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "FileNotFound";
        case ConfigError::ParseError:   return "ParseError";
        case ConfigError::InvalidValue: return "InvalidValue";
        case ConfigError::WriteError:   return "WriteError";
    }
    return "Unknown";
}

std::optional<uint32_t> ParsePopulation(std::string_view text) {
    uint32_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [end, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || end == first || end != last) {
        return std::nullopt;
    }
    return value;
}

std::expected<GeocodingConfig, ConfigError> GeocodingConfig::LoadFromFile(
    const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ATLAS_LOG_ERROR("Config file not found: {}", path.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        ATLAS_LOG_ERROR("Failed to parse config file {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    auto config = LoadFromJson(json);
    if (config) {
        ATLAS_LOG_INFO("Loaded configuration from: {}", path.string());
    }
    return config;
}

std::expected<GeocodingConfig, ConfigError> GeocodingConfig::LoadFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        ATLAS_LOG_ERROR("Config root must be a JSON object");
        return std::unexpected(ConfigError::ParseError);
    }

    GeocodingConfig config;

    try {
        if (json.contains("dataDirectory")) config.dataDirectory = json["dataDirectory"].get<std::string>();
        if (json.contains("indexFile")) config.indexFile = json["indexFile"].get<std::string>();
        if (json.contains("dataFile")) config.dataFile = json["dataFile"].get<std::string>();
        if (json.contains("boundaryFile")) config.boundaryFile = json["boundaryFile"].get<std::string>();

        if (json.contains("cacheMemoryMB")) {
            const auto& value = json["cacheMemoryMB"];
            if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
                ATLAS_LOG_ERROR("cacheMemoryMB must be a positive integer");
                return std::unexpected(ConfigError::InvalidValue);
            }
            config.cacheMemoryMB = value.get<size_t>();
        }

        if (json.contains("maxDistanceKm")) {
            const auto& value = json["maxDistanceKm"];
            if (!value.is_number()) {
                ATLAS_LOG_ERROR("maxDistanceKm must be a number");
                return std::unexpected(ConfigError::InvalidValue);
            }
            config.maxDistanceKm = value.get<double>();
        }

        if (json.contains("minimumPopulation") && !json["minimumPopulation"].is_null()) {
            const auto& value = json["minimumPopulation"];
            if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
                value.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
                ATLAS_LOG_ERROR("minimumPopulation must be a non-negative integer");
                return std::unexpected(ConfigError::InvalidValue);
            }
            config.minimumPopulation = value.get<uint32_t>();
        }

        if (json.contains("locationGranularity")) {
            auto name = json["locationGranularity"].get<std::string>();
            auto granularity = ParseLocationGranularity(name);
            if (!granularity) {
                ATLAS_LOG_ERROR("Unknown locationGranularity: {}", name);
                return std::unexpected(ConfigError::InvalidValue);
            }
            config.locationGranularity = *granularity;
        }

        if (json.contains("unknownLocationFallback")) {
            config.unknownLocationFallback = json["unknownLocationFallback"].get<std::string>();
        }
        if (json.contains("boundaryFiltering")) {
            config.boundaryFiltering = json["boundaryFiltering"].get<bool>();
        }
        if (json.contains("logFile")) config.logFile = json["logFile"].get<std::string>();
        if (json.contains("logLevel")) config.logLevel = json["logLevel"].get<std::string>();
    } catch (const nlohmann::json::type_error& e) {
        ATLAS_LOG_ERROR("Config value has the wrong type: {}", e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }

    if (auto valid = config.Validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

nlohmann::json GeocodingConfig::ToJson() const {
    nlohmann::json json;

    json["dataDirectory"] = dataDirectory;
    json["indexFile"] = indexFile;
    json["dataFile"] = dataFile;
    json["boundaryFile"] = boundaryFile;
    json["cacheMemoryMB"] = cacheMemoryMB;
    json["maxDistanceKm"] = maxDistanceKm;
    if (minimumPopulation) {
        json["minimumPopulation"] = *minimumPopulation;
    } else {
        json["minimumPopulation"] = nullptr;
    }
    json["locationGranularity"] = ToString(locationGranularity);
    json["unknownLocationFallback"] = unknownLocationFallback;
    json["boundaryFiltering"] = boundaryFiltering;
    json["logFile"] = logFile;
    json["logLevel"] = logLevel;

    return json;
}

std::expected<void, ConfigError> GeocodingConfig::SaveToFile(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        ATLAS_LOG_ERROR("Failed to open config file for writing: {}", path.string());
        return std::unexpected(ConfigError::WriteError);
    }

    file << std::setw(4) << ToJson() << std::endl;
    if (!file) {
        ATLAS_LOG_ERROR("Failed to write config file: {}", path.string());
        return std::unexpected(ConfigError::WriteError);
    }
    return {};
}

std::expected<void, ConfigError> GeocodingConfig::Validate() const {
    if (cacheMemoryMB == 0) {
        ATLAS_LOG_ERROR("cacheMemoryMB must be greater than zero");
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (cacheMemoryMB > MAX_CACHE_MEMORY_MB) {
        ATLAS_LOG_ERROR("cacheMemoryMB must be at most {}, got {}", MAX_CACHE_MEMORY_MB, cacheMemoryMB);
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (!std::isfinite(maxDistanceKm) || maxDistanceKm <= 0.0) {
        ATLAS_LOG_ERROR("maxDistanceKm must be a positive number, got {}", maxDistanceKm);
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (indexFile.empty() || dataFile.empty()) {
        ATLAS_LOG_ERROR("indexFile and dataFile must not be empty");
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (!Logger::ParseLevel(logLevel)) {
        ATLAS_LOG_ERROR("Unknown logLevel: {}", logLevel);
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

std::vector<std::filesystem::path> GeocodingConfig::GetSearchDirectories() const {
    if (!dataDirectory.empty()) {
        return {std::filesystem::path(dataDirectory)};
    }

    std::vector<std::filesystem::path> directories;
    directories.emplace_back("data");
    directories.emplace_back(".");
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        directories.push_back(std::filesystem::path(home) / ".atlas");
    }
    return directories;
}

} // namespace Atlas
