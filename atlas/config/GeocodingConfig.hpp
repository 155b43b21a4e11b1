#pragma once

#include "config/LocationGranularity.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Atlas {

/**
 * @brief Configuration error types
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue,
    WriteError
};

[[nodiscard]] const char* ToString(ConfigError error) noexcept;

/**
 * @brief Parse a population count written as a plain decimal integer
 * @return Empty for signs, fractions, trailing text or values beyond uint32
 */
[[nodiscard]] std::optional<uint32_t> ParsePopulation(std::string_view text);

/**
 * @brief Settings of the geocoding engine
 *
 * Serialized as a flat JSON object with camelCase keys. Every key is
 * optional; missing keys keep the defaults below.
 */
struct GeocodingConfig {
    static constexpr size_t MAX_CACHE_MEMORY_MB = 65536;

    std::string dataDirectory;                       // Empty = search default locations
    std::string indexFile = "geo.geoindex";
    std::string dataFile = "geo.geodata";
    std::string boundaryFile = "geo.geobounds";

    size_t cacheMemoryMB = 16;
    double maxDistanceKm = 50.0;
    std::optional<uint32_t> minimumPopulation;

    LocationGranularity locationGranularity = LocationGranularity::City;
    std::string unknownLocationFallback = "Unknown";
    bool boundaryFiltering = true;

    std::string logFile;
    std::string logLevel = "info";

    /**
     * @brief Load and validate a JSON configuration file
     */
    [[nodiscard]] static std::expected<GeocodingConfig, ConfigError> LoadFromFile(
        const std::filesystem::path& path);

    /**
     * @brief Build a configuration from a parsed JSON object
     */
    [[nodiscard]] static std::expected<GeocodingConfig, ConfigError> LoadFromJson(
        const nlohmann::json& json);

    [[nodiscard]] nlohmann::json ToJson() const;

    std::expected<void, ConfigError> SaveToFile(const std::filesystem::path& path) const;

    /**
     * @brief Check value ranges
     */
    [[nodiscard]] std::expected<void, ConfigError> Validate() const;

    [[nodiscard]] size_t GetCacheMemoryBytes() const { return cacheMemoryMB * 1024 * 1024; }

    /**
     * @brief Directories searched for the index files, in priority order
     *
     * Just dataDirectory when it is set, otherwise ./data, the current
     * directory and $HOME/.atlas.
     */
    [[nodiscard]] std::vector<std::filesystem::path> GetSearchDirectories() const;
};

} // namespace Atlas
