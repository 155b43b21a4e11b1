/**
 * @file atlas_geolookup.cpp
 * @brief Command-line reverse geocoder over an Atlas index
 *
 * Usage:
 *   atlas-geolookup [options] [lat,lon ...]
 *
 * Coordinates are read from the arguments, or one per line from stdin when
 * none are given.
 *
 * Options:
 *   --config <file>             JSON configuration file
 *   --data-dir <dir>            Directory holding geo.geoindex / geo.geodata
 *   --max-distance <km>         Distance bound for matches
 *   --min-population <count>    Ignore smaller places
 *   --granularity <level>       city, county, state or country
 *   --no-boundaries             Disable country-boundary correction
 *   --verbose                   Debug logging
 *   --help                      Show this help
 */

#include "config/GeocodingConfig.hpp"
#include "config/LocationGranularity.hpp"
#include "core/Logger.hpp"
#include "geo/BoundaryAwareGeocodingService.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// ============================================================================
// Configuration
// ============================================================================

struct ToolConfig {
    std::string configFile;
    std::optional<std::string> dataDirectory;
    std::optional<double> maxDistanceKm;
    std::optional<uint32_t> minimumPopulation;
    std::optional<Atlas::LocationGranularity> granularity;
    bool noBoundaries = false;
    bool verbose = false;
    std::vector<std::string> coordinates;
};

struct QuerySummary {
    size_t resolved = 0;
    size_t unknown = 0;
    size_t failed = 0;
};

// ============================================================================
// Helper Functions
// ============================================================================

void PrintUsage() {
    std::cout << R"(
atlas-geolookup - Resolve GPS coordinates to place names

Usage:
  atlas-geolookup [options] [lat,lon ...]

  Without coordinate arguments, reads one "lat,lon" per line from stdin.

Options:
  --config <file>             JSON configuration file

  --data-dir <dir>            Directory containing geo.geoindex and geo.geodata
                              Default: ./data, ., ~/.atlas

  --max-distance <km>         Maximum distance to a matched place
                              Default: 50

  --min-population <count>    Ignore places with a smaller population

  --granularity <level>       Most specific level to report
                              (city, county, state, country)
                              Default: city

  --no-boundaries             Disable country-boundary correction

  --verbose                   Print debug logging

  --help                      Show this help

Examples:
  atlas-geolookup 40.7128,-74.0060 51.5074,-0.1278
  atlas-geolookup --data-dir /srv/atlas --granularity state < coordinates.txt
)";
}

std::optional<double> ParseDouble(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str()) return std::nullopt;
    while (*end == ' ' || *end == '\t' || *end == '\r') ++end;
    if (*end != '\0') return std::nullopt;
    return value;
}

std::optional<Atlas::Geo::GeoCoordinate> ParseCoordinate(const std::string& text) {
    auto comma = text.find(',');
    if (comma == std::string::npos) return std::nullopt;

    auto latitude = ParseDouble(text.substr(0, comma));
    auto longitude = ParseDouble(text.substr(comma + 1));
    if (!latitude || !longitude) return std::nullopt;
    return Atlas::Geo::GeoCoordinate(*latitude, *longitude);
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool ParseArguments(int argc, char* argv[], ToolConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config.configFile = argv[++i];
        }
        else if (arg == "--data-dir" && i + 1 < argc) {
            config.dataDirectory = argv[++i];
        }
        else if (arg == "--max-distance" && i + 1 < argc) {
            auto value = ParseDouble(argv[++i]);
            if (!value || *value <= 0.0) {
                std::cerr << "Error: --max-distance needs a positive number\n";
                return false;
            }
            config.maxDistanceKm = *value;
        }
        else if (arg == "--min-population" && i + 1 < argc) {
            auto value = Atlas::ParsePopulation(argv[++i]);
            if (!value) {
                std::cerr << "Error: --min-population needs a non-negative integer\n";
                return false;
            }
            config.minimumPopulation = *value;
        }
        else if (arg == "--granularity" && i + 1 < argc) {
            config.granularity = Atlas::ParseLocationGranularity(argv[++i]);
            if (!config.granularity) {
                std::cerr << "Error: Unknown granularity: " << argv[i] << "\n";
                return false;
            }
        }
        else if (arg == "--no-boundaries") {
            config.noBoundaries = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else {
            config.coordinates.push_back(arg);
        }
    }

    return true;
}

// ============================================================================
// Lookup
// ============================================================================

void ResolveOne(Atlas::Geo::BoundaryAwareGeocodingService& service,
                const Atlas::GeocodingConfig& config,
                const std::string& input,
                QuerySummary& summary) {
    auto coordinate = ParseCoordinate(input);
    if (!coordinate) {
        APP_LOG_WARN("Skipping malformed coordinate: '{}'", input);
        std::cout << input << "\t" << config.unknownLocationFallback << "\n";
        ++summary.failed;
        return;
    }

    auto result = service.Lookup(coordinate->latitude, coordinate->longitude);
    if (!result) {
        APP_LOG_WARN("Lookup failed for {}: {}", input, Atlas::Geo::ToString(result.error()));
        std::cout << input << "\t" << config.unknownLocationFallback << "\n";
        ++summary.failed;
        return;
    }

    if (!*result) {
        std::cout << input << "\t" << config.unknownLocationFallback << "\n";
        ++summary.unknown;
        return;
    }

    const auto& match = **result;
    auto location = Atlas::ApplyGranularity(Atlas::Geo::LocationData::FromEntry(match.location),
                                            config.locationGranularity,
                                            config.unknownLocationFallback);

    std::cout << input << "\t" << location.ToDisplayString()
              << "\t(" << match.distanceKm << " km, cell " << match.cellGeohash
              << (match.isFromNeighborCell ? ", neighbor" : "") << ")\n";
    ++summary.resolved;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    ToolConfig tool;
    if (!ParseArguments(argc, argv, tool)) {
        PrintUsage();
        return 1;
    }

    Atlas::GeocodingConfig config;
    if (!tool.configFile.empty()) {
        auto loaded = Atlas::GeocodingConfig::LoadFromFile(tool.configFile);
        if (!loaded) {
            std::cerr << "Error: Cannot load config " << tool.configFile << ": "
                      << Atlas::ToString(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    if (tool.dataDirectory) config.dataDirectory = *tool.dataDirectory;
    if (tool.maxDistanceKm) config.maxDistanceKm = *tool.maxDistanceKm;
    if (tool.minimumPopulation) config.minimumPopulation = tool.minimumPopulation;
    if (tool.granularity) config.locationGranularity = *tool.granularity;
    if (tool.noBoundaries) config.boundaryFiltering = false;

    Atlas::Logger::Initialize(config.logFile);
    auto level = Atlas::Logger::ParseLevel(config.logLevel).value_or(spdlog::level::info);
    Atlas::Logger::SetLevel(tool.verbose ? spdlog::level::debug : level);

    Atlas::Geo::BoundaryAwareGeocodingService service(config);
    if (auto initialized = service.Initialize(); !initialized) {
        APP_LOG_CRITICAL("Geocoding initialization failed: {}. Check that {} and {} exist in the data directory.",
                         Atlas::Geo::ToString(initialized.error()), config.indexFile, config.dataFile);
        Atlas::Logger::Shutdown();
        return 1;
    }

    QuerySummary summary;
    if (!tool.coordinates.empty()) {
        for (const auto& input : tool.coordinates) {
            ResolveOne(service, config, input, summary);
        }
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty() || line[0] == '#') continue;
            ResolveOne(service, config, line, summary);
        }
    }

    const auto stats = service.GetGeocoder().GetStatistics();
    APP_LOG_INFO("Resolved: {}, unknown: {}, failed: {}", summary.resolved, summary.unknown, summary.failed);
    APP_LOG_INFO("Cells loaded: {}, cache hits: {}, misses: {}, evictions: {}, cached: {} ({} bytes)",
                 stats.cellsLoaded, stats.cacheHits, stats.cacheMisses, stats.cacheEvictions,
                 stats.cachedCells, stats.cacheMemoryBytes);
    if (service.IsBoundaryFilteringEnabled()) {
        APP_LOG_INFO("Country matches: {}, distance-only fallbacks: {}",
                     service.GetCountryMatchCount(), service.GetFallbackCount());
    }

    Atlas::Logger::Shutdown();
    return 0;
}
