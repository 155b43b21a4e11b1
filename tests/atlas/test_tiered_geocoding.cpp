/**
 * @file test_tiered_geocoding.cpp
 * @brief Tests for nearest-place lookup over the index, loader and cache
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "geo/TieredGeocodingService.hpp"
#include "geo/Geohash.hpp"

#include "utils/TestHelpers.hpp"
#include "utils/GeoFixtures.hpp"
#include "utils/Generators.hpp"

#include <atomic>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace Atlas;
using namespace Atlas::Geo;
using namespace Atlas::Test;

// =============================================================================
// Fixture
// =============================================================================

class TieredGeocodingTest : public ::testing::Test {
protected:
    std::unique_ptr<TieredGeocodingService> CreateService(const std::vector<LocationEntry>& places,
                                                          GeoFixtureOptions options = {}) {
        fixture = WriteGeoFixture(dir.Path(), places, options);

        config.dataDirectory = dir.Path().string();
        auto service = std::make_unique<TieredGeocodingService>(config);
        auto result = service->Initialize();
        EXPECT_TRUE(result.has_value()) << ToString(result.error());
        return service;
    }

    TempDirectory dir{"tiered"};
    GeocodingConfig config;
    GeoFixture fixture;
};

// =============================================================================
// Initialization
// =============================================================================

TEST_F(TieredGeocodingTest, InitializeFindsConfiguredDirectory) {
    auto service = CreateService(NewYorkAreaPlaces());

    EXPECT_TRUE(service->IsInitialized());
    EXPECT_EQ(dir.Path().string(), service->GetDataDirectory().string());
    ASSERT_NE(nullptr, service->GetIndex());
    EXPECT_EQ(1u, service->GetIndex()->GetCellCount());
    ASSERT_NE(nullptr, service->GetCache());
    EXPECT_EQ(config.GetCacheMemoryBytes(), service->GetCache()->GetMaxMemoryBytes());
}

TEST_F(TieredGeocodingTest, InvalidConfigurationIsRejected) {
    WriteGeoFixture(dir.Path(), NewYorkAreaPlaces());
    config.dataDirectory = dir.Path().string();
    config.cacheMemoryMB = GeocodingConfig::MAX_CACHE_MEMORY_MB + 1;

    TieredGeocodingService service(config);
    auto result = service.Initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(GeoError::InvalidArgument, result.error());
    EXPECT_FALSE(service.IsInitialized());
}

TEST_F(TieredGeocodingTest, InitializeIsIdempotent) {
    auto service = CreateService(NewYorkAreaPlaces());
    EXPECT_TRUE(service->Initialize().has_value());
    EXPECT_TRUE(service->IsInitialized());
}

TEST_F(TieredGeocodingTest, MissingFilesIsIoError) {
    config.dataDirectory = (dir / "empty").string();
    TieredGeocodingService service(config);

    auto result = service.Initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(GeoError::IoError, result.error());
    EXPECT_FALSE(service.IsInitialized());
}

TEST_F(TieredGeocodingTest, DataFileSizeMismatchIsDataCorrupt) {
    fixture = WriteGeoFixture(dir.Path(), NewYorkAreaPlaces());
    auto bytes = ReadBytes(fixture.dataPath);
    bytes.push_back(0);
    WriteBytes(fixture.dataPath, bytes);

    config.dataDirectory = dir.Path().string();
    TieredGeocodingService service(config);

    auto result = service.Initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(GeoError::DataCorrupt, result.error());
}

TEST_F(TieredGeocodingTest, CorruptIndexFailsInitialize) {
    fixture = WriteGeoFixture(dir.Path(), NewYorkAreaPlaces());
    WriteBytes(fixture.indexPath, {1, 2, 3});

    config.dataDirectory = dir.Path().string();
    TieredGeocodingService service(config);

    auto result = service.Initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(GeoError::IndexCorrupt, result.error());
}

TEST_F(TieredGeocodingTest, QueryBeforeInitializeIsNotInitialized) {
    TieredGeocodingService service(config);

    auto result = service.FindNearest(40.7128, -74.0060, 50.0, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(GeoError::NotInitialized, result.error());

    auto location = service.ReverseGeocode(40.7128, -74.0060);
    ASSERT_FALSE(location.has_value());
    EXPECT_EQ(GeoError::NotInitialized, location.error());
}

TEST_F(TieredGeocodingTest, ShutdownReleasesState) {
    auto service = CreateService(NewYorkAreaPlaces());
    service->Shutdown();

    EXPECT_FALSE(service->IsInitialized());
    EXPECT_EQ(nullptr, service->GetIndex());
    EXPECT_FALSE(service->FindNearest(40.7128, -74.0060, 50.0, {}).has_value());
}

// =============================================================================
// Nearest Place
// =============================================================================

TEST_F(TieredGeocodingTest, ExactPointReturnsThatPlace) {
    auto service = CreateService(NewYorkAreaPlaces());

    auto result = service->FindNearest(40.7128, -74.0060, 50.0, {});
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());

    const GeoLookupResult& match = **result;
    EXPECT_EQ("New York", match.location.city.value_or(""));
    EXPECT_NEAR(0.0, match.distanceKm, 1e-9);
    EXPECT_EQ("dr5r", match.cellGeohash);
    EXPECT_FALSE(match.isFromNeighborCell);
}

TEST_F(TieredGeocodingTest, ZeroDistanceBoundIsInclusive) {
    auto service = CreateService(NewYorkAreaPlaces());

    auto result = service->FindNearest(40.7128, -74.0060, 0.0, {});
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ("New York", (*result)->location.city.value_or(""));
}

TEST_F(TieredGeocodingTest, NeighborCellWinsWhenCloser) {
    // Query sits in dr5r just below its northern edge
    auto service = CreateService({
        MakePlace("North", 40.79, -74.0, "US", 1000),    // dr72, 1.11 km
        MakePlace("South", 40.70, -74.0, "US", 1000),    // dr5r, 8.90 km
    });

    auto result = service->FindNearest(40.78, -74.0, 50.0, {});
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());

    EXPECT_EQ("North", (*result)->location.city.value_or(""));
    EXPECT_EQ("dr72", (*result)->cellGeohash);
    EXPECT_TRUE((*result)->isFromNeighborCell);
    EXPECT_NEAR(1.112, (*result)->distanceKm, 0.001);
}

TEST_F(TieredGeocodingTest, TieBetweenLocalAndNeighborKeepsLocal) {
    auto service = CreateService({
        MakePlace("Neighbor", 40.8125, -74.0, "US", 1000),   // dr72
        MakePlace("Local", 40.6875, -74.0, "US", 1000),      // dr5r
    });

    auto result = service->FindNearest(40.75, -74.0, 50.0, {});
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ("Local", (*result)->location.city.value_or(""));
    EXPECT_FALSE((*result)->isFromNeighborCell);
}

TEST_F(TieredGeocodingTest, NothingWithinBound) {
    auto service = CreateService(NewYorkAreaPlaces());

    // Nearest place (Jersey City) is 11.9 km away
    auto result = service->FindNearest(40.62, -74.10, 1.0, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->has_value());

    auto wider = service->FindNearest(40.62, -74.10, 12.0, {});
    ASSERT_TRUE(wider.has_value());
    ASSERT_TRUE(wider->has_value());
    EXPECT_EQ("Jersey City", (*wider)->location.city.value_or(""));
}

TEST_F(TieredGeocodingTest, SearchIsLimitedToAdjacentCells) {
    auto service = CreateService(NewYorkAreaPlaces());

    // dr57 is not adjacent to dr5r even though New York is within the bound
    auto result = service->FindNearest(40.0, -74.0, 200.0, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->has_value());
}

TEST_F(TieredGeocodingTest, EmptyRegionReturnsNoResult) {
    auto service = CreateService(NewYorkAreaPlaces());

    auto result = service->FindNearest(0.0, -30.0, 50.0, {});
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->has_value());
    EXPECT_EQ(0u, service->GetStatistics().cellsLoaded);
}

// =============================================================================
// Filters
// =============================================================================

TEST_F(TieredGeocodingTest, MinimumPopulationSkipsSmallPlaces) {
    auto service = CreateService(NewYorkAreaPlaces());

    CandidateFilter filter;
    filter.minimumPopulation = 100000;

    // Hoboken itself is too small; Jersey City is 3.05 km away
    auto result = service->FindNearest(40.7440, -74.0324, 50.0, filter);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ("Jersey City", (*result)->location.city.value_or(""));
    EXPECT_NEAR(3.05, (*result)->distanceKm, 0.01);
}

TEST_F(TieredGeocodingTest, ConfiguredMinimumPopulationAppliesToReverseGeocode) {
    config.minimumPopulation = 100000;
    auto service = CreateService(NewYorkAreaPlaces());

    auto location = service->ReverseGeocode(40.7440, -74.0324);
    ASSERT_TRUE(location.has_value());
    ASSERT_TRUE(location->has_value());
    EXPECT_EQ("Jersey City", (*location)->city.value_or(""));
    EXPECT_EQ("New Jersey", (*location)->state.value_or(""));
}

TEST_F(TieredGeocodingTest, CountryFilterIsCaseInsensitive) {
    auto service = CreateService(NewYorkAreaPlaces());

    CandidateFilter filter;
    filter.countryCode = "us";
    auto result = service->FindNearest(40.7128, -74.0060, 50.0, filter);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ("US", (*result)->location.country);

    filter.countryCode = "CA";
    auto none = service->FindNearest(40.7128, -74.0060, 50.0, filter);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none->has_value());
}

// =============================================================================
// Invalid Input and Errors
// =============================================================================

TEST_F(TieredGeocodingTest, InvalidCoordinatesAreRejected) {
    auto service = CreateService(NewYorkAreaPlaces());

    for (auto [lat, lon] : {std::pair{91.0, 0.0}, std::pair{0.0, 181.0},
                            std::pair{std::numeric_limits<double>::quiet_NaN(), 0.0},
                            std::pair{0.0, std::numeric_limits<double>::infinity()}}) {
        auto result = service->FindNearest(lat, lon, 50.0, {});
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(GeoError::InvalidArgument, result.error());
    }
    EXPECT_EQ(4u, service->GetStatistics().failed);
}

TEST_F(TieredGeocodingTest, NegativeOrNaNDistanceIsRejected) {
    auto service = CreateService(NewYorkAreaPlaces());

    EXPECT_FALSE(service->FindNearest(40.7128, -74.0060, -1.0, {}).has_value());
    EXPECT_FALSE(service->FindNearest(40.7128, -74.0060,
                                      std::numeric_limits<double>::quiet_NaN(), {}).has_value());
}

TEST_F(TieredGeocodingTest, CorruptCellPropagatesError) {
    auto service = CreateService(NewYorkAreaPlaces());

    // Damage the country length of the last record in place
    auto bytes = ReadBytes(fixture.dataPath);
    bytes[bytes.size() - 3] = 0xFF;
    WriteBytes(fixture.dataPath, bytes);

    auto result = service->FindNearest(40.7128, -74.0060, 50.0, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(GeoError::DataCorrupt, result.error());
}

// =============================================================================
// Compressed Data and Caching
// =============================================================================

TEST_F(TieredGeocodingTest, CompressedDataset) {
    GeoFixtureOptions options;
    options.compressed = true;
    auto service = CreateService(NewYorkAreaPlaces(), options);

    auto location = service->ReverseGeocode(40.7128, -74.0060);
    ASSERT_TRUE(location.has_value());
    ASSERT_TRUE(location->has_value());
    EXPECT_EQ("Manhattan, New York, New York County, New York, US", (*location)->ToDisplayString());
}

TEST_F(TieredGeocodingTest, RepeatedQueriesHitCache) {
    auto service = CreateService(NewYorkAreaPlaces());

    ASSERT_TRUE(service->FindNearest(40.7128, -74.0060, 50.0, {}).has_value());
    ASSERT_TRUE(service->FindNearest(40.6782, -73.9442, 50.0, {}).has_value());
    ASSERT_TRUE(service->FindNearest(40.70, -74.01, 50.0, {}).has_value());

    GeocodingStatistics stats = service->GetStatistics();
    EXPECT_EQ(3u, stats.queries);
    EXPECT_EQ(3u, stats.resolved);
    EXPECT_EQ(0u, stats.unresolved);
    EXPECT_EQ(1u, stats.cellsLoaded);
    EXPECT_EQ(2u, stats.cacheHits);
    EXPECT_EQ(1u, stats.cachedCells);
    EXPECT_GT(stats.cacheMemoryBytes, 0u);
}

TEST_F(TieredGeocodingTest, WorldCitiesResolveInTheirOwnCells) {
    auto service = CreateService(WorldCityPlaces());

    struct Expectation { double lat; double lon; const char* city; const char* cell; };
    for (const auto& expected : {Expectation{51.50, -0.12, "London", "gcpv"},
                                 Expectation{48.85, 2.35, "Paris", "u09t"},
                                 Expectation{35.68, 139.65, "Tokyo", "xn76"},
                                 Expectation{-33.87, 151.21, "Sydney", "r3gx"}}) {
        auto result = service->FindNearest(expected.lat, expected.lon, 50.0, {});
        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(result->has_value()) << expected.city;
        EXPECT_EQ(expected.city, (*result)->location.city.value_or(""));
        EXPECT_EQ(expected.cell, (*result)->cellGeohash);
    }
}

// =============================================================================
// Concurrency
// =============================================================================

namespace {

bool SameResult(const std::optional<GeoLookupResult>& a, const std::optional<GeoLookupResult>& b) {
    if (a.has_value() != b.has_value()) return false;
    if (!a) return true;
    return a->location == b->location && a->distanceKm == b->distanceKm &&
           a->cellGeohash == b->cellGeohash && a->isFromNeighborCell == b->isFromNeighborCell;
}

// Enough places around New York that a 1 MB cache cannot hold every cell
std::vector<LocationEntry> CrowdedRegionPlaces(RandomGenerator& rng, CoordinateGenerator& region) {
    std::vector<LocationEntry> places = NewYorkAreaPlaces();
    for (const auto& city : WorldCityPlaces()) {
        places.push_back(city);
    }
    int index = 0;
    for (const auto& coordinate : region.GenerateMany(rng, 12000)) {
        places.push_back(MakePlace("Place " + std::to_string(index++), coordinate.latitude,
                                   coordinate.longitude, "US", 1000));
    }
    return places;
}

} // namespace

TEST_F(TieredGeocodingTest, ConcurrentQueriesAgree) {
    RandomGenerator rng;
    CoordinateGenerator region(40.0, 42.0, -75.0, -73.0);

    config.cacheMemoryMB = 1;
    auto service = CreateService(CrowdedRegionPlaces(rng, region));
    ASSERT_TRUE(service->IsInitialized());

    std::vector<GeoCoordinate> queries = region.GenerateMany(rng, 200);
    queries.emplace_back(40.7128, -74.0060);
    queries.emplace_back(51.50, -0.12);
    queries.emplace_back(48.85, 2.35);
    queries.emplace_back(35.68, 139.65);
    queries.emplace_back(-33.87, 151.21);

    // Single-threaded answers, and the cache lookups one pass costs
    service->GetCache()->ResetStatistics();
    std::vector<std::optional<GeoLookupResult>> expected;
    for (const auto& query : queries) {
        auto result = service->FindNearest(query.latitude, query.longitude, 50.0, {});
        ASSERT_TRUE(result.has_value()) << ToString(result.error());
        expected.push_back(*result);
    }
    const GeocodingStatistics reference = service->GetStatistics();
    const size_t lookupsPerPass = reference.cacheHits + reference.cacheMisses;
    EXPECT_GT(reference.cacheEvictions, 0u);

    constexpr size_t kThreads = 8;
    constexpr size_t kPasses = 3;
    std::atomic<size_t> failures{0};
    std::atomic<size_t> mismatches{0};

    service->GetCache()->ResetStatistics();
    std::vector<std::thread> threads;
    for (size_t t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (size_t pass = 0; pass < kPasses; ++pass) {
                for (size_t i = 0; i < queries.size(); ++i) {
                    const size_t q = (i + t * 37) % queries.size();
                    auto result = service->FindNearest(queries[q].latitude, queries[q].longitude, 50.0, {});
                    if (!result) {
                        ++failures;
                    } else if (!SameResult(*result, expected[q])) {
                        ++mismatches;
                    }
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(0u, failures.load());
    EXPECT_EQ(0u, mismatches.load());

    GeocodingStatistics stats = service->GetStatistics();
    EXPECT_EQ(lookupsPerPass * kThreads * kPasses, stats.cacheHits + stats.cacheMisses);
    EXPECT_EQ(queries.size() * (kThreads * kPasses + 1), stats.queries);
    EXPECT_EQ(0u, stats.failed);
    EXPECT_LE(stats.cacheMemoryBytes, config.GetCacheMemoryBytes());
}

TEST_F(TieredGeocodingTest, ShutdownWhileQueryingIsSafe) {
    RandomGenerator rng;
    CoordinateGenerator region(40.0, 42.0, -75.0, -73.0);

    config.cacheMemoryMB = 1;
    auto service = CreateService(CrowdedRegionPlaces(rng, region));
    const std::vector<GeoCoordinate> queries = region.GenerateMany(rng, 100);

    std::atomic<bool> started{false};
    std::atomic<size_t> unexpectedErrors{0};
    std::vector<std::thread> threads;
    for (size_t t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (size_t pass = 0; pass < 20; ++pass) {
                for (const auto& query : queries) {
                    auto result = service->FindNearest(query.latitude, query.longitude, 50.0, {});
                    started = true;
                    if (!result && result.error() != GeoError::NotInitialized) {
                        ++unexpectedErrors;
                    }
                }
            }
        });
    }

    while (!started) {
        std::this_thread::yield();
    }
    service->Shutdown();

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(service->IsInitialized());
    EXPECT_EQ(nullptr, service->GetCache());
    EXPECT_EQ(0u, unexpectedErrors.load());
    EXPECT_EQ(0u, service->GetStatistics().failed);
}
