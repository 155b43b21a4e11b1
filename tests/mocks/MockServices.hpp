/**
 * @file MockServices.hpp
 * @brief Mock implementations for testing geocoding services
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "geo/boundaries/IBoundaryService.hpp"

#include <string>
#include <vector>

namespace Atlas {
namespace Test {

// =============================================================================
// MockBoundaryService
// =============================================================================

/**
 * @brief Mock country boundary service for testing boundary-aware lookup
 * without polygon data
 */
class MockBoundaryService : public Geo::Boundaries::IBoundaryService {
public:
    MOCK_METHOD((std::expected<void, Geo::GeoError>), Initialize, (), (override));
    MOCK_METHOD(bool, IsInitialized, (), (const, override));
    MOCK_METHOD(Geo::Boundaries::CountryLookupResult, GetCountry,
                (double latitude, double longitude), (const, override));
    MOCK_METHOD(bool, IsPointInCountry,
                (double latitude, double longitude, const std::string& countryCode), (const, override));
    MOCK_METHOD(std::vector<std::string>, GetCandidateCountries,
                (double latitude, double longitude), (const, override));

    // Helper to answer every query with one country
    void ResolveEverywhereTo(const std::string& countryCode, bool isBorderArea = false) {
        Geo::Boundaries::CountryLookupResult result;
        result.countryCode = countryCode;
        result.isBorderArea = isBorderArea;
        if (isBorderArea) {
            result.candidates = {countryCode};
        }
        ON_CALL(*this, Initialize()).WillByDefault(::testing::Return(std::expected<void, Geo::GeoError>{}));
        ON_CALL(*this, IsInitialized()).WillByDefault(::testing::Return(true));
        ON_CALL(*this, GetCountry(::testing::_, ::testing::_)).WillByDefault(::testing::Return(result));
    }

    void ResolveEverywhereToOcean() {
        Geo::Boundaries::CountryLookupResult result;
        result.isOcean = true;
        ON_CALL(*this, Initialize()).WillByDefault(::testing::Return(std::expected<void, Geo::GeoError>{}));
        ON_CALL(*this, IsInitialized()).WillByDefault(::testing::Return(true));
        ON_CALL(*this, GetCountry(::testing::_, ::testing::_)).WillByDefault(::testing::Return(result));
    }
};

} // namespace Test
} // namespace Atlas
