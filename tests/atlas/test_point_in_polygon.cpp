/**
 * @file test_point_in_polygon.cpp
 * @brief Unit tests for ray-casting containment against country polygons
 */

#include <gtest/gtest.h>

#include "geo/boundaries/PointInPolygon.hpp"

#include "utils/TestHelpers.hpp"
#include "utils/GeoFixtures.hpp"

using namespace Atlas;
using namespace Atlas::Geo;
using namespace Atlas::Geo::Boundaries;
using namespace Atlas::Test;

// =============================================================================
// Fixture
// =============================================================================

class PointInPolygonTest : public ::testing::Test {
protected:
    void SetUp() override {
        square = MakeRectRing(0.0, 10.0, 0.0, 10.0);

        // Concave "L": the upper right quadrant is missing
        lShape.vertices = {{0.0, 0.0}, {10.0, 0.0}, {10.0, 5.0}, {5.0, 5.0}, {5.0, 10.0}, {0.0, 10.0}};
        lShape.ComputeBounds();

        donut.exterior = MakeRectRing(0.0, 10.0, 0.0, 10.0);
        donut.holes.push_back(MakeRectRing(4.0, 6.0, 4.0, 6.0));
        donut.ComputeBounds();
    }

    PolygonRing square;
    PolygonRing lShape;
    Polygon donut;
};

// =============================================================================
// Rings
// =============================================================================

TEST_F(PointInPolygonTest, PointInsideSquare) {
    EXPECT_TRUE(PointInPolygon::IsPointInRing(5.0, 5.0, square));
    EXPECT_TRUE(PointInPolygon::IsPointInRing(0.5, 9.5, square));
}

TEST_F(PointInPolygonTest, PointOutsideSquare) {
    EXPECT_FALSE(PointInPolygon::IsPointInRing(-1.0, 5.0, square));
    EXPECT_FALSE(PointInPolygon::IsPointInRing(5.0, 11.0, square));
    EXPECT_FALSE(PointInPolygon::IsPointInRing(20.0, 20.0, square));
}

TEST_F(PointInPolygonTest, ConcaveRing) {
    EXPECT_TRUE(PointInPolygon::IsPointInRing(2.0, 2.0, lShape));
    EXPECT_TRUE(PointInPolygon::IsPointInRing(8.0, 2.0, lShape));   // lat 8 lies in the left arm
    EXPECT_TRUE(PointInPolygon::IsPointInRing(2.0, 8.0, lShape));   // lon 8 lies in the bottom arm
    EXPECT_FALSE(PointInPolygon::IsPointInRing(8.0, 8.0, lShape));
}

TEST_F(PointInPolygonTest, DegenerateRingContainsNothing) {
    PolygonRing line;
    line.vertices = {{0.0, 0.0}, {10.0, 10.0}};
    line.ComputeBounds();
    EXPECT_FALSE(PointInPolygon::IsPointInRing(5.0, 5.0, line));

    PolygonRing empty;
    EXPECT_FALSE(PointInPolygon::IsPointInRing(0.0, 0.0, empty));
}

// =============================================================================
// Polygons and Countries
// =============================================================================

TEST_F(PointInPolygonTest, HoleIsExcluded) {
    EXPECT_TRUE(PointInPolygon::IsPointInPolygon(2.0, 2.0, donut));
    EXPECT_FALSE(PointInPolygon::IsPointInPolygon(5.0, 5.0, donut));
    EXPECT_FALSE(PointInPolygon::IsPointInPolygon(12.0, 5.0, donut));
}

TEST_F(PointInPolygonTest, MultiPolygonCountry) {
    CountryBoundary islands;
    islands.countryCode = "XI";

    Polygon west;
    west.exterior = MakeRectRing(0.0, 1.0, 0.0, 1.0);
    Polygon east;
    east.exterior = MakeRectRing(0.0, 1.0, 5.0, 6.0);
    islands.polygons = {west, east};
    islands.ComputeBounds();

    EXPECT_TRUE(PointInPolygon::IsPointInCountry(0.5, 0.5, islands));
    EXPECT_TRUE(PointInPolygon::IsPointInCountry(0.5, 5.5, islands));
    // Inside the combined bounding box, between the islands
    EXPECT_FALSE(PointInPolygon::IsPointInCountry(0.5, 3.0, islands));
}

TEST_F(PointInPolygonTest, CountryBoundsCoverAllPolygons) {
    auto country = MakeRectCountry("US", "United States", 42.33, 43.0, -84.0, -82.5);

    EXPECT_DOUBLE_EQ(42.33, country.bounds.minLatitude);
    EXPECT_DOUBLE_EQ(43.0, country.bounds.maxLatitude);
    EXPECT_DOUBLE_EQ(-84.0, country.bounds.minLongitude);
    EXPECT_DOUBLE_EQ(-82.5, country.bounds.maxLongitude);
    EXPECT_FALSE(country.bounds.IsEmpty());
}

// =============================================================================
// Edges and Normalization
// =============================================================================

TEST_F(PointInPolygonTest, PointOnEdge) {
    EXPECT_TRUE(PointInPolygon::IsPointOnEdge(0.0, 5.0, square));
    EXPECT_TRUE(PointInPolygon::IsPointOnEdge(5.0, 10.00005, square));
    EXPECT_FALSE(PointInPolygon::IsPointOnEdge(5.0, 5.0, square));
    EXPECT_TRUE(PointInPolygon::IsPointOnEdge(5.0, 5.5, square, 5.0));
}

TEST_F(PointInPolygonTest, NormalizeLongitude) {
    EXPECT_DOUBLE_EQ(0.0, PointInPolygon::NormalizeLongitude(0.0));
    EXPECT_DOUBLE_EQ(180.0, PointInPolygon::NormalizeLongitude(180.0));
    EXPECT_DOUBLE_EQ(-180.0, PointInPolygon::NormalizeLongitude(-180.0));
    EXPECT_DOUBLE_EQ(-170.0, PointInPolygon::NormalizeLongitude(190.0));
    EXPECT_DOUBLE_EQ(170.0, PointInPolygon::NormalizeLongitude(-190.0));
    EXPECT_DOUBLE_EQ(10.0, PointInPolygon::NormalizeLongitude(370.0));
    EXPECT_DOUBLE_EQ(-90.0, PointInPolygon::NormalizeLongitude(630.0));
}

TEST_F(PointInPolygonTest, ClampLatitude) {
    EXPECT_DOUBLE_EQ(90.0, PointInPolygon::ClampLatitude(95.0));
    EXPECT_DOUBLE_EQ(-90.0, PointInPolygon::ClampLatitude(-100.0));
    EXPECT_DOUBLE_EQ(45.0, PointInPolygon::ClampLatitude(45.0));
}
