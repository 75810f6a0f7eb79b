/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * Unit tests for greedy nearest-location assignment
 */

#include <gtest/gtest.h>
#include <NearestLocationAssigner.hpp>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace trk_guess;

namespace {

Endpoint makeEndpoint(const std::string &callsign, double lat, double lon) {
    Endpoint endpoint;
    endpoint.key.callsign = callsign;
    endpoint.latitudeDeg = lat;
    endpoint.longitudeDeg = lon;
    return endpoint;
}

Location makeLocation(const std::string &name, double lat, double lon) {
    Location loc;
    loc.name = name;
    loc.latitudeDeg = lat;
    loc.longitudeDeg = lon;
    return loc;
}

size_t countAssigned(const EndpointTable &table) {
    size_t count = 0;
    for (const auto &endpoint : table) {
        count += endpoint.isAssigned() ? 1 : 0;
    }
    return count;
}

} // namespace

// ============================================================================
// Distance
// ============================================================================

TEST(FlatEarthDistanceTest, OneDegreeIsConstantKilometres) {
    EXPECT_DOUBLE_EQ(111.32, flatEarthDistanceKm(0.0, 0.0, 0.0, 1.0));
    EXPECT_DOUBLE_EQ(111.32, flatEarthDistanceKm(35.0, 139.0, 36.0, 139.0));
}

TEST(FlatEarthDistanceTest, CombinesLatitudeAndLongitudePlanar) {
    EXPECT_NEAR(5.0 * 111.32, flatEarthDistanceKm(0.0, 0.0, 3.0, 4.0), 1e-9);
}

TEST(FlatEarthDistanceTest, IsSymmetricAndZeroAtSamePoint) {
    EXPECT_DOUBLE_EQ(0.0, flatEarthDistanceKm(35.675, 139.76667, 35.675, 139.76667));
    EXPECT_DOUBLE_EQ(flatEarthDistanceKm(35.0, 139.0, 35.5, 139.2), flatEarthDistanceKm(35.5, 139.2, 35.0, 139.0));
}

// ============================================================================
// Assignment
// ============================================================================

class AssignerTest : public ::testing::Test {
protected:
    const Location rjtt = makeLocation("RJTT", 35.675, 139.76667);
    const Location rjaa = makeLocation("RJAA", 35.76667, 140.38333);
};

TEST_F(AssignerTest, AssignsEndpointWithinRadius) {
    EndpointTable endpoints = {makeEndpoint("JAL001", 35.70, 139.77)};

    size_t assigned = assign(endpoints, {rjtt}, 10.0);

    EXPECT_EQ(1u, assigned);
    ASSERT_TRUE(endpoints[0].assignedLocation.has_value());
    EXPECT_EQ("RJTT", endpoints[0].assignedLocation.value());
    ASSERT_TRUE(endpoints[0].distanceKm.has_value());
    EXPECT_DOUBLE_EQ(flatEarthDistanceKm(35.70, 139.77, 35.675, 139.76667), endpoints[0].distanceKm.value());
}

TEST_F(AssignerTest, LeavesEndpointOutsideRadiusUnassigned) {
    EndpointTable endpoints = {makeEndpoint("JAL001", 36.0, 140.0)};

    size_t assigned = assign(endpoints, {rjtt}, 10.0);

    EXPECT_EQ(0u, assigned);
    EXPECT_FALSE(endpoints[0].assignedLocation.has_value());
    EXPECT_FALSE(endpoints[0].distanceKm.has_value());
}

TEST_F(AssignerTest, RadiusIsInclusive) {
    EndpointTable endpoints = {makeEndpoint("JAL001", 35.8, 139.9)};
    double exact = flatEarthDistanceKm(35.8, 139.9, rjtt.latitudeDeg, rjtt.longitudeDeg);

    EXPECT_EQ(1u, assign(endpoints, {rjtt}, exact));
    EXPECT_EQ("RJTT", endpoints[0].assignedLocation.value());
}

TEST_F(AssignerTest, EarlierLocationWinsOverCloserLaterOne) {
    // the endpoint sits almost on B but is still within range of A
    Location a = makeLocation("A", 35.00, 139.00);
    Location b = makeLocation("B", 35.05, 139.00);
    EndpointTable endpoints = {makeEndpoint("JAL001", 35.049, 139.00)};

    assign(endpoints, {a, b}, 10.0);

    EXPECT_EQ("A", endpoints[0].assignedLocation.value());
    EXPECT_GT(endpoints[0].distanceKm.value(), 5.0);
}

TEST_F(AssignerTest, ReversingPriorityChangesWinner) {
    Location a = makeLocation("A", 35.00, 139.00);
    Location b = makeLocation("B", 35.05, 139.00);
    EndpointTable endpoints = {makeEndpoint("JAL001", 35.049, 139.00)};

    assign(endpoints, {b, a}, 10.0);

    EXPECT_EQ("B", endpoints[0].assignedLocation.value());
}

TEST_F(AssignerTest, NeverOverwritesExistingAssignment) {
    EndpointTable endpoints = {makeEndpoint("JAL001", 35.675, 139.76667)};
    endpoints[0].assignedLocation = "EARLIER";
    endpoints[0].distanceKm = 7.5;

    size_t assigned = assign(endpoints, {rjtt}, 10.0);

    EXPECT_EQ(0u, assigned);
    EXPECT_EQ("EARLIER", endpoints[0].assignedLocation.value());
    EXPECT_DOUBLE_EQ(7.5, endpoints[0].distanceKm.value());
}

TEST_F(AssignerTest, SecondRunIsIdempotentOnAssignedRows) {
    EndpointTable endpoints = {
        makeEndpoint("JAL001", 35.70, 139.77),
        makeEndpoint("ANA100", 35.77, 140.38),
        makeEndpoint("SKY200", 43.00, 141.00),
    };
    std::vector<Location> gazetteer = {rjtt, rjaa};

    assign(endpoints, gazetteer, 10.0);
    EndpointTable afterFirst = endpoints;
    size_t secondPass = assign(endpoints, gazetteer, 10.0);

    EXPECT_EQ(0u, secondPass);
    for (size_t i = 0; i < endpoints.size(); ++i) {
        EXPECT_EQ(afterFirst[i].assignedLocation, endpoints[i].assignedLocation);
        EXPECT_EQ(afterFirst[i].distanceKm, endpoints[i].distanceKm);
    }
}

TEST_F(AssignerTest, LaterPhaseDoesNotReassign) {
    EndpointTable endpoints = {makeEndpoint("JAL001", 35.70, 139.77)};

    assign(endpoints, {rjtt}, 10.0);
    // a second gazetteer with a location right on top of the endpoint
    assign(endpoints, {makeLocation("ONTOP", 35.70, 139.77)}, 10.0);

    EXPECT_EQ("RJTT", endpoints[0].assignedLocation.value());
}

TEST_F(AssignerTest, EveryAssignmentIsWithinRadiusOfItsLocation) {
    std::vector<Location> gazetteer = {rjaa, rjtt, makeLocation("RJCC", 42.76667, 141.68333)};
    std::map<std::string, Location> byName;
    for (const auto &loc : gazetteer) {
        byName.emplace(loc.name, loc);
    }

    EndpointTable endpoints;
    for (int i = 0; i < 40; ++i) {
        endpoints.push_back(makeEndpoint("F" + std::to_string(i), 35.0 + 0.2 * i, 139.5 + 0.06 * i));
    }

    const double radius = 25.0;
    assign(endpoints, gazetteer, radius);

    for (const auto &endpoint : endpoints) {
        if (!endpoint.isAssigned()) {
            continue;
        }
        const auto &loc = byName.at(endpoint.assignedLocation.value());
        double d = flatEarthDistanceKm(endpoint.latitudeDeg, endpoint.longitudeDeg, loc.latitudeDeg,
                                       loc.longitudeDeg);
        EXPECT_LE(d, radius);
        EXPECT_DOUBLE_EQ(d, endpoint.distanceKm.value());
    }
}

TEST_F(AssignerTest, AssignedCountNeverDecreasesWithRadius) {
    std::vector<Location> gazetteer = {rjtt, rjaa};
    EndpointTable base;
    for (int i = 0; i < 25; ++i) {
        base.push_back(makeEndpoint("F" + std::to_string(i), 35.5 + 0.02 * i, 139.6 + 0.04 * i));
    }

    size_t previous = 0;
    for (double radius : {0.0, 1.0, 5.0, 10.0, 20.0, 50.0, 100.0}) {
        EndpointTable endpoints = base;
        assign(endpoints, gazetteer, radius);
        size_t count = countAssigned(endpoints);
        EXPECT_GE(count, previous) << "radius " << radius;
        previous = count;
    }
    EXPECT_EQ(base.size(), previous);
}

TEST_F(AssignerTest, EmptyInputsAreNotErrors) {
    EndpointTable empty;
    EXPECT_EQ(0u, assign(empty, {rjtt}, 10.0));

    EndpointTable endpoints = {makeEndpoint("JAL001", 35.70, 139.77)};
    EXPECT_EQ(0u, assign(endpoints, {}, 10.0));
    EXPECT_FALSE(endpoints[0].isAssigned());
}

TEST_F(AssignerTest, ZeroRadiusMatchesOnlyExactPosition) {
    EndpointTable endpoints = {
        makeEndpoint("EXACT", 35.675, 139.76667),
        makeEndpoint("NEAR", 35.676, 139.76667),
    };

    EXPECT_EQ(1u, assign(endpoints, {rjtt}, 0.0));
    EXPECT_TRUE(endpoints[0].isAssigned());
    EXPECT_FALSE(endpoints[1].isAssigned());
}

TEST_F(AssignerTest, RejectsInvalidRadius) {
    EndpointTable endpoints = {makeEndpoint("JAL001", 35.70, 139.77)};

    EXPECT_THROW(assign(endpoints, {rjtt}, -1.0), std::invalid_argument);
    EXPECT_THROW(assign(endpoints, {rjtt}, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_FALSE(endpoints[0].isAssigned());
}
