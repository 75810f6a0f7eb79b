/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * Unit tests for joining entry/exit endpoints and writing results
 */

#include <gtest/gtest.h>
#include <ResultAssembler.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace trk_guess;

namespace {

Endpoint assignedEndpoint(const std::string &callsign, Boundary boundary, const std::string &location, double km,
                          const std::string &date = "") {
    Endpoint endpoint;
    endpoint.key = FlightKey{callsign, date};
    endpoint.boundary = boundary;
    endpoint.assignedLocation = location;
    endpoint.distanceKm = km;
    return endpoint;
}

Endpoint unassignedEndpoint(const std::string &callsign, Boundary boundary) {
    Endpoint endpoint;
    endpoint.key = FlightKey{callsign, ""};
    endpoint.boundary = boundary;
    return endpoint;
}

std::vector<std::string> lines(const std::string &text) {
    std::vector<std::string> result;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        result.push_back(line);
    }
    return result;
}

} // namespace

// ============================================================================
// Outer Join
// ============================================================================

TEST(AssembleTest, MergesBothSidesOfAFlight) {
    EndpointTable departed = {assignedEndpoint("JAL001", Boundary::Entry, "RJTT", 2.5)};
    EndpointTable landed = {assignedEndpoint("JAL001", Boundary::Exit, "RJCC", 4.0)};

    auto results = assemble(departed, landed);

    ASSERT_EQ(1u, results.size());
    EXPECT_EQ("JAL001", results[0].key.callsign);
    EXPECT_EQ("RJTT", results[0].entryPoint.value());
    EXPECT_DOUBLE_EQ(2.5, results[0].entryDistanceKm.value());
    EXPECT_EQ("RJCC", results[0].exitPoint.value());
    EXPECT_DOUBLE_EQ(4.0, results[0].exitDistanceKm.value());
}

TEST(AssembleTest, DepartedOnlyFlightHasNoExit) {
    EndpointTable departed = {assignedEndpoint("JAL001", Boundary::Entry, "RJTT", 2.5)};

    auto results = assemble(departed, {});

    ASSERT_EQ(1u, results.size());
    EXPECT_TRUE(results[0].entryPoint.has_value());
    EXPECT_FALSE(results[0].exitPoint.has_value());
    EXPECT_FALSE(results[0].exitDistanceKm.has_value());
}

TEST(AssembleTest, LandedOnlyFlightHasNoEntry) {
    EndpointTable landed = {assignedEndpoint("ANA100", Boundary::Exit, "RJAA", 1.0)};

    auto results = assemble({}, landed);

    ASSERT_EQ(1u, results.size());
    EXPECT_FALSE(results[0].entryPoint.has_value());
    EXPECT_EQ("RJAA", results[0].exitPoint.value());
}

TEST(AssembleTest, EachFlightAppearsExactlyOnceInKeyOrder) {
    EndpointTable departed = {
        assignedEndpoint("SKY200", Boundary::Entry, "RJFF", 3.0),
        assignedEndpoint("ANA100", Boundary::Entry, "RJTT", 1.0),
    };
    EndpointTable landed = {
        assignedEndpoint("JAL001", Boundary::Exit, "RJCC", 2.0),
        assignedEndpoint("SKY200", Boundary::Exit, "RJTT", 5.0),
    };

    auto results = assemble(departed, landed);

    ASSERT_EQ(3u, results.size());
    EXPECT_EQ("ANA100", results[0].key.callsign);
    EXPECT_EQ("JAL001", results[1].key.callsign);
    EXPECT_EQ("SKY200", results[2].key.callsign);
    EXPECT_EQ("RJFF", results[2].entryPoint.value());
    EXPECT_EQ("RJTT", results[2].exitPoint.value());
}

TEST(AssembleTest, UnassignedEndpointStillProducesRow) {
    EndpointTable departed = {unassignedEndpoint("JAL001", Boundary::Entry)};

    auto results = assemble(departed, {});

    ASSERT_EQ(1u, results.size());
    EXPECT_FALSE(results[0].entryPoint.has_value());
    EXPECT_FALSE(results[0].entryDistanceKm.has_value());
}

TEST(AssembleTest, DatesKeepFlightsApart) {
    EndpointTable departed = {
        assignedEndpoint("JAL001", Boundary::Entry, "RJTT", 1.0, "20190816"),
        assignedEndpoint("JAL001", Boundary::Entry, "RJAA", 1.0, "20190817"),
    };
    EndpointTable landed = {assignedEndpoint("JAL001", Boundary::Exit, "RJCC", 1.0, "20190817")};

    auto results = assemble(departed, landed);

    ASSERT_EQ(2u, results.size());
    EXPECT_EQ("20190816", results[0].key.date);
    EXPECT_FALSE(results[0].exitPoint.has_value());
    EXPECT_EQ("20190817", results[1].key.date);
    EXPECT_EQ("RJCC", results[1].exitPoint.value());
}

TEST(AssembleTest, EmptyTablesGiveNoRows) {
    EXPECT_TRUE(assemble({}, {}).empty());
}

// ============================================================================
// CSV Output
// ============================================================================

class ResultCsvTest : public ::testing::Test {
protected:
    std::vector<AssignmentResult> results;

    void SetUp() override {
        AssignmentResult both;
        both.key = FlightKey{"JAL001", "20190816"};
        both.entryPoint = "RJTT";
        both.entryDistanceKm = 2.5;
        both.exitPoint = "RJCC";
        both.exitDistanceKm = 0.123456;

        AssignmentResult entryOnly;
        entryOnly.key = FlightKey{"SKY200", "20190816"};
        entryOnly.entryPoint = "RJFF";
        entryOnly.entryDistanceKm = 9.0;

        results = {both, entryOnly};
    }
};

TEST_F(ResultCsvTest, WritesHeaderAndOneRowPerFlight) {
    std::ostringstream output;
    writeResultsCsv(output, results, DateMode::WithoutDate, false);

    auto rows = lines(output.str());
    ASSERT_EQ(3u, rows.size());
    EXPECT_EQ("Callsign,EntryPoint,Distance_to_EntryPoint,ExitPoint,Distance_to_ExitPoint", rows[0]);
    EXPECT_EQ("JAL001,RJTT,2.50000,RJCC,0.12346", rows[1]);
    EXPECT_EQ("SKY200,RJFF,9.00000,,", rows[2]);
}

TEST_F(ResultCsvTest, DateColumnWhenRequestedAndAvailable) {
    std::ostringstream output;
    writeResultsCsv(output, results, DateMode::WithDate, true);

    auto rows = lines(output.str());
    ASSERT_EQ(3u, rows.size());
    EXPECT_EQ("date,Callsign,EntryPoint,Distance_to_EntryPoint,ExitPoint,Distance_to_ExitPoint", rows[0]);
    EXPECT_EQ("20190816,JAL001,RJTT,2.50000,RJCC,0.12346", rows[1]);
}

TEST_F(ResultCsvTest, DateColumnOmittedForUndatedBatch) {
    std::ostringstream output;
    writeResultsCsv(output, results, DateMode::WithoutDate, true);

    EXPECT_EQ(0u, output.str().find("Callsign,"));
}

TEST_F(ResultCsvTest, EmptyResultsWriteHeaderOnly) {
    std::ostringstream output;
    writeResultsCsv(output, {}, DateMode::WithoutDate, false);

    EXPECT_EQ(1u, lines(output.str()).size());
}

TEST_F(ResultCsvTest, LeavesStreamFormattingUntouched) {
    std::ostringstream output;
    writeResultsCsv(output, results, DateMode::WithoutDate, false);
    output << 1.0 / 3.0;

    EXPECT_NE(output.str().find("0.333333"), std::string::npos);
    EXPECT_EQ(output.str().find("0.3333333"), std::string::npos);
}

TEST_F(ResultCsvTest, AnnotatesEveryTrackRow) {
    TrackBatch batch(DateMode::WithDate);
    PositionSample first;
    first.key = FlightKey{"JAL001", "20190816"};
    first.time = "00:00:01";
    first.latitudeDeg = 35.7;
    first.longitudeDeg = 139.77;
    first.altitudeFt = 500;
    first.category = "B738";
    PositionSample second = first;
    second.time = "00:00:11";
    second.altitudeFt = 1500;
    PositionSample stranger = first;
    stranger.key.callsign = "OVR001";
    batch.append({first, second, stranger});

    std::ostringstream output;
    writeAnnotatedTracksCsv(output, batch, results, true);

    auto rows = lines(output.str());
    ASSERT_EQ(4u, rows.size());
    EXPECT_EQ("time,Callsign,Latitude,Longitude,Altitude,Type,date,"
              "EntryPoint,Distance_to_EntryPoint,ExitPoint,Distance_to_ExitPoint",
              rows[0]);
    EXPECT_EQ("00:00:01,JAL001,35.7,139.77,500,B738,20190816,RJTT,2.50000,RJCC,0.12346", rows[1]);
    EXPECT_EQ("00:00:11,JAL001,35.7,139.77,1500,B738,20190816,RJTT,2.50000,RJCC,0.12346", rows[2]);
    EXPECT_EQ("00:00:01,OVR001,35.7,139.77,500,B738,20190816,,,,", rows[3]);
}

TEST_F(ResultCsvTest, QuotesFieldsContainingCommas) {
    AssignmentResult odd;
    odd.key = FlightKey{"ODD,1", ""};
    std::ostringstream output;
    writeResultsCsv(output, {odd}, DateMode::WithoutDate, false);

    auto rows = lines(output.str());
    ASSERT_EQ(2u, rows.size());
    EXPECT_EQ("\"ODD,1\",,,,", rows[1]);
}
