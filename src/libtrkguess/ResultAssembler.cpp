/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <iomanip>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "GuessConstants.hpp"
#include "ResultAssembler.hpp"

namespace trk_guess {

namespace {

std::string csvField(const std::string &value)
{
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted{"\""};
    for (char ch : value) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

void writeOptionalName(std::ostream &outStream, const std::optional<std::string> &name)
{
    outStream << ",";
    if (name.has_value()) {
        outStream << csvField(name.value());
    }
}

void writeOptionalDistance(std::ostream &outStream, const std::optional<double> &distance)
{
    outStream << ",";
    if (distance.has_value()) {
        auto previousPrecision = outStream.precision();
        auto previousFlags = outStream.flags();
        outStream << std::fixed << std::setprecision(CSV_DISTANCE_PRECISION) << distance.value();
        outStream.precision(previousPrecision);
        outStream.flags(previousFlags);
    }
}

void writeResultColumns(std::ostream &outStream, const AssignmentResult *result)
{
    if (!result) {
        outStream << ",,,,";
        return;
    }
    writeOptionalName(outStream, result->entryPoint);
    writeOptionalDistance(outStream, result->entryDistanceKm);
    writeOptionalName(outStream, result->exitPoint);
    writeOptionalDistance(outStream, result->exitDistanceKm);
}

constexpr const char *kResultHeader = "EntryPoint,Distance_to_EntryPoint,ExitPoint,Distance_to_ExitPoint";

} // namespace

std::vector<AssignmentResult> assemble(const EndpointTable &departed, const EndpointTable &landed)
{
    std::map<FlightKey, AssignmentResult> joined;

    for (const auto &endpoint : departed) {
        auto &result = joined[endpoint.key];
        result.key = endpoint.key;
        result.entryPoint = endpoint.assignedLocation;
        result.entryDistanceKm = endpoint.distanceKm;
    }
    for (const auto &endpoint : landed) {
        auto &result = joined[endpoint.key];
        result.key = endpoint.key;
        result.exitPoint = endpoint.assignedLocation;
        result.exitDistanceKm = endpoint.distanceKm;
    }

    std::vector<AssignmentResult> results;
    results.reserve(joined.size());
    for (auto &entry : joined) {
        results.push_back(std::move(entry.second));
    }
    return results;
}

void writeResultsCsv(std::ostream &outStream, const std::vector<AssignmentResult> &results, DateMode mode,
                     bool includeDate)
{
    bool writeDate = includeDate && mode == DateMode::WithDate;

    outStream << (writeDate ? "date," : "") << "Callsign," << kResultHeader << "\n";
    for (const auto &result : results) {
        if (writeDate) {
            outStream << csvField(result.key.date) << ",";
        }
        outStream << csvField(result.key.callsign);
        writeResultColumns(outStream, &result);
        outStream << "\n";
    }
}

void writeAnnotatedTracksCsv(std::ostream &outStream, const TrackBatch &batch,
                             const std::vector<AssignmentResult> &results, bool includeDate)
{
    bool writeDate = includeDate && batch.hasDate();

    std::map<FlightKey, const AssignmentResult *> byKey;
    for (const auto &result : results) {
        byKey.emplace(result.key, &result);
    }

    auto previousPrecision = outStream.precision();
    outStream << std::setprecision(CSV_COORDINATE_PRECISION);

    outStream << "time,Callsign,Latitude,Longitude,Altitude,Type," << (writeDate ? "date," : "") << kResultHeader
              << "\n";
    for (const auto &sample : batch.samples()) {
        outStream << csvField(sample.time) << "," << csvField(sample.key.callsign) << "," << sample.latitudeDeg
                  << "," << sample.longitudeDeg << "," << sample.altitudeFt << "," << csvField(sample.category);
        if (writeDate) {
            outStream << "," << csvField(sample.key.date);
        }

        auto it = byKey.find(sample.key);
        writeResultColumns(outStream, (it != byKey.end()) ? it->second : nullptr);
        outStream << "\n";
    }

    outStream.precision(previousPrecision);
}

} // namespace trk_guess
