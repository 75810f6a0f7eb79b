/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Example showing the step-by-step entry/exit guessing API.
 *
 * Runs the stages one at a time (reduce, classify, assign, assemble) instead
 * of going through EndpointGuesser, and prints what each stage produced.
 *
 * Compilation:
 *   g++ -std=c++17 -I../src/libtrkguess guess_example.cpp -L../build -ltrkguess -o guess_example
 *
 * Usage:
 *   ./guess_example <airport_file> <trk_csv_file> [radius_km]
 */

#include "EndpointClassifier.hpp"
#include "Gazetteer.hpp"
#include "NearestLocationAssigner.hpp"
#include "ResultAssembler.hpp"
#include "TrackReader.hpp"
#include "TrajectoryReducer.hpp"

#include <iomanip>
#include <iostream>
#include <string>

using namespace trk_guess;

void printTable(const char *title, const EndpointTable &table)
{
    std::cout << title << " (" << table.size() << ")\n";
    for (const auto &endpoint : table) {
        std::cout << "  " << std::left << std::setw(10) << endpoint.key.callsign << std::right << std::setw(7)
                  << endpoint.altitudeFt << " ft  ";
        if (endpoint.isAssigned()) {
            std::cout << endpoint.assignedLocation.value() << " @ " << std::fixed << std::setprecision(2)
                      << endpoint.distanceKm.value() << " km";
            std::cout.unsetf(std::ios::floatfield);
        } else {
            std::cout << "-";
        }
        std::cout << "\n";
    }
}

int main(int argc, char *argv[])
{
    if (argc != 3 && argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <airport_file> <trk_csv_file> [radius_km]\n";
        return 1;
    }

    try {
        double radiusKm = (argc == 4) ? std::stod(argv[3]) : DEFAULT_RADIUS_KM;

        auto airports = Gazetteer::loadFile(argv[1], LocationKind::Airport);
        auto samples = readTrackFile(argv[2], DateMode::WithoutDate);
        std::cout << "Loaded " << airports.size() << " airports and " << samples.size() << " samples\n\n";

        auto reduced = reduce(samples);
        auto classified = classify(reduced);

        assign(classified.departed, airports.locations(), radiusKm);
        assign(classified.landed, airports.locations(), radiusKm);

        printTable("Departed", classified.departed);
        printTable("Landed", classified.landed);
        std::cout << "Airborne at both ends: " << classified.airborneFirst.size() << "\n\n";

        auto results = assemble(classified.departed, classified.landed);
        writeResultsCsv(std::cout, results, DateMode::WithoutDate, false);

    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
