/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Annotate radar track files with guessed entry and exit points.
 *
 * Reads one or more track CSV files and an airport gazetteer (plus an
 * optional fix gazetteer), guesses where each flight entered and left the
 * tracked airspace, and writes either one summary row per flight or every
 * track row with the guess appended.
 */

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "CommandLineParser.hpp"
#include "libtrkguess/EndpointGuesser.hpp"
#include "libtrkguess/Gazetteer.hpp"
#include "libtrkguess/GuessConstants.hpp"
#include "libtrkguess/ResultAssembler.hpp"
#include "libtrkguess/TrackReader.hpp"

using namespace trk_guess;

constexpr int EXIT_NO_INPUT = 2;
static bool g_verbose = false;

std::filesystem::path expandUser(const std::string &path)
{
    if (path.rfind("~", 0) == 0) {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return std::filesystem::path(path);
}

std::vector<std::filesystem::path> collectTrackPaths(const std::vector<std::string> &inputs,
                                                     const std::vector<std::string> &dates,
                                                     const std::vector<std::string> &sourceTimes,
                                                     const std::string &trkDir)
{
    std::vector<std::filesystem::path> candidates;
    for (const auto &input : inputs) {
        candidates.push_back(expandUser(input));
    }
    if (!dates.empty() && !sourceTimes.empty() && !trkDir.empty()) {
        auto generated = trackPathsForDates(expandUser(trkDir), dates, sourceTimes);
        candidates.insert(candidates.end(), generated.begin(), generated.end());
    }

    std::vector<std::filesystem::path> paths;
    for (const auto &path : candidates) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            std::cerr << "Warning: no such track file " << path.string() << " (skipped)\n";
            continue;
        }
        paths.push_back(path);
    }
    return paths;
}

bool parseRadius(const std::string &text, double &radiusKm)
{
    try {
        size_t idx = 0;
        radiusKm = std::stod(text, &idx);
        if (idx != text.size()) {
            std::cerr << "Error: Invalid radius format (contains non-numeric characters): " << text << std::endl;
            return false;
        }
    } catch (const std::invalid_argument &) {
        std::cerr << "Error: Radius must be a number: " << text << std::endl;
        return false;
    } catch (const std::out_of_range &) {
        std::cerr << "Error: Radius out of range: " << text << std::endl;
        return false;
    }
    if (std::isnan(radiusKm) || radiusKm < 0.0) {
        std::cerr << "Error: Radius must be non-negative" << std::endl;
        return false;
    }
    return true;
}

bool parseAltitude(const std::string &text, int &altitudeFt)
{
    try {
        size_t idx = 0;
        altitudeFt = std::stoi(text, &idx);
        if (idx != text.size()) {
            std::cerr << "Error: Invalid altitude format (contains non-numeric characters): " << text << std::endl;
            return false;
        }
    } catch (const std::invalid_argument &) {
        std::cerr << "Error: Altitude must be a valid integer: " << text << std::endl;
        return false;
    } catch (const std::out_of_range &) {
        std::cerr << "Error: Altitude out of range: " << text << std::endl;
        return false;
    }
    return true;
}

void showHelp(const char *progName)
{
    std::cout << "Usage: " << progName << " [options] -a <airportfile> -o <outfile> [trkfile...]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "    -h, --help                    print this help" << std::endl;
    std::cout << "    -i, --input <files>           comma-separated track CSV files (repeatable)" << std::endl;
    std::cout << "    -d, --dates <list>            dates like 20190816,20190817 (with -s and --trk-dir)"
              << std::endl;
    std::cout << "    -s, --source-times <list>     source times like 00_12,12_18" << std::endl;
    std::cout << "        --trk-dir <dir>           directory holding trkYYYYMMDD_source.csv files" << std::endl;
    std::cout << "    -a, --airport-file <file>     airport gazetteer (required)" << std::endl;
    std::cout << "        --fixes-file <file>       fix gazetteer; enables fix assignment" << std::endl;
    std::cout << "        --target-airports <list>  airports to try, in priority order" << std::endl;
    std::cout << "    -r, --radius <km>             assignment radius (default " << DEFAULT_RADIUS_KM << ")"
              << std::endl;
    std::cout << "    -t, --altitude <ft>           ground-level threshold (default "
              << DEFAULT_ALTITUDE_THRESHOLD_FT << ")" << std::endl;
    std::cout << "    -o, --output <file>           output CSV (required)" << std::endl;
    std::cout << "        --include-trks            write every track row with the guess appended" << std::endl;
    std::cout << "        --include-date            add the date column (date taken from trk file names)"
              << std::endl;
    std::cout << "    -v, --verbose                 verbose output" << std::endl;
}

int main(int argc, char *argv[])
{
    CommandLineParser parser;
    parser.addOption('h', "help", false);
    parser.addOption('i', "input", true);
    parser.addOption('d', "dates", true);
    parser.addOption('s', "source-times", true);
    parser.addOption(0, "trk-dir", true);
    parser.addOption('a', "airport-file", true);
    parser.addOption(0, "fixes-file", true);
    parser.addOption(0, "target-airports", true);
    parser.addOption('r', "radius", true);
    parser.addOption('t', "altitude", true);
    parser.addOption('o', "output", true);
    parser.addOption(0, "include-trks", false);
    parser.addOption(0, "include-date", false);
    parser.addOption('v', "verbose", false);

    if (!parser.parse(argc, argv)) {
        showHelp(argv[0]);
        return 1;
    }

    if (parser.hasFlag("help")) {
        showHelp(argv[0]);
        return 0;
    }

    g_verbose = parser.hasFlag("verbose");

    if (!parser.hasOption("airport-file")) {
        std::cerr << "Error: --airport-file or -a is required.\n";
        return 1;
    }
    if (!parser.hasOption("output")) {
        std::cerr << "Error: --output or -o is required.\n";
        return 1;
    }

    GuessOptions options;
    if (parser.hasOption("radius") && !parseRadius(parser.getOption("radius"), options.radiusKm)) {
        return 1;
    }
    if (parser.hasOption("altitude") && !parseAltitude(parser.getOption("altitude"), options.altitudeThresholdFt)) {
        return 1;
    }
    if (parser.hasOption("target-airports")) {
        options.targetLocations = commaListOrNone(parser.getOption("target-airports"));
    }
    options.includeFixes = parser.hasOption("fixes-file");

    bool includeTrks = parser.hasFlag("include-trks");
    bool includeDate = parser.hasFlag("include-date");

    std::vector<std::string> inputs = parser.positionals();
    for (const auto &value : parser.getOptionValues("input")) {
        auto items = splitCommaList(value);
        inputs.insert(inputs.end(), items.begin(), items.end());
    }
    auto dates = splitCommaList(parser.getOption("dates"));
    auto sourceTimes = splitCommaList(parser.getOption("source-times"));

    auto paths = collectTrackPaths(inputs, dates, sourceTimes, parser.getOption("trk-dir"));
    if (g_verbose) {
        std::cout << "Collected " << paths.size() << " trk files" << std::endl;
    }
    if (paths.empty()) {
        std::cerr << "No trk input provided. Use --input or (--dates and --source-times and --trk-dir).\n";
        return EXIT_NO_INPUT;
    }

    try {
        auto airports = Gazetteer::loadFile(expandUser(parser.getOption("airport-file")), LocationKind::Airport);
        std::optional<Gazetteer> fixes;
        if (options.includeFixes) {
            fixes = Gazetteer::loadFile(expandUser(parser.getOption("fixes-file")), LocationKind::Fix);
        }
        if (g_verbose) {
            std::cout << "Loaded " << airports.size() << " airports";
            if (fixes.has_value()) {
                std::cout << " and " << fixes->size() << " fixes";
            }
            std::cout << std::endl;
        }

        TrackBatch batch(includeDate ? DateMode::WithDate : DateMode::WithoutDate);
        for (const auto &path : paths) {
            batch.append(readTrackFile(path, batch.mode()));
        }
        if (g_verbose) {
            std::cout << "Read " << batch.size() << " track samples" << std::endl;
        }

        EndpointGuesser guesser = fixes.has_value() ? EndpointGuesser(std::move(airports), std::move(*fixes), options)
                                                    : EndpointGuesser(std::move(airports), options);
        auto report = guesser.run(batch);
        if (g_verbose) {
            report.dump(std::cout);
        }

        auto outputPath = expandUser(parser.getOption("output"));
        std::ofstream outFileStream(outputPath, std::ios::out | std::ios::trunc);
        if (!outFileStream.is_open()) {
            std::cerr << "Error: Couldn't open output file " << outputPath.string() << "\n";
            return 1;
        }

        if (includeTrks) {
            writeAnnotatedTracksCsv(outFileStream, batch, report.results, includeDate);
        } else {
            writeResultsCsv(outFileStream, report.results, batch.mode(), includeDate);
        }

        if (!outFileStream) {
            std::cerr << "Error: Failed writing " << outputPath.string() << "\n";
            return 1;
        }
        if (g_verbose) {
            std::cout << "Wrote " << outputPath.string() << std::endl;
        }
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
