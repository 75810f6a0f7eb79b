/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Reading radar track CSV files into position samples.
 *
 * Each data row is:
 *   time,Callsign,Latitude,Longitude,Altitude,Type
 *
 * e.g. 00:00:05,JAL001,35.5512,139.7801,1200,B738
 *
 * A first line whose Altitude field isn't an integer is taken as a header.
 */

#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "Track.hpp"

namespace trk_guess {

/**
 * @brief Convert a time field to seconds.
 *
 * Accepts HH:MM:SS, HH:MM:SS.fff, MM:SS or a plain number of seconds.
 *
 * @throws ParseError if the text isn't one of those forms
 */
[[nodiscard]] double parseTimestamp(const std::string &text);

/**
 * @brief Parse track rows from a stream.
 *
 * @param stream CSV source
 * @param date date stamped on every sample's FlightKey (may be empty)
 * @throws ParseError naming the line of the first malformed row
 */
[[nodiscard]] std::vector<PositionSample> readTracks(std::istream &stream, const std::string &date = "");

/**
 * @brief Open and parse a track file.
 *
 * In WithDate mode the date comes from the file name (trkYYYYMMDD_*.csv).
 *
 * @throws std::runtime_error if the file can't be opened
 * @throws ParseError on malformed rows, or when a date is required and the
 *         file name doesn't carry one
 */
[[nodiscard]] std::vector<PositionSample> readTrackFile(const std::filesystem::path &path, DateMode mode);

/// Extract YYYYMMDD from a name like trk20190816_00_12.csv. Throws ParseError.
[[nodiscard]] std::string dateFromTrackFileName(const std::filesystem::path &path);

/// Paths dir/trk{date}_{sourceTime}.csv for every date and source time.
[[nodiscard]] std::vector<std::filesystem::path> trackPathsForDates(const std::filesystem::path &dir,
                                                                    const std::vector<std::string> &dates,
                                                                    const std::vector<std::string> &sourceTimes);

} // namespace trk_guess
