/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Per-flight entry/exit results and their CSV rendering.
 *
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "Track.hpp"

namespace trk_guess {

struct AssignmentResult {
    FlightKey key;
    std::optional<std::string> entryPoint;
    std::optional<double> entryDistanceKm;
    std::optional<std::string> exitPoint;
    std::optional<double> exitDistanceKm;
};

/**
 * @brief Full outer join of entry and exit endpoints on FlightKey.
 *
 * Every flight present in either table appears exactly once, ordered by key.
 * The side a flight is missing from is left unset.
 */
[[nodiscard]] std::vector<AssignmentResult> assemble(const EndpointTable &departed, const EndpointTable &landed);

/**
 * @brief Write one row per flight.
 *
 * Columns: [date,]Callsign,EntryPoint,Distance_to_EntryPoint,ExitPoint,Distance_to_ExitPoint
 * The date column is written only when includeDate is set and the batch
 * carried dates. Unset values are empty cells.
 */
void writeResultsCsv(std::ostream &outStream, const std::vector<AssignmentResult> &results, DateMode mode,
                     bool includeDate);

/**
 * @brief Write every sample of the batch with its flight's result appended.
 *
 * Samples of flights that have no result row get empty result cells.
 */
void writeAnnotatedTracksCsv(std::ostream &outStream, const TrackBatch &batch,
                             const std::vector<AssignmentResult> &results, bool includeDate);

} // namespace trk_guess
