/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Reduction of per-flight position streams to their first and last samples.
 */

#pragma once

#include <vector>

#include "Track.hpp"

namespace trk_guess {

struct ReducedTracks {
    std::vector<PositionSample> first; // earliest sample per flight, ordered by FlightKey
    std::vector<PositionSample> last;  // latest sample per flight, ordered by FlightKey
};

/**
 * @brief Keep the earliest and latest sample of every flight.
 *
 * Samples are grouped by FlightKey. Equal timestamps resolve by input order:
 * the earlier-read sample is "first", the later-read sample is "last".
 * Empty input yields two empty tables.
 */
[[nodiscard]] ReducedTracks reduce(const std::vector<PositionSample> &samples);

} // namespace trk_guess
