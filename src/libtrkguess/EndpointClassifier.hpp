/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Split reduced endpoints into ground-level and airborne candidates.
 */

#pragma once

#include "GuessConstants.hpp"
#include "Track.hpp"
#include "TrajectoryReducer.hpp"

namespace trk_guess {

struct ClassifiedEndpoints {
    EndpointTable departed;      // first samples at or below the threshold
    EndpointTable landed;        // last samples at or below the threshold
    EndpointTable airborneFirst; // first samples of flights in neither table above
    EndpointTable airborneLast;  // last samples of the same flights
};

/**
 * @brief Classify first/last samples by altitude.
 *
 * A flight whose first sample is low is a departure; a flight whose last
 * sample is low is an arrival. Flights that are neither were airborne at both
 * ends of the observation window and are left for fix-based assignment.
 * Every returned endpoint is unassigned.
 */
[[nodiscard]] ClassifiedEndpoints classify(const ReducedTracks &reduced,
                                           int altitudeThresholdFt = DEFAULT_ALTITUDE_THRESHOLD_FT);

/// Build an unassigned endpoint from a sample.
[[nodiscard]] Endpoint makeEndpoint(const PositionSample &sample, Boundary boundary);

} // namespace trk_guess
