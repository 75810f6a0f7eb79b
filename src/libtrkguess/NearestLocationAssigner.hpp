/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Greedy, priority-ordered assignment of endpoints to named locations.
 *
 * Locations are visited in the order given. Each one claims every still
 * unassigned endpoint within the radius. An endpoint, once claimed, is never
 * reconsidered, so an earlier location that is barely within range wins over
 * a later, closer one. Callers put high-traffic locations first.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "Location.hpp"
#include "Track.hpp"

namespace trk_guess {

/**
 * @brief Planar distance in km: sqrt(dlat^2 + dlon^2) * 111.32.
 *
 * Not a geodesic. Only meaningful at short range.
 */
[[nodiscard]] double flatEarthDistanceKm(double lat1, double lon1, double lat2, double lon2);

/**
 * @brief Assign endpoints to the first location within radiusKm.
 *
 * Only rows with no assignment are considered; assigned rows are never
 * touched. Rows that match nothing stay unassigned.
 *
 * @param endpoints table updated in place
 * @param locations candidates in priority order
 * @param radiusKm inclusive match radius
 * @return number of endpoints assigned by this call
 * @throws std::invalid_argument if radiusKm is negative or NaN
 */
size_t assign(EndpointTable &endpoints, const std::vector<Location> &locations, double radiusKm);

} // namespace trk_guess
