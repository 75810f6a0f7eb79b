/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "GuessConstants.hpp"
#include "NearestLocationAssigner.hpp"

namespace trk_guess {

double flatEarthDistanceKm(double lat1, double lon1, double lat2, double lon2)
{
    double dLat = lat1 - lat2;
    double dLon = lon1 - lon2;
    return std::sqrt(dLat * dLat + dLon * dLon) * KM_PER_DEGREE;
}

size_t assign(EndpointTable &endpoints, const std::vector<Location> &locations, double radiusKm)
{
    if (std::isnan(radiusKm) || radiusKm < 0.0) {
        std::stringstream msg;
        msg << "invalid assignment radius: " << radiusKm << " km";
        throw std::invalid_argument{msg.str()};
    }

    std::vector<Endpoint *> unassigned;
    unassigned.reserve(endpoints.size());
    for (auto &endpoint : endpoints) {
        if (!endpoint.isAssigned()) {
            unassigned.push_back(&endpoint);
        }
    }

    size_t assigned = 0;
    for (const auto &location : locations) {
        if (unassigned.empty()) {
            break;
        }

        std::vector<Endpoint *> remaining;
        remaining.reserve(unassigned.size());
        for (auto *endpoint : unassigned) {
            double d = flatEarthDistanceKm(endpoint->latitudeDeg, endpoint->longitudeDeg, location.latitudeDeg,
                                           location.longitudeDeg);
            if (d <= radiusKm) {
                endpoint->assignedLocation = location.name;
                endpoint->distanceKm = d;
                ++assigned;
            } else {
                remaining.push_back(endpoint);
            }
        }
        unassigned.swap(remaining);
    }

    return assigned;
}

} // namespace trk_guess
