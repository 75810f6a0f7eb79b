/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <set>

#include "EndpointClassifier.hpp"

namespace trk_guess {

Endpoint makeEndpoint(const PositionSample &sample, Boundary boundary)
{
    Endpoint endpoint;
    endpoint.key = sample.key;
    endpoint.boundary = boundary;
    endpoint.latitudeDeg = sample.latitudeDeg;
    endpoint.longitudeDeg = sample.longitudeDeg;
    endpoint.altitudeFt = sample.altitudeFt;
    return endpoint;
}

ClassifiedEndpoints classify(const ReducedTracks &reduced, int altitudeThresholdFt)
{
    ClassifiedEndpoints classified;
    std::set<FlightKey> grounded;

    for (const auto &sample : reduced.first) {
        if (sample.altitudeFt <= altitudeThresholdFt) {
            classified.departed.push_back(makeEndpoint(sample, Boundary::Entry));
            grounded.insert(sample.key);
        }
    }
    for (const auto &sample : reduced.last) {
        if (sample.altitudeFt <= altitudeThresholdFt) {
            classified.landed.push_back(makeEndpoint(sample, Boundary::Exit));
            grounded.insert(sample.key);
        }
    }

    for (const auto &sample : reduced.first) {
        if (grounded.count(sample.key) == 0) {
            classified.airborneFirst.push_back(makeEndpoint(sample, Boundary::Entry));
        }
    }
    for (const auto &sample : reduced.last) {
        if (grounded.count(sample.key) == 0) {
            classified.airborneLast.push_back(makeEndpoint(sample, Boundary::Exit));
        }
    }

    return classified;
}

} // namespace trk_guess
