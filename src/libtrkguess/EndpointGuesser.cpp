/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "EndpointClassifier.hpp"
#include "EndpointGuesser.hpp"
#include "NearestLocationAssigner.hpp"
#include "TrajectoryReducer.hpp"

namespace trk_guess {

EndpointGuesser::EndpointGuesser(Gazetteer airports, GuessOptions options)
    : m_airports(std::move(airports)), m_options(std::move(options))
{
    validateOptions();
    m_airportPriority = m_airports.prioritized(m_options.targetLocations);
}

EndpointGuesser::EndpointGuesser(Gazetteer airports, Gazetteer fixes, GuessOptions options)
    : m_airports(std::move(airports)), m_fixes(std::move(fixes)), m_options(std::move(options))
{
    validateOptions();
    m_airportPriority = m_airports.prioritized(m_options.targetLocations);
}

void EndpointGuesser::validateOptions() const
{
    if (std::isnan(m_options.radiusKm) || m_options.radiusKm < 0.0) {
        std::stringstream msg;
        msg << "radius must be a non-negative number of km, got " << m_options.radiusKm;
        throw std::invalid_argument{msg.str()};
    }
}

GuessReport EndpointGuesser::run(const TrackBatch &batch) const
{
    GuessReport report;
    report.mode = batch.mode();

    if (batch.empty()) {
        std::cerr << "Warning: no track samples to process\n";
        return report;
    }
    if (m_airportPriority.empty()) {
        std::cerr << "Warning: no airports to assign from\n";
    }

    auto reduced = reduce(batch.samples());
    auto classified = classify(reduced, m_options.altitudeThresholdFt);
    report.flightCount = reduced.first.size();
    report.airborneFlightCount = classified.airborneFirst.size();

    report.airportAssignments += assign(classified.departed, m_airportPriority, m_options.radiusKm);
    report.airportAssignments += assign(classified.landed, m_airportPriority, m_options.radiusKm);

    if (fixPhaseEnabled()) {
        const auto &fixes = m_fixes->locations();
        report.fixAssignments += assign(classified.airborneFirst, fixes, m_options.radiusKm);
        report.fixAssignments += assign(classified.airborneLast, fixes, m_options.radiusKm);

        classified.departed.insert(classified.departed.end(), classified.airborneFirst.begin(),
                                   classified.airborneFirst.end());
        classified.landed.insert(classified.landed.end(), classified.airborneLast.begin(),
                                 classified.airborneLast.end());
    }

    report.results = assemble(classified.departed, classified.landed);
    report.departed = std::move(classified.departed);
    report.landed = std::move(classified.landed);
    return report;
}

void GuessReport::dump(std::ostream &outStream) const
{
    outStream << "Guess Report:"
              << "\n    flights: " << flightCount << "\n    departed: " << departed.size()
              << "\n    landed: " << landed.size() << "\n    airborne at both ends: " << airborneFlightCount
              << "\n    airport assignments: " << airportAssignments << "\n    fix assignments: " << fixAssignments
              << "\n    result rows: " << results.size() << "\n";
}

} // namespace trk_guess
