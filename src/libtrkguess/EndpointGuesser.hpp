/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Runs the full entry/exit guessing pipeline over a track batch.
 *
 * samples -> reduce -> classify -> assign airports to departed/landed
 *         -> (optional) assign fixes to flights airborne at both ends
 *         -> assemble one result row per flight
 */

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "Gazetteer.hpp"
#include "GuessConstants.hpp"
#include "ResultAssembler.hpp"
#include "Track.hpp"

namespace trk_guess {

struct GuessOptions {
    int altitudeThresholdFt{DEFAULT_ALTITUDE_THRESHOLD_FT};
    double radiusKm{DEFAULT_RADIUS_KM};

    // Airport priority order. Unset means gazetteer order.
    std::optional<std::vector<std::string>> targetLocations;

    // Run the fix phase. Has no effect unless a fix gazetteer was supplied.
    bool includeFixes{false};
};

struct GuessReport {
    DateMode mode{DateMode::WithoutDate};

    // Entry and exit endpoints after both phases; fix-assigned flights are
    // appended after the airport candidates.
    EndpointTable departed;
    EndpointTable landed;

    std::vector<AssignmentResult> results;

    size_t flightCount{0};
    size_t airborneFlightCount{0};
    size_t airportAssignments{0};
    size_t fixAssignments{0};

    void dump(std::ostream &outStream) const;
};

class EndpointGuesser
{
  public:
    EndpointGuesser() = delete;

    /**
     * @throws std::invalid_argument if options.radiusKm is negative or NaN
     */
    explicit EndpointGuesser(Gazetteer airports, GuessOptions options = {});
    EndpointGuesser(Gazetteer airports, Gazetteer fixes, GuessOptions options = {});
    virtual ~EndpointGuesser() = default;

    EndpointGuesser(const EndpointGuesser &) = delete;
    EndpointGuesser &operator=(const EndpointGuesser &) = delete;
    EndpointGuesser(EndpointGuesser &&) = default;
    EndpointGuesser &operator=(EndpointGuesser &&) = default;

    /**
     * @brief Guess entry and exit points for every flight in the batch.
     *
     * The batch is not modified and no state is kept between runs. An empty
     * batch or gazetteer yields empty or unassigned results, never an error.
     */
    [[nodiscard]] GuessReport run(const TrackBatch &batch) const;

    [[nodiscard]] const GuessOptions &options() const { return m_options; }
    [[nodiscard]] const Gazetteer &airports() const { return m_airports; }
    [[nodiscard]] const std::optional<Gazetteer> &fixes() const { return m_fixes; }
    [[nodiscard]] bool fixPhaseEnabled() const { return m_options.includeFixes && m_fixes.has_value(); }

    /// Airports in the order they claim endpoints.
    [[nodiscard]] const std::vector<Location> &airportPriority() const { return m_airportPriority; }

  private:
    void validateOptions() const;

    Gazetteer m_airports;
    std::optional<Gazetteer> m_fixes;
    GuessOptions m_options;
    std::vector<Location> m_airportPriority;
};

} // namespace trk_guess
