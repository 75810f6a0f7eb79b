/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief A named point an endpoint can be assigned to.
 */

#pragma once

#include <iomanip>
#include <ostream>
#include <string>

#include "GuessConstants.hpp"

namespace trk_guess {

enum class LocationKind { Airport, Fix };

inline const char *toString(LocationKind kind) { return (kind == LocationKind::Airport) ? "airport" : "fix"; }

struct Location {
    std::string name;
    double latitudeDeg{0.0};
    double longitudeDeg{0.0};
    LocationKind kind{LocationKind::Airport};
};

inline std::ostream &operator<<(std::ostream &outStream, const Location &loc)
{
    auto previousFlags = outStream.flags();
    auto previousPrecision = outStream.precision();

    outStream << loc.name << " (" << toString(loc.kind) << ") " << std::fixed
              << std::setprecision(LOCATION_DISPLAY_PRECISION) << loc.latitudeDeg << ", " << loc.longitudeDeg;

    outStream.flags(previousFlags);
    outStream.precision(previousPrecision);
    return outStream;
}

} // namespace trk_guess
