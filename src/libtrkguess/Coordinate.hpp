/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Conversion of fixed-width degree/minute/second strings to decimal degrees.
 */

#pragma once

#include <string>

#include "GuessConstants.hpp"

namespace trk_guess {

/**
 * @brief Convert a fixed-width DMS string to decimal degrees.
 *
 * The text holds degrees (2 or 3 digits), minutes (2 digits) and seconds
 * (2 digits) with no separators:
 *   "354030"  -> 35 deg 40' 30"  -> 35.675
 *   "1394600" -> 139 deg 46' 00" -> 139.76667
 *
 * The result is rounded to 5 decimal places. Characters after the fixed
 * width are ignored.
 *
 * @param text DMS string
 * @param degreeDigits 2 for latitudes, 3 for longitudes
 * @throws ParseError if the text is too short or a field is not numeric
 * @throws std::invalid_argument if degreeDigits is not 2 or 3
 */
[[nodiscard]] double parseDms(const std::string &text, int degreeDigits);

[[nodiscard]] inline double parseDmsLatitude(const std::string &text)
{
    return parseDms(text, LATITUDE_DEGREE_DIGITS);
}

[[nodiscard]] inline double parseDmsLongitude(const std::string &text)
{
    return parseDms(text, LONGITUDE_DEGREE_DIGITS);
}

} // namespace trk_guess
