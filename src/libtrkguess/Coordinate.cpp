/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Coordinate.hpp"
#include "GuessConstants.hpp"
#include "ParseError.hpp"

namespace trk_guess {

namespace {

int parseDigits(const std::string &text, size_t offset, size_t count)
{
    int value = 0;
    for (size_t i = offset; i < offset + count; ++i) {
        unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            std::stringstream msg;
            msg << "non-numeric character '" << text[i] << "' in coordinate \"" << text << "\"";
            throw ParseError{msg.str()};
        }
        value = value * 10 + (ch - '0');
    }
    return value;
}

} // namespace

double parseDms(const std::string &text, int degreeDigits)
{
    if (degreeDigits != LATITUDE_DEGREE_DIGITS && degreeDigits != LONGITUDE_DEGREE_DIGITS) {
        std::stringstream msg;
        msg << "unsupported degree width " << degreeDigits << " (expected 2 or 3)";
        throw std::invalid_argument{msg.str()};
    }

    const size_t degWidth = static_cast<size_t>(degreeDigits);
    const size_t width = degWidth + DMS_MINUTES_DIGITS + DMS_SECONDS_DIGITS;
    if (text.size() < width) {
        std::stringstream msg;
        msg << "coordinate \"" << text << "\" is shorter than " << width << " characters";
        throw ParseError{msg.str()};
    }

    int degrees = parseDigits(text, 0, degWidth);
    int minutes = parseDigits(text, degWidth, DMS_MINUTES_DIGITS);
    int seconds = parseDigits(text, degWidth + DMS_MINUTES_DIGITS, DMS_SECONDS_DIGITS);

    double decimal = degrees + minutes / MINUTES_PER_DEGREE + seconds / SECONDS_PER_DEGREE;
    return std::round(decimal * DMS_ROUNDING_SCALE) / DMS_ROUNDING_SCALE;
}

} // namespace trk_guess
