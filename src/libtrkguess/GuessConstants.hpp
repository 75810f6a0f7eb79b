/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Constants used by the endpoint guessing engine.
 *
 * Defaults for the configuration surface, plus the fixed-width layout of the
 * degree/minute/second coordinate strings found in gazetteer files.
 */

#pragma once

#include <cstddef>

namespace trk_guess {

// ============================================================================
// Assignment Defaults
// ============================================================================

/// Endpoints at or below this altitude are treated as departures/arrivals
constexpr int DEFAULT_ALTITUDE_THRESHOLD_FT = 6000;

/// Maximum planar distance at which a location may claim an endpoint
constexpr double DEFAULT_RADIUS_KM = 10.0;

/// Kilometres per degree used by the flat-earth distance approximation.
/// Must stay at this value for parity with earlier outputs.
constexpr double KM_PER_DEGREE = 111.32;

// ============================================================================
// Degree/Minute/Second Layout
// ============================================================================

/// Degree digits in a latitude string (DDMMSS)
constexpr int LATITUDE_DEGREE_DIGITS = 2;

/// Degree digits in a longitude string (DDDMMSS)
constexpr int LONGITUDE_DEGREE_DIGITS = 3;

/// Width of the minutes and seconds fields
constexpr int DMS_MINUTES_DIGITS = 2;
constexpr int DMS_SECONDS_DIGITS = 2;

constexpr double MINUTES_PER_DEGREE = 60.0;
constexpr double SECONDS_PER_DEGREE = 3600.0;

/// Converted degrees are rounded to 5 decimal places (~1.1 m)
constexpr double DMS_ROUNDING_SCALE = 100000.0;
constexpr int LOCATION_DISPLAY_PRECISION = 5;

// ============================================================================
// Gazetteer Row Layout
// ============================================================================

/// Rows with this many fields carry no dummy column: name lat lon
constexpr size_t GAZETTEER_SHORT_ROW_FIELDS = 3;

/// Rows with at least this many fields carry a dummy column: name dummy lat lon
constexpr size_t GAZETTEER_LONG_ROW_FIELDS = 4;

// ============================================================================
// Track CSV Layout
// ============================================================================

/// time,Callsign,Latitude,Longitude,Altitude,Type
constexpr size_t TRACK_FIELD_COUNT = 6;

constexpr int SECONDS_PER_MINUTE = 60;
constexpr int SECONDS_PER_HOUR = 3600;

/// Length of the YYYYMMDD date embedded in track file names
constexpr size_t TRACK_FILE_DATE_LENGTH = 8;

// ============================================================================
// CSV Output
// ============================================================================

/// Decimal places written for Distance_to_* columns
constexpr int CSV_DISTANCE_PRECISION = 5;

/// Significant digits written for coordinates on annotated track rows
constexpr int CSV_COORDINATE_PRECISION = 10;

} // namespace trk_guess
